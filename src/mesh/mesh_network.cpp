#include "mesh/mesh_network.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace wavemesh {

namespace {

constexpr double BYTES_PER_MB = 1048576.0;

// Link speeds used for transfer estimates, in Mbps
constexpr double BLE_MBPS = 1.0;
constexpr double WIFI_MBPS = 50.0;
constexpr double LORA_MBPS = 0.05;

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MeshNetwork::MeshNetwork(const MeshConfig& config)
  : MeshNetwork(config, std::make_unique<crypto::SecureRandomSource>()) {
}

MeshNetwork::MeshNetwork(const MeshConfig& config, std::unique_ptr<crypto::RandomSource> random)
  : config_(config)
  , random_(std::move(random)) {

  if (!random_) {
    throw std::invalid_argument("Mesh network: random source is required");
  }

  try {
    topology_ = std::make_unique<topology::TopologyGraph>();
    addresses_ = std::make_unique<address::AddressRegistry>(*random_);
    content_ = std::make_unique<store::ContentStore>(config_.chunking);
    caches_ = std::make_unique<cache::CacheDirectory>();
    router_ = std::make_unique<routing::PathRouter>(*topology_, *addresses_);
    engine_ = std::make_unique<propagation::PropagationEngine>(*content_, *caches_, *router_,
                                                               config_.source_selection);
    messages_ = std::make_unique<messaging::MessageRouter>(*router_, *addresses_);
    knowledge_ = std::make_unique<knowledge::KnowledgeCatalog>(*content_, *caches_, *router_);
    BOOST_LOG_TRIVIAL(info) << "Mesh network: Successfully created all components";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Mesh network: Failed to initialize components: " << e.what();
    throw;
  }
}

MeshNetwork::~MeshNetwork() {
  // Dependents go first
  knowledge_.reset();
  messages_.reset();
  engine_.reset();
  router_.reset();
  caches_.reset();
  content_.reset();
  addresses_.reset();
  topology_.reset();
}


//==============================================
// NODES AND LINKS
//==============================================

std::optional<address::NodeAddress> MeshNetwork::add_node(const std::string& node_id, topology::NodeRole role,
                                                          uint64_t cache_capacity_bytes,
                                                          const std::vector<topology::Transport>& transports,
                                                          double uptime_hours) {
  if (node_id.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Mesh network: Refusing node with empty id";
    return std::nullopt;
  }

  topology::Node node;
  node.id = node_id;
  node.role = role;
  node.address = addresses_->create_address(node_id);
  node.transports = transports;
  node.cache_capacity_bytes = cache_capacity_bytes;
  node.uptime_hours = uptime_hours;
  address::NodeAddress node_address = node.address;

  if (topology_->add_node(std::move(node)) != MeshError::SUCCESS) {
    return std::nullopt;
  }

  if (!addresses_->register_address(node_address)) {
    topology_->remove_node(node_id);
    return std::nullopt;
  }

  if (!caches_->create(node_id, cache_capacity_bytes)) {
    BOOST_LOG_TRIVIAL(error) << "Mesh network: Cache already exists for " << node_id << ", rolling back";
    addresses_->unregister(node_id);
    topology_->remove_node(node_id);
    return std::nullopt;
  }
  return node_address;
}

MeshError MeshNetwork::connect(const std::string& a, const std::string& b, topology::Transport transport,
                               double signal_dbm, double latency_ms, double bandwidth_kbps) {
  topology::LinkAttributes attributes;
  attributes.transport = transport;
  attributes.signal_dbm = signal_dbm;
  attributes.latency_ms = latency_ms;
  attributes.bandwidth_kbps = bandwidth_kbps;
  return topology_->connect(a, b, attributes);
}

MeshError MeshNetwork::disconnect(const std::string& a, const std::string& b) {
  return topology_->disconnect(a, b);
}

MeshError MeshNetwork::remove_node(const std::string& node_id) {
  MeshError error = topology_->remove_node(node_id);
  if (error != MeshError::SUCCESS) {
    return error;
  }

  addresses_->unregister(node_id);
  caches_->remove(node_id);
  content_->forget_holder(node_id);

  BOOST_LOG_TRIVIAL(info) << "Mesh network: Node " << node_id << " left the mesh";
  return MeshError::SUCCESS;
}


//==============================================
// CONTENT
//==============================================

store::MediaFilePtr MeshNetwork::register_file(const std::string& filename, uint64_t size,
                                               const store::FileMetadata& metadata,
                                               const std::optional<std::string>& content_identity) {
  return content_->register_file(filename, size, metadata, content_identity);
}

MeshError MeshNetwork::seed(const std::string& file_id, const std::string& node_id) {
  auto media_file = content_->file(file_id);
  if (!media_file) {
    return MeshError::UNKNOWN_FILE;
  }
  auto node_cache = caches_->find(node_id);
  if (!node_cache) {
    return MeshError::UNKNOWN_NODE;
  }

  std::size_t rejected = 0;
  for (const auto& chunk : media_file->chunks) {
    cache::AdmitResult result = node_cache->admit(chunk);
    if (result == cache::AdmitResult::DETACHED) {
      return MeshError::UNKNOWN_NODE;
    }
    if (result == cache::AdmitResult::REJECTED) {
      ++rejected;
    }
  }

  if (rejected > 0) {
    BOOST_LOG_TRIVIAL(warning) << "Mesh network: Seeding " << file_id << " on " << node_id
                               << " left " << rejected << " chunks out";
    return MeshError::CACHE_FULL;
  }

  BOOST_LOG_TRIVIAL(info) << "Mesh network: Seeded " << media_file->filename << " on " << node_id;
  return MeshError::SUCCESS;
}

MeshError MeshNetwork::evict(const std::string& node_id, const std::string& content_hash) {
  auto node_cache = caches_->find(node_id);
  if (!node_cache) {
    return MeshError::UNKNOWN_NODE;
  }
  return node_cache->evict(content_hash) ? MeshError::SUCCESS : MeshError::UNKNOWN_FILE;
}


//==============================================
// ROUTING AND DELIVERY
//==============================================

routing::Path MeshNetwork::route(const address::NodeAddress& a, const address::NodeAddress& b) const {
  return router_->route(a, b);
}

routing::Path MeshNetwork::route(const std::string& routing_key_a, const std::string& routing_key_b) const {
  return router_->route(routing_key_a, routing_key_b);
}

propagation::FileDeliveryReport MeshNetwork::deliver(const std::string& file_id, const std::string& target_id,
                                                     const std::optional<std::string>& source_id) {
  return engine_->deliver_file(file_id, target_id, source_id);
}


//==============================================
// MESSAGING
//==============================================

messaging::SendResult MeshNetwork::send_message(const address::NodeAddress& sender, const address::NodeAddress& recipient,
                                                const std::string& payload, double wavelength_nm) {
  return messages_->send(sender, recipient, payload, wavelength_nm);
}

std::vector<messaging::PrivateMessage> MeshNetwork::inbox(const std::string& routing_key) const {
  return messages_->inbox(routing_key);
}


//==============================================
// KNOWLEDGE
//==============================================

knowledge::KnowledgeResource MeshNetwork::add_resource(const std::string& resource_id, const std::string& title,
                                                       uint64_t size, const std::string& category, int priority) {
  return knowledge_->add_resource(resource_id, title, size, category, priority);
}

knowledge::PlacementResult MeshNetwork::cache_resource(const std::string& resource_id, const std::string& node_id) {
  return knowledge_->cache_on_node(resource_id, node_id);
}

std::optional<std::string> MeshNetwork::find_nearest_cache(const std::string& resource_id,
                                                           const std::string& requester_id) {
  return knowledge_->find_nearest_cache(resource_id, requester_id);
}


//==============================================
// REPORTING
//==============================================

NetworkStats MeshNetwork::stats() const {
  propagation::PropagationStats engine_stats = engine_->stats();

  NetworkStats stats;
  stats.total_files = content_->file_count();
  stats.total_chunks = content_->total_chunks();
  stats.total_propagations = engine_stats.total_propagations;
  stats.total_bytes = engine_stats.total_bytes;
  stats.total_energy = engine_stats.total_energy;
  stats.total_hops = engine_stats.total_hops;
  stats.cache_hits = engine_stats.cache_hits;
  stats.cache_misses = engine_stats.cache_misses;
  stats.dedup_reused = engine_stats.dedup_reused;
  stats.cache_hit_rate = engine_stats.cache_hit_rate();
  stats.dedup_reuse_rate = engine_stats.dedup_reuse_rate();
  stats.avg_hops_per_propagation = engine_stats.avg_hops_per_propagation();
  return stats;
}

std::optional<CacheStatus> MeshNetwork::node_cache_status(const std::string& node_id) const {
  auto node_cache = caches_->find(node_id);
  if (!node_cache) {
    return std::nullopt;
  }

  CacheStatus status;
  status.node_id = node_id;
  status.capacity_bytes = node_cache->capacity();
  status.used_bytes = node_cache->used();
  status.available_bytes = node_cache->available();
  status.utilization_percent = node_cache->utilization_percent();
  status.chunks_cached = node_cache->chunk_count();
  return status;
}

std::optional<DownloadStatus> MeshNetwork::download_status(const std::string& file_id,
                                                           const std::string& node_id) const {
  auto media_file = content_->file(file_id);
  auto node_cache = caches_->find(node_id);
  if (!media_file || !node_cache) {
    return std::nullopt;
  }

  DownloadStatus status;
  status.file_id = file_id;
  status.filename = media_file->filename;
  status.node_id = node_id;
  status.total_chunks = media_file->chunks.size();

  // Content held under another file counts too
  for (const auto& chunk : media_file->chunks) {
    if (node_cache->has_chunk(chunk->content_hash())) {
      ++status.chunks_downloaded;
    }
  }

  if (status.total_chunks > 0) {
    status.progress = static_cast<double>(status.chunks_downloaded) * 100.0 / static_cast<double>(status.total_chunks);
  }
  status.can_stream = status.progress >= 10.0;
  status.has_safe_buffer = status.progress >= 20.0;
  status.is_complete = status.total_chunks > 0 && status.chunks_downloaded == status.total_chunks;
  status.buffered_mb = static_cast<double>(status.chunks_downloaded * config_.chunking.chunk_size) / BYTES_PER_MB;
  status.total_mb = static_cast<double>(media_file->size) / BYTES_PER_MB;
  return status;
}

std::optional<FileInfo> MeshNetwork::file_info(const std::string& file_id) const {
  auto media_file = content_->file(file_id);
  if (!media_file) {
    return std::nullopt;
  }

  FileInfo info;
  info.file_id = media_file->file_id;
  info.filename = media_file->filename;
  info.metadata = media_file->metadata;
  info.size = media_file->size;
  info.content_hash = media_file->content_hash;
  info.total_chunks = media_file->chunks.size();
  info.energy_cost_single_hop = media_file->energy_cost_single_hop();
  info.energy_spent_all_hops = media_file->energy_spent_all_hops();

  double megabits = static_cast<double>(media_file->size) / BYTES_PER_MB * 8.0;
  info.ble_minutes = megabits / BLE_MBPS / 60.0;
  info.wifi_minutes = megabits / WIFI_MBPS / 60.0;
  info.lora_minutes = megabits / LORA_MBPS / 60.0;
  return info;
}

HealthReport MeshNetwork::health() const {
  HealthReport report;
  report.coverage = topology_->coverage_stats();
  report.operational = report.coverage.node_count > 0;
  report.files = content_->file_count();
  report.distinct_contents = content_->distinct_contents();

  std::size_t total_chunks = content_->total_chunks();
  if (total_chunks > 0) {
    report.replication_factor = static_cast<double>(caches_->total_cached_chunks()) / static_cast<double>(total_chunks);
  }
  report.queued_messages = messages_->queued_messages();
  report.knowledge = knowledge_->stats();
  return report;
}

} // namespace wavemesh
