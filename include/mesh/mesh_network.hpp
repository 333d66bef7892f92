#ifndef WAVEMESH_MESH_NETWORK_HPP
#define WAVEMESH_MESH_NETWORK_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "address/address_registry.hpp"
#include "cache/node_cache.hpp"
#include "crypto/random_source.hpp"
#include "knowledge/knowledge_catalog.hpp"
#include "mesh/mesh_config.hpp"
#include "mesh/mesh_error.hpp"
#include "messaging/message_router.hpp"
#include "propagation/propagation_engine.hpp"
#include "routing/path_router.hpp"
#include "store/content_store.hpp"
#include "topology/topology_graph.hpp"

namespace wavemesh {

struct NetworkStats {
  std::size_t total_files = 0;
  std::size_t total_chunks = 0;
  uint64_t total_propagations = 0;
  uint64_t total_bytes = 0;
  double total_energy = 0.0;
  uint64_t total_hops = 0;
  uint64_t cache_hits = 0;
  uint64_t cache_misses = 0;
  uint64_t dedup_reused = 0;
  double cache_hit_rate = 0.0;    // percent
  double dedup_reuse_rate = 0.0;  // percent
  double avg_hops_per_propagation = 0.0;
};

struct CacheStatus {
  std::string node_id;
  uint64_t capacity_bytes = 0;
  uint64_t used_bytes = 0;
  uint64_t available_bytes = 0;
  double utilization_percent = 0.0;
  std::size_t chunks_cached = 0;
};

struct DownloadStatus {
  std::string file_id;
  std::string filename;
  std::string node_id;
  double progress = 0.0;  // percent
  std::size_t chunks_downloaded = 0;
  std::size_t total_chunks = 0;
  bool can_stream = false;       // >= 10%
  bool has_safe_buffer = false;  // >= 20%
  bool is_complete = false;
  double buffered_mb = 0.0;
  double total_mb = 0.0;
};

struct FileInfo {
  std::string file_id;
  std::string filename;
  store::FileMetadata metadata;
  uint64_t size = 0;
  std::string content_hash;
  std::size_t total_chunks = 0;
  double energy_cost_single_hop = 0.0;
  double energy_spent_all_hops = 0.0;
  // Transfer estimates in minutes per transport
  double ble_minutes = 0.0;
  double wifi_minutes = 0.0;
  double lora_minutes = 0.0;
};

struct HealthReport {
  bool operational = false;
  topology::CoverageStats coverage;
  std::size_t files = 0;
  std::size_t distinct_contents = 0;
  double replication_factor = 0.0;  // cached chunk instances per registered chunk
  std::size_t queued_messages = 0;
  knowledge::KnowledgeStats knowledge;
};

// Owns every part of one mesh: topology, addresses, content, node caches, routing,
// propagation, messaging and the knowledge catalog. Components only reach each other through the references handed out here.
class MeshNetwork {
public:
  // Delete copy constructor and assignment operator
  MeshNetwork(const MeshNetwork&) = delete;
  MeshNetwork& operator=(const MeshNetwork&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit MeshNetwork(const MeshConfig& config = {});
  MeshNetwork(const MeshConfig& config, std::unique_ptr<crypto::RandomSource> random);
  ~MeshNetwork();


  // ---- NODES AND LINKS ----
  // Registers the node, derives its address from a fresh seed and creates its cache
  std::optional<address::NodeAddress> add_node(const std::string& node_id, topology::NodeRole role,
                                               uint64_t cache_capacity_bytes,
                                               const std::vector<topology::Transport>& transports = {},
                                               double uptime_hours = 0.0);
  MeshError connect(const std::string& a, const std::string& b, topology::Transport transport,
                    double signal_dbm, double latency_ms, double bandwidth_kbps);
  MeshError disconnect(const std::string& a, const std::string& b);
  // Removes the node, its links, its address and its cached content
  MeshError remove_node(const std::string& node_id);


  // ---- CONTENT ----
  store::MediaFilePtr register_file(const std::string& filename, uint64_t size,
                                    const store::FileMetadata& metadata = {},
                                    const std::optional<std::string>& content_identity = std::nullopt);
  // Places every chunk of the file on the node without routing or charging anything
  MeshError seed(const std::string& file_id, const std::string& node_id);
  MeshError evict(const std::string& node_id, const std::string& content_hash);


  // ---- ROUTING AND DELIVERY ----
  routing::Path route(const address::NodeAddress& a, const address::NodeAddress& b) const;
  routing::Path route(const std::string& routing_key_a, const std::string& routing_key_b) const;
  propagation::FileDeliveryReport deliver(const std::string& file_id, const std::string& target_id,
                                          const std::optional<std::string>& source_id = std::nullopt);


  // ---- MESSAGING ----
  messaging::SendResult send_message(const address::NodeAddress& sender, const address::NodeAddress& recipient,
                                     const std::string& payload, double wavelength_nm);
  std::vector<messaging::PrivateMessage> inbox(const std::string& routing_key) const;


  // ---- KNOWLEDGE ----
  knowledge::KnowledgeResource add_resource(const std::string& resource_id, const std::string& title,
                                            uint64_t size, const std::string& category, int priority);
  knowledge::PlacementResult cache_resource(const std::string& resource_id, const std::string& node_id);
  std::optional<std::string> find_nearest_cache(const std::string& resource_id, const std::string& requester_id);


  // ---- REPORTING ----
  NetworkStats stats() const;
  std::optional<CacheStatus> node_cache_status(const std::string& node_id) const;
  std::optional<DownloadStatus> download_status(const std::string& file_id, const std::string& node_id) const;
  std::optional<FileInfo> file_info(const std::string& file_id) const;
  HealthReport health() const;


  // ---- GETTERS ----
  topology::TopologyGraph& topology() { return *topology_; }
  const topology::TopologyGraph& topology() const { return *topology_; }
  address::AddressRegistry& addresses() { return *addresses_; }
  const address::AddressRegistry& addresses() const { return *addresses_; }
  store::ContentStore& content() { return *content_; }
  const store::ContentStore& content() const { return *content_; }
  cache::CacheDirectory& caches() { return *caches_; }
  const routing::PathRouter& router() const { return *router_; }
  propagation::PropagationEngine& engine() { return *engine_; }
  messaging::MessageRouter& messages() { return *messages_; }
  knowledge::KnowledgeCatalog& knowledge() { return *knowledge_; }
  const knowledge::KnowledgeCatalog& knowledge() const { return *knowledge_; }

private:
  // ---- PARAMETERS ----
  MeshConfig config_;

  // System components, declared in construction order
  std::unique_ptr<crypto::RandomSource> random_;
  std::unique_ptr<topology::TopologyGraph> topology_;
  std::unique_ptr<address::AddressRegistry> addresses_;
  std::unique_ptr<store::ContentStore> content_;
  std::unique_ptr<cache::CacheDirectory> caches_;
  std::unique_ptr<routing::PathRouter> router_;
  std::unique_ptr<propagation::PropagationEngine> engine_;
  std::unique_ptr<messaging::MessageRouter> messages_;
  std::unique_ptr<knowledge::KnowledgeCatalog> knowledge_;
};

// Six-node university campus deployment with a small content library and offline reference works
void build_demo_network(MeshNetwork& network);

} // namespace wavemesh

#endif // WAVEMESH_MESH_NETWORK_HPP
