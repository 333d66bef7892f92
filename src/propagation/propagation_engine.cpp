#include "propagation/propagation_engine.hpp"
#include <boost/log/trivial.hpp>

namespace wavemesh {
namespace propagation {

//==============================================
// STATISTICS
//==============================================

double PropagationStats::cache_hit_rate() const {
  uint64_t requests = cache_hits + cache_misses;
  if (requests == 0) {
    return 0.0;
  }
  return static_cast<double>(cache_hits) * 100.0 / static_cast<double>(requests);
}

double PropagationStats::dedup_reuse_rate() const {
  if (total_propagations == 0) {
    return 0.0;
  }
  return static_cast<double>(dedup_reused) * 100.0 / static_cast<double>(total_propagations);
}

double PropagationStats::avg_hops_per_propagation() const {
  if (total_propagations == 0) {
    return 0.0;
  }
  return static_cast<double>(total_hops) / static_cast<double>(total_propagations);
}


//==============================================
// CONSTRUCTOR
//==============================================

PropagationEngine::PropagationEngine(store::ContentStore& content_store, cache::CacheDirectory& caches,
                                     const routing::PathRouter& router, SourceSelection selection)
  : content_store_(content_store)
  , caches_(caches)
  , router_(router)
  , selection_(selection) {
  BOOST_LOG_TRIVIAL(info) << "Propagation engine: initialized with "
                          << (selection_ == SourceSelection::NEAREST_HOLDER ? "nearest" : "first")
                          << " holder source selection";
}


//==============================================
// DELIVERY
//==============================================

DeliveryResult PropagationEngine::deliver_chunk(const store::ChunkPtr& chunk, const std::string& target_id,
                                                const std::optional<std::string>& source_id) {
  if (!chunk) {
    BOOST_LOG_TRIVIAL(error) << "Propagation engine: Null chunk requested for " << target_id;
    DeliveryResult result;
    result.error = MeshError::UNKNOWN_FILE;
    return result;
  }

  auto target_cache = caches_.find(target_id);
  if (!target_cache) {
    return fail(MeshError::UNKNOWN_NODE, *chunk, target_id);
  }

  // Cache hit: the target already holds these bytes, possibly under another file
  if (target_cache->has_chunk(chunk->content_hash())) {
    count_hit();
    DeliveryResult result;
    result.cache_hit = true;
    result.path = {target_id};
    result.source = target_id;
    BOOST_LOG_TRIVIAL(debug) << "Propagation engine: Cache hit for " << chunk->chunk_id() << " on " << target_id;
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.cache_misses;
  }

  std::string source;
  if (source_id) {
    if (!caches_.find(*source_id)) {
      return fail(MeshError::UNKNOWN_NODE, *chunk, target_id);
    }
    source = *source_id;
  } else {
    auto selected = select_source(*chunk, target_id);
    if (!selected) {
      return fail(MeshError::NO_SOURCE, *chunk, target_id);
    }
    source = *selected;
  }

  routing::Path path = router_.route_nodes(source, target_id);
  if (path.size() < 2) {
    return fail(MeshError::NO_ROUTE, *chunk, target_id);
  }

  std::size_t hops = path.size() - 1;
  double cost = chunk->energy_cost_per_hop() * static_cast<double>(hops);

  switch (target_cache->admit(chunk)) {
    case cache::AdmitResult::REJECTED:
      return fail(MeshError::CACHE_FULL, *chunk, target_id);
    case cache::AdmitResult::DETACHED:
      return fail(MeshError::UNKNOWN_NODE, *chunk, target_id);
    case cache::AdmitResult::ALREADY_PRESENT: {
      // A concurrent delivery landed the same content first; the miss becomes a hit
      {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        --stats_.cache_misses;
        ++stats_.cache_hits;
      }
      DeliveryResult result;
      result.cache_hit = true;
      result.path = {target_id};
      result.source = target_id;
      return result;
    }
    case cache::AdmitResult::ADMITTED:
      break;
  }

  if (!target_cache->invariant_holds()) {
    BOOST_LOG_TRIVIAL(fatal) << "Propagation engine: Capacity invariant broken on " << target_id
                             << " (used " << target_cache->used() << " of " << target_cache->capacity() << ")";
    // Admission is all-or-nothing, so the chunk does not stay behind
    if (!target_cache->evict(chunk->content_hash())) {
      BOOST_LOG_TRIVIAL(warning) << "Propagation engine: " << chunk->chunk_id() << " already gone from " << target_id;
    }
    return fail(MeshError::CAPACITY_VIOLATION, *chunk, target_id);
  }

  chunk->record_delivery(path);
  bool reused = content_store_.chunks_with_hash(chunk->content_hash()).size() > 1;

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.total_propagations;
    stats_.total_bytes += chunk->size();
    stats_.total_energy += cost;
    stats_.total_hops += hops;
    if (reused) {
      ++stats_.dedup_reused;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Propagation engine: Delivered " << chunk->chunk_id() << " " << source
                           << " -> " << target_id << " in " << hops << " hops, cost " << cost;

  DeliveryResult result;
  result.hops = hops;
  result.cost = cost;
  result.path = std::move(path);
  result.source = std::move(source);
  return result;
}

FileDeliveryReport PropagationEngine::deliver_file(const std::string& file_id, const std::string& target_id,
                                                   const std::optional<std::string>& source_id) {
  FileDeliveryReport report;
  report.file_id = file_id;

  auto media_file = content_store_.file(file_id);
  if (!media_file) {
    BOOST_LOG_TRIVIAL(error) << "Propagation engine: File not found: " << file_id;
    report.error = MeshError::UNKNOWN_FILE;
    return report;
  }
  report.filename = media_file->filename;
  report.total_chunks = media_file->chunks.size();

  if (!caches_.find(target_id)) {
    BOOST_LOG_TRIVIAL(error) << "Propagation engine: Target node not found: " << target_id;
    report.error = MeshError::UNKNOWN_NODE;
    return report;
  }

  BOOST_LOG_TRIVIAL(info) << "Propagation engine: Delivering " << media_file->filename << " ("
                          << report.total_chunks << " chunks) to " << target_id;

  report.chunks.reserve(media_file->chunks.size());
  for (const auto& chunk : media_file->chunks) {
    DeliveryResult result = deliver_chunk(chunk, target_id, source_id);
    if (result.ok()) {
      ++report.successful_chunks;
      if (result.cache_hit) {
        ++report.cache_hits;
      } else {
        report.total_cost += result.cost;
        report.total_hops += result.hops;
      }
    } else if (report.error == MeshError::SUCCESS) {
      report.error = result.error;
    }
    report.chunks.push_back(std::move(result));
  }

  BOOST_LOG_TRIVIAL(info) << "Propagation engine: " << report.successful_chunks << "/" << report.total_chunks
                          << " chunks of " << file_id << " on " << target_id << ", " << report.total_hops
                          << " hops, " << report.cache_hits << " cache hits";
  return report;
}


//==============================================
// SOURCE SELECTION
//==============================================

std::optional<std::string> PropagationEngine::select_source(const store::Chunk& chunk,
                                                            const std::string& target_id) const {
  std::set<std::string> holders = content_store_.holders_of(chunk.content_hash());
  holders.erase(target_id);
  if (holders.empty()) {
    return std::nullopt;
  }

  if (selection_ == SourceSelection::NEAREST_HOLDER) {
    auto nearest = router_.nearest(target_id, [&holders](const std::string& node_id) {
      return holders.count(node_id) != 0;
    });
    if (nearest) {
      return nearest;
    }
  }

  // Unreachable holders still name a source; routing then reports the partition
  return *holders.begin();
}


//==============================================
// STATISTICS
//==============================================

PropagationStats PropagationEngine::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

DeliveryResult PropagationEngine::fail(MeshError error, const store::Chunk& chunk, const std::string& target_id) const {
  BOOST_LOG_TRIVIAL(warning) << "Propagation engine: Delivery of " << chunk.chunk_id() << " to " << target_id
                             << " failed: " << mesh_error_to_string(error);
  DeliveryResult result;
  result.error = error;
  return result;
}

void PropagationEngine::count_hit() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.cache_hits;
}

} // namespace propagation
} // namespace wavemesh
