#ifndef WAVEMESH_PROPAGATION_ENGINE_HPP
#define WAVEMESH_PROPAGATION_ENGINE_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "cache/node_cache.hpp"
#include "mesh/mesh_error.hpp"
#include "routing/path_router.hpp"
#include "store/content_store.hpp"

namespace wavemesh {
namespace propagation {

enum class SourceSelection {
  NEAREST_HOLDER,  // closest holder by hop count from the target
  FIRST_HOLDER     // lowest holder id
};

struct DeliveryResult {
  MeshError error = MeshError::SUCCESS;
  bool cache_hit = false;
  std::size_t hops = 0;
  double cost = 0.0;
  routing::Path path;
  std::string source;

  bool ok() const { return error == MeshError::SUCCESS; }
};

struct FileDeliveryReport {
  MeshError error = MeshError::SUCCESS;  // UNKNOWN_FILE / UNKNOWN_NODE or the first chunk failure
  std::string file_id;
  std::string filename;
  std::size_t total_chunks = 0;
  std::size_t successful_chunks = 0;
  std::size_t cache_hits = 0;
  double total_cost = 0.0;
  std::size_t total_hops = 0;
  std::vector<DeliveryResult> chunks;

  bool success() const { return error == MeshError::SUCCESS && successful_chunks == total_chunks; }
  double avg_hops_per_chunk() const {
    return successful_chunks > 0 ? static_cast<double>(total_hops) / static_cast<double>(successful_chunks) : 0.0;
  }
};

struct PropagationStats {
  uint64_t total_propagations = 0;
  uint64_t total_bytes = 0;
  double total_energy = 0.0;
  uint64_t total_hops = 0;
  uint64_t cache_hits = 0;
  uint64_t cache_misses = 0;
  uint64_t dedup_reused = 0;

  // Percentages, 0 when nothing was requested yet
  double cache_hit_rate() const;
  double dedup_reuse_rate() const;
  double avg_hops_per_propagation() const;
};

class PropagationEngine {
public:
  // Delete copy constructor and assignment operator
  PropagationEngine(const PropagationEngine&) = delete;
  PropagationEngine& operator=(const PropagationEngine&) = delete;


  // ---- CONSTRUCTOR ----
  PropagationEngine(store::ContentStore& content_store, cache::CacheDirectory& caches,
                    const routing::PathRouter& router,
                    SourceSelection selection = SourceSelection::NEAREST_HOLDER);


  // ---- DELIVERY ----
  // Moves one chunk to the target: a cache hit costs nothing, a miss is routed from a holder
  // (or the given source) and charged energy_cost_per_hop per hop. Failures leave the
  // counters for bytes, hops and energy untouched.
  DeliveryResult deliver_chunk(const store::ChunkPtr& chunk, const std::string& target_id,
                               const std::optional<std::string>& source_id = std::nullopt);
  // Delivers every chunk in file order. A failed chunk only lowers the success count.
  FileDeliveryReport deliver_file(const std::string& file_id, const std::string& target_id,
                                  const std::optional<std::string>& source_id = std::nullopt);


  // ---- SOURCE SELECTION ----
  // Holder of the chunk's content (from any file sharing its hash) to copy from
  std::optional<std::string> select_source(const store::Chunk& chunk, const std::string& target_id) const;


  // ---- STATISTICS ----
  PropagationStats stats() const;

private:
  // ---- PARAMETERS ----
  store::ContentStore& content_store_;
  cache::CacheDirectory& caches_;
  const routing::PathRouter& router_;
  SourceSelection selection_;

  PropagationStats stats_;
  mutable std::mutex stats_mutex_;

  DeliveryResult fail(MeshError error, const store::Chunk& chunk, const std::string& target_id) const;
  void count_hit();
};

} // namespace propagation
} // namespace wavemesh

#endif // WAVEMESH_PROPAGATION_ENGINE_HPP
