#ifndef WAVEMESH_CACHE_NODE_CACHE_HPP
#define WAVEMESH_CACHE_NODE_CACHE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "store/chunk.hpp"

namespace wavemesh {
namespace cache {

enum class AdmitResult {
  ADMITTED,
  ALREADY_PRESENT,
  REJECTED,
  DETACHED   // the node has left the mesh
};

// Bounded chunk store of a single node, keyed by content hash. Admission is strict:
// a chunk that does not fit is refused whole and nothing is ever evicted implicitly.
class NodeCache {
public:
  // Delete copy constructor and assignment operator
  NodeCache(const NodeCache&) = delete;
  NodeCache& operator=(const NodeCache&) = delete;


  // ---- CONSTRUCTOR ----
  NodeCache(std::string node_id, uint64_t capacity_bytes);


  // ---- ADMISSION ----
  // True iff chunk.size <= capacity - used
  bool can_admit(const store::Chunk& chunk) const;
  // Checks capacity and records the chunk in one critical section, then registers this node
  // as a holder of the chunk
  AdmitResult admit(const store::ChunkPtr& chunk);
  bool has_chunk(const std::string& content_hash) const;


  // ---- EXPLICIT RELEASE ----
  // Drops one cached content and the holder entry it created
  bool evict(const std::string& content_hash);
  // Drops everything and refuses all later admissions, used when the node leaves the mesh
  void detach();
  // Refuses to shrink below the bytes already in use
  bool set_capacity(uint64_t capacity_bytes);


  // ---- QUERY OPERATIONS ----
  const std::string& node_id() const { return node_id_; }
  uint64_t capacity() const;
  uint64_t used() const;
  uint64_t available() const;
  std::size_t chunk_count() const;
  double utilization_percent() const;
  bool detached() const;
  std::vector<std::string> content_hashes() const;
  // Recomputes used bytes from the cached chunks and compares with the capacity
  bool invariant_holds() const;

private:
  // ---- PARAMETERS ----
  const std::string node_id_;
  uint64_t capacity_;
  uint64_t used_ = 0;
  bool detached_ = false;
  std::map<std::string, store::ChunkPtr> chunks_;
  mutable std::mutex mutex_;

  bool fits_locked(uint64_t size) const { return used_ <= capacity_ && size <= capacity_ - used_; }
};

// Every node's cache, keyed by node id
class CacheDirectory {
public:
  CacheDirectory() = default;
  CacheDirectory(const CacheDirectory&) = delete;
  CacheDirectory& operator=(const CacheDirectory&) = delete;

  // Returns false if the node already has a cache
  bool create(const std::string& node_id, uint64_t capacity_bytes);
  std::shared_ptr<NodeCache> find(const std::string& node_id) const;
  // Unlists and detaches the node's cache
  bool remove(const std::string& node_id);
  std::size_t size() const;
  // Total cached chunk instances across all nodes
  std::size_t total_cached_chunks() const;

private:
  std::map<std::string, std::shared_ptr<NodeCache>> caches_;
  mutable std::mutex mutex_;
};

} // namespace cache
} // namespace wavemesh

#endif // WAVEMESH_CACHE_NODE_CACHE_HPP
