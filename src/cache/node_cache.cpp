#include "cache/node_cache.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace wavemesh {
namespace cache {

//==============================================
// CONSTRUCTOR
//==============================================

NodeCache::NodeCache(std::string node_id, uint64_t capacity_bytes)
  : node_id_(std::move(node_id))
  , capacity_(capacity_bytes) {
  BOOST_LOG_TRIVIAL(debug) << "Node cache: Created cache for " << node_id_ << " with " << capacity_ << " bytes";
}


//==============================================
// ADMISSION
//==============================================

bool NodeCache::can_admit(const store::Chunk& chunk) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fits_locked(chunk.size());
}

AdmitResult NodeCache::admit(const store::ChunkPtr& chunk) {
  if (!chunk) {
    BOOST_LOG_TRIVIAL(error) << "Node cache: Attempted to admit null chunk on " << node_id_;
    return AdmitResult::REJECTED;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);

    // A departed node must not reappear as a holder
    if (detached_) {
      BOOST_LOG_TRIVIAL(warning) << "Node cache: " << node_id_ << " has left the mesh, refusing chunk "
                                 << chunk->chunk_id();
      return AdmitResult::DETACHED;
    }

    if (chunks_.count(chunk->content_hash()) != 0) {
      return AdmitResult::ALREADY_PRESENT;
    }

    if (!fits_locked(chunk->size())) {
      BOOST_LOG_TRIVIAL(info) << "Node cache: " << node_id_ << " rejected chunk " << chunk->chunk_id()
                              << " (" << chunk->size() << " bytes, " << capacity_ - std::min(used_, capacity_)
                              << " available)";
      return AdmitResult::REJECTED;
    }

    chunks_.emplace(chunk->content_hash(), chunk);
    used_ += chunk->size();
    chunk->add_holder(node_id_);
  }

  BOOST_LOG_TRIVIAL(debug) << "Node cache: " << node_id_ << " admitted chunk " << chunk->chunk_id();
  return AdmitResult::ADMITTED;
}

bool NodeCache::has_chunk(const std::string& content_hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.count(content_hash) != 0;
}


//==============================================
// EXPLICIT RELEASE
//==============================================

bool NodeCache::evict(const std::string& content_hash) {
  store::ChunkPtr chunk;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find(content_hash);
    if (it == chunks_.end()) {
      return false;
    }
    chunk = it->second;
    used_ -= chunk->size();
    chunks_.erase(it);
    chunk->remove_holder(node_id_);
  }

  BOOST_LOG_TRIVIAL(info) << "Node cache: " << node_id_ << " evicted chunk " << chunk->chunk_id();
  return true;
}

void NodeCache::detach() {
  std::size_t released = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    detached_ = true;
    released = chunks_.size();
    for (auto& [hash, chunk] : chunks_) {
      chunk->remove_holder(node_id_);
    }
    chunks_.clear();
    used_ = 0;
  }

  BOOST_LOG_TRIVIAL(debug) << "Node cache: " << node_id_ << " detached, released " << released << " chunks";
}

bool NodeCache::set_capacity(uint64_t capacity_bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (capacity_bytes < used_) {
    BOOST_LOG_TRIVIAL(warning) << "Node cache: " << node_id_ << " cannot shrink to " << capacity_bytes
                               << " bytes with " << used_ << " bytes in use";
    return false;
  }
  capacity_ = capacity_bytes;
  return true;
}


//==============================================
// QUERY OPERATIONS
//==============================================

uint64_t NodeCache::capacity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capacity_;
}

uint64_t NodeCache::used() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return used_;
}

uint64_t NodeCache::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return used_ >= capacity_ ? 0 : capacity_ - used_;
}

std::size_t NodeCache::chunk_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

double NodeCache::utilization_percent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (capacity_ == 0) {
    return 0.0;
  }
  return static_cast<double>(used_) * 100.0 / static_cast<double>(capacity_);
}

bool NodeCache::detached() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return detached_;
}

std::vector<std::string> NodeCache::content_hashes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> hashes;
  hashes.reserve(chunks_.size());
  for (const auto& [hash, chunk] : chunks_) {
    hashes.push_back(hash);
  }
  return hashes;
}

bool NodeCache::invariant_holds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t total = 0;
  for (const auto& [hash, chunk] : chunks_) {
    total += chunk->size();
  }
  return total == used_ && used_ <= capacity_;
}


//==============================================
// CACHE DIRECTORY
//==============================================

bool CacheDirectory::create(const std::string& node_id, uint64_t capacity_bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (caches_.count(node_id) != 0) {
    return false;
  }
  caches_.emplace(node_id, std::make_shared<NodeCache>(node_id, capacity_bytes));
  return true;
}

std::shared_ptr<NodeCache> CacheDirectory::find(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = caches_.find(node_id);
  if (it == caches_.end()) {
    return nullptr;
  }
  return it->second;
}

bool CacheDirectory::remove(const std::string& node_id) {
  std::shared_ptr<NodeCache> cache;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = caches_.find(node_id);
    if (it == caches_.end()) {
      return false;
    }
    cache = it->second;
    caches_.erase(it);
  }
  cache->detach();
  return true;
}

std::size_t CacheDirectory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return caches_.size();
}

std::size_t CacheDirectory::total_cached_chunks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto& [id, cache] : caches_) {
    total += cache->chunk_count();
  }
  return total;
}

} // namespace cache
} // namespace wavemesh
