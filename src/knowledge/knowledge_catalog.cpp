#include "knowledge/knowledge_catalog.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace wavemesh {
namespace knowledge {

//==============================================
// CONSTRUCTOR
//==============================================

KnowledgeCatalog::KnowledgeCatalog(store::ContentStore& content_store, cache::CacheDirectory& caches,
                                   const routing::PathRouter& router)
  : content_store_(content_store)
  , caches_(caches)
  , router_(router) {
  BOOST_LOG_TRIVIAL(info) << "Knowledge catalog: initialized";
}


//==============================================
// CATALOG
//==============================================

KnowledgeResource KnowledgeCatalog::add_resource(const std::string& resource_id, const std::string& title,
                                                 uint64_t size, const std::string& category, int priority) {
  if (resource_id.empty() || size == 0) {
    throw std::invalid_argument("Knowledge catalog: resource needs an id and a non-zero size");
  }
  if (priority < MIN_PRIORITY || priority > MAX_PRIORITY) {
    throw std::invalid_argument("Knowledge catalog: priority out of range for " + resource_id);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = resources_.find(resource_id);
    if (existing != resources_.end()) {
      BOOST_LOG_TRIVIAL(debug) << "Knowledge catalog: Resource already listed: " << resource_id;
      return existing->second;
    }
  }

  // Registration hashes the whole resource, so it runs outside the catalog lock
  store::FileMetadata metadata;
  metadata.file_type = "knowledge";
  metadata.description = title;
  metadata.category = category;
  store::MediaFilePtr media_file = content_store_.register_file(resource_id, size, metadata, resource_id + title);

  KnowledgeResource resource;
  resource.resource_id = resource_id;
  resource.title = title;
  resource.category = category;
  resource.priority = priority;
  resource.file_id = media_file->file_id;
  resource.content_hash = media_file->content_hash;
  resource.size = media_file->size;

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = resources_.emplace(resource_id, std::move(resource));
  if (inserted) {
    BOOST_LOG_TRIVIAL(info) << "Knowledge catalog: Added " << it->second.title << " (" << it->second.category
                            << ", " << it->second.size << " bytes)";
  }
  return it->second;
}

std::optional<KnowledgeResource> KnowledgeCatalog::resource(const std::string& resource_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = resources_.find(resource_id);
  if (it == resources_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<KnowledgeResource> KnowledgeCatalog::resources() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<KnowledgeResource> listed;
  listed.reserve(resources_.size());
  for (const auto& [id, resource] : resources_) {
    listed.push_back(resource);
  }
  return listed;
}

bool KnowledgeCatalog::verify_authenticity(const std::string& resource_id, const std::string& expected_hash) const {
  auto listed = resource(resource_id);
  return listed && listed->content_hash == expected_hash;
}


//==============================================
// PLACEMENT
//==============================================

PlacementResult KnowledgeCatalog::cache_on_node(const std::string& resource_id, const std::string& node_id) {
  PlacementResult result;
  result.node_id = node_id;

  auto listed = resource(resource_id);
  store::MediaFilePtr media_file;
  if (listed) {
    media_file = content_store_.file(listed->file_id);
  }
  if (!media_file) {
    BOOST_LOG_TRIVIAL(warning) << "Knowledge catalog: Resource not found: " << resource_id;
    result.error = MeshError::UNKNOWN_FILE;
    return result;
  }

  auto node_cache = caches_.find(node_id);
  if (!node_cache) {
    BOOST_LOG_TRIVIAL(warning) << "Knowledge catalog: Node not found: " << node_id;
    result.error = MeshError::UNKNOWN_NODE;
    return result;
  }

  // Chunks admitted by this call are taken back if the rest does not fit
  std::vector<std::string> admitted;
  for (const auto& chunk : media_file->chunks) {
    cache::AdmitResult admit = node_cache->admit(chunk);
    if (admit == cache::AdmitResult::ADMITTED) {
      admitted.push_back(chunk->content_hash());
      continue;
    }
    if (admit == cache::AdmitResult::ALREADY_PRESENT) {
      continue;
    }

    for (const auto& hash : admitted) {
      if (!node_cache->evict(hash)) {
        BOOST_LOG_TRIVIAL(debug) << "Knowledge catalog: " << hash << " already released on " << node_id;
      }
    }
    result.error = admit == cache::AdmitResult::DETACHED ? MeshError::UNKNOWN_NODE : MeshError::CACHE_FULL;
    result.used_bytes = node_cache->used();
    result.capacity_bytes = node_cache->capacity();
    BOOST_LOG_TRIVIAL(warning) << "Knowledge catalog: Cannot cache " << resource_id << " on " << node_id << " ("
                               << result.used_bytes << "/" << result.capacity_bytes << " bytes used)";
    return result;
  }

  count_access(resource_id);
  result.used_bytes = node_cache->used();
  result.capacity_bytes = node_cache->capacity();
  BOOST_LOG_TRIVIAL(info) << "Knowledge catalog: Cached " << listed->title << " on " << node_id << " ("
                          << result.used_bytes << "/" << result.capacity_bytes << " bytes used)";
  return result;
}

std::set<std::string> KnowledgeCatalog::nodes_holding(const std::string& resource_id) const {
  auto listed = resource(resource_id);
  if (!listed) {
    return {};
  }
  return holders_of_file(listed->file_id);
}

std::optional<std::string> KnowledgeCatalog::find_nearest_cache(const std::string& resource_id,
                                                                const std::string& requester_id) {
  std::set<std::string> holders = nodes_holding(resource_id);
  if (holders.empty()) {
    return std::nullopt;
  }

  auto nearest = router_.nearest(requester_id, [&holders](const std::string& node_id) {
    return holders.count(node_id) != 0;
  });
  if (nearest) {
    count_access(resource_id);
    BOOST_LOG_TRIVIAL(debug) << "Knowledge catalog: " << requester_id << " reads " << resource_id
                             << " from " << *nearest;
  }
  return nearest;
}


//==============================================
// STATISTICS
//==============================================

KnowledgeStats KnowledgeCatalog::stats() const {
  std::vector<KnowledgeResource> listed = resources();

  KnowledgeStats stats;
  stats.total_resources = listed.size();
  for (const auto& resource : listed) {
    stats.total_bytes += resource.size;
    stats.total_cache_instances += holders_of_file(resource.file_id).size();
    ++stats.categories[resource.category];
  }
  if (stats.total_resources > 0) {
    stats.avg_replication_factor = static_cast<double>(stats.total_cache_instances)
                                 / static_cast<double>(stats.total_resources);
  }

  // Most accessed first, ties by resource id
  std::stable_sort(listed.begin(), listed.end(), [](const KnowledgeResource& a, const KnowledgeResource& b) {
    return a.access_count > b.access_count;
  });
  for (std::size_t i = 0; i < listed.size() && i < TOP_ACCESSED_COUNT; ++i) {
    stats.top_accessed.emplace_back(listed[i].title, listed[i].access_count);
  }
  return stats;
}


//==============================================
// HELPERS
//==============================================

std::set<std::string> KnowledgeCatalog::holders_of_file(const std::string& file_id) const {
  auto media_file = content_store_.file(file_id);
  if (!media_file || media_file->chunks.empty()) {
    return {};
  }

  // Intersection of the holder sets of every chunk
  std::set<std::string> holders = content_store_.holders_of(media_file->chunks.front()->content_hash());
  for (std::size_t i = 1; i < media_file->chunks.size() && !holders.empty(); ++i) {
    std::set<std::string> chunk_holders = content_store_.holders_of(media_file->chunks[i]->content_hash());
    std::set<std::string> both;
    std::set_intersection(holders.begin(), holders.end(), chunk_holders.begin(), chunk_holders.end(),
                          std::inserter(both, both.begin()));
    holders.swap(both);
  }
  return holders;
}

void KnowledgeCatalog::count_access(const std::string& resource_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = resources_.find(resource_id);
  if (it != resources_.end()) {
    ++it->second.access_count;
  }
}

} // namespace knowledge
} // namespace wavemesh
