#ifndef WAVEMESH_KNOWLEDGE_CATALOG_HPP
#define WAVEMESH_KNOWLEDGE_CATALOG_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "cache/node_cache.hpp"
#include "mesh/mesh_error.hpp"
#include "routing/path_router.hpp"
#include "store/content_store.hpp"

namespace wavemesh {
namespace knowledge {

static constexpr int MIN_PRIORITY = 1;
static constexpr int MAX_PRIORITY = 10;
static constexpr std::size_t TOP_ACCESSED_COUNT = 5;

// An offline reference work (encyclopedia, course pack) stored as one content-store file
struct KnowledgeResource {
  std::string resource_id;
  std::string title;
  std::string category;
  int priority = MIN_PRIORITY;  // higher is more important to keep cached
  std::string file_id;
  std::string content_hash;
  uint64_t size = 0;
  uint64_t access_count = 0;
};

struct PlacementResult {
  MeshError error = MeshError::SUCCESS;
  std::string node_id;
  uint64_t used_bytes = 0;
  uint64_t capacity_bytes = 0;

  bool ok() const { return error == MeshError::SUCCESS; }
};

struct KnowledgeStats {
  std::size_t total_resources = 0;
  uint64_t total_bytes = 0;
  std::size_t total_cache_instances = 0;  // (resource, node) pairs with the full resource cached
  double avg_replication_factor = 0.0;
  std::map<std::string, std::size_t> categories;
  std::vector<std::pair<std::string, uint64_t>> top_accessed;  // title and access count
};

class KnowledgeCatalog {
public:
  // Delete copy constructor and assignment operator
  KnowledgeCatalog(const KnowledgeCatalog&) = delete;
  KnowledgeCatalog& operator=(const KnowledgeCatalog&) = delete;


  // ---- CONSTRUCTOR ----
  KnowledgeCatalog(store::ContentStore& content_store, cache::CacheDirectory& caches,
                   const routing::PathRouter& router);


  // ---- CATALOG ----
  // Registers the resource's bytes with the content store. An existing resource id is
  // returned unchanged. Throws std::invalid_argument for an empty id or size, or a
  // priority outside [MIN_PRIORITY, MAX_PRIORITY].
  KnowledgeResource add_resource(const std::string& resource_id, const std::string& title, uint64_t size,
                                 const std::string& category, int priority);
  std::optional<KnowledgeResource> resource(const std::string& resource_id) const;
  std::vector<KnowledgeResource> resources() const;
  bool verify_authenticity(const std::string& resource_id, const std::string& expected_hash) const;


  // ---- PLACEMENT ----
  // Caches every chunk of the resource on the node, or none of them when the cache cannot
  // take the rest. Counts as one access.
  PlacementResult cache_on_node(const std::string& resource_id, const std::string& node_id);
  // Nodes holding every chunk of the resource
  std::set<std::string> nodes_holding(const std::string& resource_id) const;
  // Closest node to the requester (the requester itself included) holding the whole resource.
  // A hit counts as one access.
  std::optional<std::string> find_nearest_cache(const std::string& resource_id, const std::string& requester_id);


  // ---- STATISTICS ----
  KnowledgeStats stats() const;

private:
  // ---- PARAMETERS ----
  store::ContentStore& content_store_;
  cache::CacheDirectory& caches_;
  const routing::PathRouter& router_;

  std::map<std::string, KnowledgeResource> resources_;
  mutable std::mutex mutex_;

  std::set<std::string> holders_of_file(const std::string& file_id) const;
  void count_access(const std::string& resource_id);
};

} // namespace knowledge
} // namespace wavemesh

#endif // WAVEMESH_KNOWLEDGE_CATALOG_HPP
