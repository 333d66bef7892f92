#ifndef WAVEMESH_TOPOLOGY_GRAPH_HPP
#define WAVEMESH_TOPOLOGY_GRAPH_HPP

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include "mesh/mesh_error.hpp"
#include "topology/types.hpp"

namespace wavemesh {
namespace topology {

class TopologyGraph {
public:
  using NodeMap = std::map<std::string, Node>;

  // Delete copy constructor and assignment operator
  TopologyGraph(const TopologyGraph&) = delete;
  TopologyGraph& operator=(const TopologyGraph&) = delete;

  TopologyGraph() = default;


  // ---- NODE MANAGEMENT ----
  // Adds a node; its neighbor set is ignored, links are created by connect()
  MeshError add_node(Node node);
  // Removes the node and every link touching it
  MeshError remove_node(const std::string& node_id);


  // ---- LINK MANAGEMENT ----
  // Creates a bidirectional link and updates both neighbor sets
  MeshError connect(const std::string& a, const std::string& b, const LinkAttributes& attributes);
  MeshError disconnect(const std::string& a, const std::string& b);


  // ---- QUERY OPERATIONS ----
  bool has_node(const std::string& node_id) const;
  std::optional<Node> node(const std::string& node_id) const;
  std::vector<std::string> node_ids() const;
  std::set<std::string> neighbors(const std::string& node_id) const;
  std::optional<Link> link(const std::string& a, const std::string& b) const;
  std::vector<Link> links() const;
  std::size_t node_count() const;
  std::size_t link_count() const;
  CoverageStats coverage_stats() const;

  // Runs reader against the node map while holding the shared lock, so a traversal
  // never observes a half-applied mutation
  void read(const std::function<void(const NodeMap&)>& reader) const;

private:
  using LinkKey = std::pair<std::string, std::string>;
  static LinkKey make_key(const std::string& a, const std::string& b);

  // ---- PARAMETERS ----
  NodeMap nodes_;
  std::map<LinkKey, Link> links_;
  mutable std::shared_mutex mutex_;
};

} // namespace topology
} // namespace wavemesh

#endif // WAVEMESH_TOPOLOGY_GRAPH_HPP
