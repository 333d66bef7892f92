#include "topology/topology_graph.hpp"
#include <boost/log/trivial.hpp>
#include <mutex>

namespace wavemesh {
namespace topology {

//==============================================
// NODE MANAGEMENT
//==============================================

MeshError TopologyGraph::add_node(Node node) {
  if (node.id.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Topology: Attempted to add node with empty id";
    return MeshError::INVALID_NODE;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (nodes_.count(node.id) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Topology: Node already present: " << node.id;
    return MeshError::DUPLICATE_NODE;
  }

  node.neighbors.clear();
  std::string id = node.id;
  BOOST_LOG_TRIVIAL(info) << "Topology: Added " << to_string(node.role) << " node: " << id;
  nodes_.emplace(id, std::move(node));
  return MeshError::SUCCESS;
}

MeshError TopologyGraph::remove_node(const std::string& node_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = nodes_.find(node_id);
  if (it == nodes_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Topology: Attempted to remove non-existent node: " << node_id;
    return MeshError::UNKNOWN_NODE;
  }

  // Sever links from the neighbors' side first
  for (const auto& neighbor_id : it->second.neighbors) {
    auto neighbor = nodes_.find(neighbor_id);
    if (neighbor != nodes_.end()) {
      neighbor->second.neighbors.erase(node_id);
    }
    links_.erase(make_key(node_id, neighbor_id));
  }

  std::size_t severed = it->second.neighbors.size();
  nodes_.erase(it);

  BOOST_LOG_TRIVIAL(info) << "Topology: Removed node " << node_id << " and " << severed << " links";
  return MeshError::SUCCESS;
}


//==============================================
// LINK MANAGEMENT
//==============================================

MeshError TopologyGraph::connect(const std::string& a, const std::string& b, const LinkAttributes& attributes) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto node_a = nodes_.find(a);
  auto node_b = nodes_.find(b);
  if (node_a == nodes_.end() || node_b == nodes_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Topology: Cannot connect " << a << " <-> " << b << ": unknown endpoint";
    return MeshError::UNKNOWN_NODE;
  }

  if (a == b) {
    BOOST_LOG_TRIVIAL(error) << "Topology: Refusing self-link on node: " << a;
    return MeshError::INVALID_LINK;
  }

  LinkKey key = make_key(a, b);
  if (links_.count(key) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Topology: Link already exists: " << a << " <-> " << b;
    return MeshError::INVALID_LINK;
  }

  links_.emplace(key, Link{key.first, key.second, attributes});
  node_a->second.neighbors.insert(b);
  node_b->second.neighbors.insert(a);

  BOOST_LOG_TRIVIAL(info) << "Topology: Connected " << a << " <-> " << b
                          << " over " << to_string(attributes.transport)
                          << " (quality " << attributes.quality() << ")";
  return MeshError::SUCCESS;
}

MeshError TopologyGraph::disconnect(const std::string& a, const std::string& b) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto node_a = nodes_.find(a);
  auto node_b = nodes_.find(b);
  if (node_a == nodes_.end() || node_b == nodes_.end()) {
    return MeshError::UNKNOWN_NODE;
  }

  if (links_.erase(make_key(a, b)) == 0) {
    BOOST_LOG_TRIVIAL(warning) << "Topology: No link to remove between " << a << " and " << b;
    return MeshError::INVALID_LINK;
  }

  node_a->second.neighbors.erase(b);
  node_b->second.neighbors.erase(a);

  BOOST_LOG_TRIVIAL(info) << "Topology: Disconnected " << a << " <-> " << b;
  return MeshError::SUCCESS;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool TopologyGraph::has_node(const std::string& node_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return nodes_.count(node_id) != 0;
}

std::optional<Node> TopologyGraph::node(const std::string& node_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = nodes_.find(node_id);
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> TopologyGraph::node_ids() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(nodes_.size());
  for (const auto& [id, node] : nodes_) {
    ids.push_back(id);
  }
  return ids;
}

std::set<std::string> TopologyGraph::neighbors(const std::string& node_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = nodes_.find(node_id);
  if (it == nodes_.end()) {
    return {};
  }
  return it->second.neighbors;
}

std::optional<Link> TopologyGraph::link(const std::string& a, const std::string& b) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = links_.find(make_key(a, b));
  if (it == links_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Link> TopologyGraph::links() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<Link> result;
  result.reserve(links_.size());
  for (const auto& [key, link] : links_) {
    result.push_back(link);
  }
  return result;
}

std::size_t TopologyGraph::node_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return nodes_.size();
}

std::size_t TopologyGraph::link_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return links_.size();
}

CoverageStats TopologyGraph::coverage_stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  CoverageStats stats;
  stats.node_count = nodes_.size();
  stats.link_count = links_.size();

  std::size_t total_neighbors = 0;
  for (const auto& [id, node] : nodes_) {
    total_neighbors += node.neighbors.size();
    ++stats.role_histogram[to_string(node.role)];
  }

  for (const auto& [key, link] : links_) {
    ++stats.transport_histogram[to_string(link.attributes.transport)];
  }

  if (stats.node_count > 0) {
    stats.avg_neighbors = static_cast<double>(total_neighbors) / static_cast<double>(stats.node_count);
  }
  if (stats.node_count > 1) {
    double n = static_cast<double>(stats.node_count);
    stats.density = static_cast<double>(stats.link_count) / (n * (n - 1.0) / 2.0);
  }

  return stats;
}

void TopologyGraph::read(const std::function<void(const NodeMap&)>& reader) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  reader(nodes_);
}

TopologyGraph::LinkKey TopologyGraph::make_key(const std::string& a, const std::string& b) {
  return a < b ? LinkKey{a, b} : LinkKey{b, a};
}

} // namespace topology
} // namespace wavemesh
