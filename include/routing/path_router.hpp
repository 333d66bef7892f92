#ifndef WAVEMESH_ROUTING_PATH_ROUTER_HPP
#define WAVEMESH_ROUTING_PATH_ROUTER_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "address/address_registry.hpp"
#include "topology/topology_graph.hpp"

namespace wavemesh {
namespace routing {

using Path = std::vector<std::string>;

// Shortest hop-count routing over the mesh graph. Routes are keyed by node addresses only;
// no name service is ever consulted.
class PathRouter {
public:
  // ---- CONSTRUCTOR ----
  PathRouter(const topology::TopologyGraph& graph, const address::AddressRegistry& registry);


  // ---- ROUTING ----
  // Breadth-first search between the nodes owning the two addresses. Neighbors are visited
  // in sorted id order, so equal-length alternatives always resolve the same way.
  // Empty when either address is unknown or the nodes are disconnected.
  Path route(const address::NodeAddress& source, const address::NodeAddress& destination) const;
  Path route(const std::string& source_key, const std::string& destination_key) const;
  Path route_nodes(const std::string& source_id, const std::string& destination_id) const;

  // Hop count of route_nodes(), nullopt when unreachable
  std::optional<std::size_t> hop_distance(const std::string& source_id, const std::string& destination_id) const;

  // Closest node to origin (origin included, at distance 0) accepted by the predicate
  std::optional<std::string> nearest(const std::string& origin_id,
                                     const std::function<bool(const std::string&)>& accept) const;

private:
  // ---- PARAMETERS ----
  const topology::TopologyGraph& graph_;
  const address::AddressRegistry& registry_;
};

} // namespace routing
} // namespace wavemesh

#endif // WAVEMESH_ROUTING_PATH_ROUTER_HPP
