#include "routing/path_router.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <deque>
#include <map>
#include <set>

namespace wavemesh {
namespace routing {

PathRouter::PathRouter(const topology::TopologyGraph& graph, const address::AddressRegistry& registry)
  : graph_(graph)
  , registry_(registry) {
}

Path PathRouter::route(const address::NodeAddress& source, const address::NodeAddress& destination) const {
  auto source_id = registry_.resolve(source);
  auto destination_id = registry_.resolve(destination);
  if (!source_id || !destination_id) {
    BOOST_LOG_TRIVIAL(debug) << "Path router: Address does not map to a known node";
    return {};
  }
  return route_nodes(*source_id, *destination_id);
}

Path PathRouter::route(const std::string& source_key, const std::string& destination_key) const {
  auto source_id = registry_.resolve(source_key);
  auto destination_id = registry_.resolve(destination_key);
  if (!source_id || !destination_id) {
    BOOST_LOG_TRIVIAL(debug) << "Path router: Routing key does not map to a known node";
    return {};
  }
  return route_nodes(*source_id, *destination_id);
}

Path PathRouter::route_nodes(const std::string& source_id, const std::string& destination_id) const {
  Path path;

  graph_.read([&](const topology::TopologyGraph::NodeMap& nodes) {
    if (nodes.count(source_id) == 0 || nodes.count(destination_id) == 0) {
      return;
    }

    // Parent links double as the visited set
    std::map<std::string, std::string> parent;
    std::deque<std::string> queue;
    parent[source_id] = source_id;
    queue.push_back(source_id);

    bool found = false;
    while (!queue.empty() && !found) {
      std::string current = queue.front();
      queue.pop_front();

      if (current == destination_id) {
        found = true;
        break;
      }

      auto node = nodes.find(current);
      if (node == nodes.end()) {
        continue;
      }

      for (const auto& neighbor : node->second.neighbors) {
        if (parent.count(neighbor) != 0) {
          continue;
        }
        parent[neighbor] = current;
        queue.push_back(neighbor);
      }
    }

    if (!found) {
      return;
    }

    for (std::string at = destination_id; ; at = parent[at]) {
      path.push_back(at);
      if (at == source_id) {
        break;
      }
    }
    std::reverse(path.begin(), path.end());
  });

  if (path.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Path router: No route from " << source_id << " to " << destination_id;
  } else {
    BOOST_LOG_TRIVIAL(trace) << "Path router: Route " << source_id << " -> " << destination_id
                             << " in " << path.size() - 1 << " hops";
  }
  return path;
}

std::optional<std::size_t> PathRouter::hop_distance(const std::string& source_id, const std::string& destination_id) const {
  Path path = route_nodes(source_id, destination_id);
  if (path.empty()) {
    return std::nullopt;
  }
  return path.size() - 1;
}

std::optional<std::string> PathRouter::nearest(const std::string& origin_id,
                                               const std::function<bool(const std::string&)>& accept) const {
  std::optional<std::string> result;

  graph_.read([&](const topology::TopologyGraph::NodeMap& nodes) {
    if (nodes.count(origin_id) == 0) {
      return;
    }

    std::set<std::string> visited{origin_id};
    std::deque<std::string> queue{origin_id};

    while (!queue.empty()) {
      std::string current = queue.front();
      queue.pop_front();

      if (accept(current)) {
        result = current;
        return;
      }

      auto node = nodes.find(current);
      if (node == nodes.end()) {
        continue;
      }
      for (const auto& neighbor : node->second.neighbors) {
        if (visited.insert(neighbor).second) {
          queue.push_back(neighbor);
        }
      }
    }
  });

  return result;
}

} // namespace routing
} // namespace wavemesh
