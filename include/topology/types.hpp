#ifndef WAVEMESH_TOPOLOGY_TYPES_HPP
#define WAVEMESH_TOPOLOGY_TYPES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "address/node_address.hpp"

namespace wavemesh::topology {

enum class NodeRole : uint8_t {
    EDGE,
    RELAY,
    GATEWAY,
    CACHE
};

enum class Transport : uint8_t {
    BLE,
    WIFI,
    LORA
};

const char* to_string(NodeRole role);
const char* to_string(Transport transport);
std::optional<NodeRole> parse_role(const std::string& text);
std::optional<Transport> parse_transport(const std::string& text);

// Measured quality of a link
struct LinkAttributes {
    Transport transport = Transport::WIFI;
    double signal_dbm = -60.0;
    double latency_ms = 50.0;
    double bandwidth_kbps = 1000.0;

    // Weighted 0..1 score: signal over -100..-30 dBm, latency over 0..1000 ms,
    // bandwidth saturating at 10 Mbps
    double quality() const;
};

// Undirected link; node_a < node_b
struct Link {
    std::string node_a;
    std::string node_b;
    LinkAttributes attributes;

    bool connects(const std::string& a, const std::string& b) const {
        return (node_a == a && node_b == b) || (node_a == b && node_b == a);
    }
    double quality() const { return attributes.quality(); }
};

struct Node {
    std::string id;
    NodeRole role = NodeRole::EDGE;
    address::NodeAddress address;
    std::vector<Transport> transports;
    std::set<std::string> neighbors;  // sorted, so traversal order is canonical
    uint64_t cache_capacity_bytes = 0;
    double uptime_hours = 0.0;
};

struct CoverageStats {
    std::size_t node_count = 0;
    std::size_t link_count = 0;
    double avg_neighbors = 0.0;
    double density = 0.0;  // links / (n * (n - 1) / 2)
    std::map<std::string, std::size_t> transport_histogram;
    std::map<std::string, std::size_t> role_histogram;
};

} // namespace wavemesh::topology

#endif // WAVEMESH_TOPOLOGY_TYPES_HPP
