#include "topology/types.hpp"
#include <algorithm>

namespace wavemesh::topology {

const char* to_string(NodeRole role) {
    switch (role) {
        case NodeRole::EDGE: return "edge";
        case NodeRole::RELAY: return "relay";
        case NodeRole::GATEWAY: return "gateway";
        case NodeRole::CACHE: return "cache";
        default: return "unknown";
    }
}

const char* to_string(Transport transport) {
    switch (transport) {
        case Transport::BLE: return "ble";
        case Transport::WIFI: return "wifi";
        case Transport::LORA: return "lora";
        default: return "unknown";
    }
}

std::optional<NodeRole> parse_role(const std::string& text) {
    if (text == "edge") return NodeRole::EDGE;
    if (text == "relay") return NodeRole::RELAY;
    if (text == "gateway") return NodeRole::GATEWAY;
    if (text == "cache") return NodeRole::CACHE;
    return std::nullopt;
}

std::optional<Transport> parse_transport(const std::string& text) {
    if (text == "ble") return Transport::BLE;
    if (text == "wifi") return Transport::WIFI;
    if (text == "lora") return Transport::LORA;
    return std::nullopt;
}

double LinkAttributes::quality() const {
    double signal_norm = std::min(1.0, (signal_dbm + 100.0) / 70.0);
    double latency_norm = std::max(0.0, 1.0 - latency_ms / 1000.0);
    double bandwidth_norm = std::min(1.0, bandwidth_kbps / 10000.0);
    return signal_norm * 0.4 + latency_norm * 0.3 + bandwidth_norm * 0.3;
}

} // namespace wavemesh::topology
