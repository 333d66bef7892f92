#ifndef WAVEMESH_ADDRESS_NODE_ADDRESS_HPP
#define WAVEMESH_ADDRESS_NODE_ADDRESS_HPP

#include <array>
#include <cstddef>
#include <string>

namespace wavemesh::address {

// Routing identity of a node: a spectral signature vector and a hash derived from it.
// Carries no hostname or IP; the routing key is the only name the mesh routes on.
struct NodeAddress {
  static constexpr size_t SIGNATURE_REGIONS = 8;
  static constexpr size_t KEY_HASH_CHARS = 8;

  std::string node_id;
  std::array<double, SIGNATURE_REGIONS> signature{};
  std::string hash;  // hex SHA-256

  // "λ:<two hex digits per region>:<first 8 hash chars>"
  std::string to_routing_key() const;

  bool empty() const { return hash.empty(); }

  bool operator==(const NodeAddress& other) const {
    return node_id == other.node_id && signature == other.signature && hash == other.hash;
  }
  bool operator!=(const NodeAddress& other) const { return !(*this == other); }
};

} // namespace wavemesh::address

#endif // WAVEMESH_ADDRESS_NODE_ADDRESS_HPP
