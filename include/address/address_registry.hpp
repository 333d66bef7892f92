#ifndef WAVEMESH_ADDRESS_REGISTRY_HPP
#define WAVEMESH_ADDRESS_REGISTRY_HPP

#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>
#include "address/node_address.hpp"
#include "crypto/random_source.hpp"

namespace wavemesh {
namespace address {

class AddressRegistry {
public:
  static constexpr size_t SEED_SIZE = 32;

  // Delete copy constructor and assignment operator
  AddressRegistry(const AddressRegistry&) = delete;
  AddressRegistry& operator=(const AddressRegistry&) = delete;


  // ---- CONSTRUCTOR ----
  explicit AddressRegistry(crypto::RandomSource& random);


  // ---- ADDRESS DERIVATION ----
  // Derives an address from a seed. The same (node_id, seed) always yields the same address.
  static NodeAddress generate_address(const std::string& node_id, const std::vector<uint8_t>& seed);
  // Draws a fresh seed from the random source and derives the address
  NodeAddress create_address(const std::string& node_id);


  // ---- REGISTRATION ----
  // Fails if the node id or the address hash is already registered
  bool register_address(const NodeAddress& address);
  bool unregister(const std::string& node_id);


  // ---- LOOKUP ----
  std::optional<std::string> resolve(const std::string& routing_key) const;
  std::optional<std::string> resolve(const NodeAddress& address) const;
  std::optional<NodeAddress> address_of(const std::string& node_id) const;
  std::size_t size() const;


  // ---- NAME BLOCKING ----
  // Records DNS-style names reported as blocked. Routing never consults this list.
  void block_name(const std::string& name);
  bool is_blocked(const std::string& name) const;

private:
  // ---- PARAMETERS ----
  crypto::RandomSource& random_;

  std::map<std::string, NodeAddress> by_node_;
  std::map<std::string, std::string> by_routing_key_;
  std::map<std::string, std::string> by_hash_;
  std::set<std::string> blocked_names_;
  mutable std::shared_mutex mutex_;
};

} // namespace address
} // namespace wavemesh

#endif // WAVEMESH_ADDRESS_REGISTRY_HPP
