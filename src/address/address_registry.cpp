#include "address/address_registry.hpp"
#include "crypto/hash.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace wavemesh {
namespace address {

//==============================================
// NODE ADDRESS
//==============================================

std::string NodeAddress::to_routing_key() const {
  std::stringstream ss;
  ss << "λ:";
  for (double amplitude : signature) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(amplitude * 255);
  }
  ss << ":" << hash.substr(0, KEY_HASH_CHARS);
  return ss.str();
}


//==============================================
// CONSTRUCTOR
//==============================================

AddressRegistry::AddressRegistry(crypto::RandomSource& random)
  : random_(random) {
  BOOST_LOG_TRIVIAL(debug) << "Address registry: initialized";
}


//==============================================
// ADDRESS DERIVATION
//==============================================

NodeAddress AddressRegistry::generate_address(const std::string& node_id, const std::vector<uint8_t>& seed) {
  if (node_id.empty()) {
    throw std::invalid_argument("Address registry: node id must not be empty");
  }
  if (seed.empty()) {
    throw std::invalid_argument("Address registry: seed must not be empty");
  }

  NodeAddress address;
  address.node_id = node_id;

  // One digest per spectral region: SHA-256(seed || region index), top 53 bits as a fraction
  double total = 0.0;
  for (size_t region = 0; region < NodeAddress::SIGNATURE_REGIONS; ++region) {
    std::vector<uint8_t> material(seed);
    material.push_back(static_cast<uint8_t>(region));
    crypto::Digest digest = crypto::sha256(material);

    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
      value = (value << 8) | digest[i];
    }
    double amplitude = static_cast<double>(value >> 11) / static_cast<double>(1ULL << 53);
    address.signature[region] = amplitude;
    total += amplitude;
  }

  for (double& amplitude : address.signature) {
    amplitude = total > 0.0 ? amplitude / total : 1.0 / NodeAddress::SIGNATURE_REGIONS;
  }

  // Hash covers the node id and the big-endian bit patterns of the signature
  std::string material = node_id;
  for (double amplitude : address.signature) {
    uint64_t bits = 0;
    std::memcpy(&bits, &amplitude, sizeof(bits));
    for (int shift = 56; shift >= 0; shift -= 8) {
      material.push_back(static_cast<char>((bits >> shift) & 0xFF));
    }
  }
  address.hash = crypto::sha256_hex(material);

  return address;
}

NodeAddress AddressRegistry::create_address(const std::string& node_id) {
  std::vector<uint8_t> seed = random_.bytes(SEED_SIZE);
  NodeAddress address = generate_address(node_id, seed);
  BOOST_LOG_TRIVIAL(debug) << "Address registry: created address " << address.to_routing_key()
                           << " for node: " << node_id;
  return address;
}


//==============================================
// REGISTRATION
//==============================================

bool AddressRegistry::register_address(const NodeAddress& address) {
  if (address.node_id.empty() || address.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Address registry: refusing incomplete address";
    return false;
  }

  std::string routing_key = address.to_routing_key();
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (by_node_.count(address.node_id) != 0 || by_hash_.count(address.hash) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Address registry: address already registered for node: " << address.node_id;
    return false;
  }

  auto taken = by_routing_key_.find(routing_key);
  if (taken != by_routing_key_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Address registry: routing key " << routing_key << " of " << address.node_id
                               << " already belongs to " << taken->second;
    return false;
  }

  by_node_[address.node_id] = address;
  by_routing_key_[routing_key] = address.node_id;
  by_hash_[address.hash] = address.node_id;

  BOOST_LOG_TRIVIAL(info) << "Address registry: registered " << address.node_id
                          << " as " << routing_key;
  return true;
}

bool AddressRegistry::unregister(const std::string& node_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = by_node_.find(node_id);
  if (it == by_node_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Address registry: cannot unregister unknown node: " << node_id;
    return false;
  }

  by_routing_key_.erase(it->second.to_routing_key());
  by_hash_.erase(it->second.hash);
  by_node_.erase(it);

  BOOST_LOG_TRIVIAL(info) << "Address registry: unregistered node: " << node_id;
  return true;
}


//==============================================
// LOOKUP
//==============================================

std::optional<std::string> AddressRegistry::resolve(const std::string& routing_key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = by_routing_key_.find(routing_key);
  if (it == by_routing_key_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> AddressRegistry::resolve(const NodeAddress& address) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = by_hash_.find(address.hash);
  if (it == by_hash_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<NodeAddress> AddressRegistry::address_of(const std::string& node_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = by_node_.find(node_id);
  if (it == by_node_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t AddressRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return by_node_.size();
}


//==============================================
// NAME BLOCKING
//==============================================

void AddressRegistry::block_name(const std::string& name) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  blocked_names_.insert(name);
  BOOST_LOG_TRIVIAL(info) << "Address registry: name reported blocked: " << name;
}

bool AddressRegistry::is_blocked(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return blocked_names_.count(name) != 0;
}

} // namespace address
} // namespace wavemesh
