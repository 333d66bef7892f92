#ifndef WAVEMESH_MESSAGING_MESSAGE_ROUTER_HPP
#define WAVEMESH_MESSAGING_MESSAGE_ROUTER_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "address/address_registry.hpp"
#include "mesh/mesh_error.hpp"
#include "routing/path_router.hpp"

namespace wavemesh {
namespace messaging {

// A payload carried between two addresses, stored in the recipient's inbox in encoded form
struct PrivateMessage {
  std::string message_id;  // first 16 chars of the signature
  std::string signature;   // hex SHA-256 over payload, wavelength, send time and sender
  address::NodeAddress sender;
  address::NodeAddress recipient;
  std::vector<uint8_t> payload;
  double wavelength_nm = 0.0;
  double energy_cost = 0.0;  // joules of one photon at wavelength_nm
  routing::Path path;
  std::chrono::system_clock::time_point sent;

  std::size_t hops() const { return path.empty() ? 0 : path.size() - 1; }
};

struct SendResult {
  MeshError error = MeshError::SUCCESS;
  std::string message_id;
  std::size_t hops = 0;
  double energy_cost = 0.0;
  routing::Path path;

  bool ok() const { return error == MeshError::SUCCESS; }
};

struct MessagingStats {
  uint64_t messages_sent = 0;
  uint64_t messages_failed = 0;
  uint64_t payload_bytes = 0;
  double total_energy = 0.0;
};

class MessageRouter {
public:
  // Delete copy constructor and assignment operator
  MessageRouter(const MessageRouter&) = delete;
  MessageRouter& operator=(const MessageRouter&) = delete;


  // ---- CONSTRUCTOR ----
  MessageRouter(const routing::PathRouter& router, const address::AddressRegistry& registry);


  // ---- SENDING ----
  // Encodes the payload for the pair of addresses and files it in the recipient's inbox when
  // the mesh connects them. Unregistered addresses give UNKNOWN_NODE, disconnected ones
  // NO_ROUTE. Throws std::invalid_argument for a non-positive wavelength.
  SendResult send(const address::NodeAddress& sender, const address::NodeAddress& recipient,
                  const std::string& payload, double wavelength_nm);


  // ---- INBOXES ----
  std::vector<PrivateMessage> inbox(const std::string& routing_key) const;
  std::vector<PrivateMessage> inbox(const address::NodeAddress& recipient) const;
  // Plain payload of a message
  static std::string decode(const PrivateMessage& message);


  // ---- ENCODING ----
  // XOR with a keystream seeded by SHA-256(sender hash + recipient hash + wavelength);
  // applying it twice restores the input
  static std::vector<uint8_t> transform(const address::NodeAddress& sender, const address::NodeAddress& recipient,
                                        double wavelength_nm, const std::vector<uint8_t>& data);


  // ---- STATISTICS ----
  // Messages held across all inboxes
  std::size_t queued_messages() const;
  MessagingStats stats() const;

private:
  // ---- PARAMETERS ----
  const routing::PathRouter& router_;
  const address::AddressRegistry& registry_;

  std::map<std::string, std::vector<PrivateMessage>> inboxes_;
  uint64_t sequence_ = 0;
  MessagingStats stats_;
  mutable std::mutex mutex_;

  SendResult fail(MeshError error, const address::NodeAddress& sender, const address::NodeAddress& recipient);
};

} // namespace messaging
} // namespace wavemesh

#endif // WAVEMESH_MESSAGING_MESSAGE_ROUTER_HPP
