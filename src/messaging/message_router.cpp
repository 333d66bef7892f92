#include "messaging/message_router.hpp"
#include "crypto/hash.hpp"
#include "store/energy_model.hpp"
#include <boost/log/trivial.hpp>

namespace wavemesh {
namespace messaging {

//==============================================
// CONSTRUCTOR
//==============================================

MessageRouter::MessageRouter(const routing::PathRouter& router, const address::AddressRegistry& registry)
  : router_(router)
  , registry_(registry) {
  BOOST_LOG_TRIVIAL(info) << "Message router: initialized";
}


//==============================================
// SENDING
//==============================================

SendResult MessageRouter::send(const address::NodeAddress& sender, const address::NodeAddress& recipient,
                               const std::string& payload, double wavelength_nm) {
  double energy = store::photon_energy(wavelength_nm);

  if (!registry_.resolve(sender) || !registry_.resolve(recipient)) {
    return fail(MeshError::UNKNOWN_NODE, sender, recipient);
  }

  routing::Path path = router_.route(sender, recipient);
  if (path.empty()) {
    return fail(MeshError::NO_ROUTE, sender, recipient);
  }

  PrivateMessage message;
  message.sender = sender;
  message.recipient = recipient;
  message.payload = transform(sender, recipient, wavelength_nm,
                              std::vector<uint8_t>(payload.begin(), payload.end()));
  message.wavelength_nm = wavelength_nm;
  message.energy_cost = energy;
  message.path = std::move(path);
  message.sent = std::chrono::system_clock::now();

  std::lock_guard<std::mutex> lock(mutex_);

  // The sequence number keeps ids distinct within one clock tick
  crypto::Sha256Stream signature;
  signature.update(message.payload.data(), message.payload.size());
  std::string suffix = std::to_string(wavelength_nm) + std::to_string(message.sent.time_since_epoch().count())
                     + sender.hash + std::to_string(sequence_++);
  signature.update(suffix.data(), suffix.size());
  message.signature = crypto::to_hex(signature.finalize());
  message.message_id = message.signature.substr(0, 16);

  SendResult result;
  result.message_id = message.message_id;
  result.hops = message.hops();
  result.energy_cost = energy;
  result.path = message.path;

  ++stats_.messages_sent;
  stats_.payload_bytes += payload.size();
  stats_.total_energy += energy;
  inboxes_[recipient.to_routing_key()].push_back(std::move(message));

  BOOST_LOG_TRIVIAL(debug) << "Message router: " << result.message_id << " " << sender.node_id << " -> "
                           << recipient.node_id << " in " << result.hops << " hops at " << wavelength_nm << " nm";
  return result;
}


//==============================================
// INBOXES
//==============================================

std::vector<PrivateMessage> MessageRouter::inbox(const std::string& routing_key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = inboxes_.find(routing_key);
  if (it == inboxes_.end()) {
    return {};
  }
  return it->second;
}

std::vector<PrivateMessage> MessageRouter::inbox(const address::NodeAddress& recipient) const {
  return inbox(recipient.to_routing_key());
}

std::string MessageRouter::decode(const PrivateMessage& message) {
  std::vector<uint8_t> plain = transform(message.sender, message.recipient, message.wavelength_nm, message.payload);
  return std::string(plain.begin(), plain.end());
}


//==============================================
// ENCODING
//==============================================

std::vector<uint8_t> MessageRouter::transform(const address::NodeAddress& sender, const address::NodeAddress& recipient,
                                              double wavelength_nm, const std::vector<uint8_t>& data) {
  crypto::Digest key = crypto::sha256(sender.hash + recipient.hash + std::to_string(wavelength_nm));
  std::vector<uint8_t> output = crypto::sha256_keystream(key, data.size());
  for (std::size_t i = 0; i < data.size(); ++i) {
    output[i] ^= data[i];
  }
  return output;
}


//==============================================
// STATISTICS
//==============================================

std::size_t MessageRouter::queued_messages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t queued = 0;
  for (const auto& [key, messages] : inboxes_) {
    queued += messages.size();
  }
  return queued;
}

MessagingStats MessageRouter::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

SendResult MessageRouter::fail(MeshError error, const address::NodeAddress& sender,
                               const address::NodeAddress& recipient) {
  BOOST_LOG_TRIVIAL(warning) << "Message router: " << sender.node_id << " -> " << recipient.node_id
                             << " failed: " << mesh_error_to_string(error);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.messages_failed;
  }
  SendResult result;
  result.error = error;
  return result;
}

} // namespace messaging
} // namespace wavemesh
