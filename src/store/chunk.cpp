#include "store/chunk.hpp"

namespace wavemesh {
namespace store {

Chunk::Chunk(std::string chunk_id, std::string file_id, std::size_t index, std::size_t total_chunks,
             uint64_t size, std::string content_hash, double wavelength_nm, double energy_cost_per_hop)
  : chunk_id_(std::move(chunk_id))
  , file_id_(std::move(file_id))
  , index_(index)
  , total_chunks_(total_chunks)
  , size_(size)
  , content_hash_(std::move(content_hash))
  , wavelength_nm_(wavelength_nm)
  , energy_cost_per_hop_(energy_cost_per_hop) {
}

void Chunk::add_holder(const std::string& node_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  holders_.insert(node_id);
}

bool Chunk::remove_holder(const std::string& node_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return holders_.erase(node_id) != 0;
}

bool Chunk::held_by(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return holders_.count(node_id) != 0;
}

std::set<std::string> Chunk::holders() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return holders_;
}

void Chunk::record_delivery(const std::vector<std::string>& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  paths_.push_back(path);
  if (!path.empty()) {
    total_hops_ += path.size() - 1;
  }
}

std::vector<std::vector<std::string>> Chunk::paths() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return paths_;
}

uint64_t Chunk::total_hops() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_hops_;
}

double Chunk::total_energy_spent() const {
  return energy_cost_per_hop_ * static_cast<double>(total_hops());
}


//==============================================
// MEDIA FILE
//==============================================

double MediaFile::energy_cost_single_hop() const {
  double total = 0.0;
  for (const auto& chunk : chunks) {
    total += chunk->energy_cost_per_hop();
  }
  return total;
}

double MediaFile::energy_spent_all_hops() const {
  double total = 0.0;
  for (const auto& chunk : chunks) {
    total += chunk->total_energy_spent();
  }
  return total;
}

} // namespace store
} // namespace wavemesh
