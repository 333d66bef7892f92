#ifndef WAVEMESH_STORE_CHUNK_HPP
#define WAVEMESH_STORE_CHUNK_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace wavemesh {
namespace store {

// Fixed-size, content-addressed piece of a media file. Identity fields are immutable;
// holder and travel bookkeeping is guarded by the chunk's own mutex because deliveries
// to different nodes may update the same chunk concurrently.
class Chunk {
public:
  Chunk(std::string chunk_id, std::string file_id, std::size_t index, std::size_t total_chunks,
        uint64_t size, std::string content_hash, double wavelength_nm, double energy_cost_per_hop);

  Chunk(const Chunk&) = delete;
  Chunk& operator=(const Chunk&) = delete;


  // ---- IDENTITY ----
  const std::string& chunk_id() const { return chunk_id_; }
  const std::string& file_id() const { return file_id_; }
  std::size_t index() const { return index_; }
  std::size_t total_chunks() const { return total_chunks_; }
  uint64_t size() const { return size_; }
  const std::string& content_hash() const { return content_hash_; }
  double wavelength_nm() const { return wavelength_nm_; }
  double energy_cost_per_hop() const { return energy_cost_per_hop_; }


  // ---- HOLDER TRACKING ----
  // Node ids only; the chunk never owns or outlives the caches that hold it
  void add_holder(const std::string& node_id);
  bool remove_holder(const std::string& node_id);
  bool held_by(const std::string& node_id) const;
  std::set<std::string> holders() const;


  // ---- TRAVEL HISTORY ----
  // Appends the path and adds its hop count to the running total
  void record_delivery(const std::vector<std::string>& path);
  std::vector<std::vector<std::string>> paths() const;
  uint64_t total_hops() const;
  double total_energy_spent() const;

private:
  // ---- PARAMETERS ----
  const std::string chunk_id_;
  const std::string file_id_;
  const std::size_t index_;
  const std::size_t total_chunks_;
  const uint64_t size_;
  const std::string content_hash_;
  const double wavelength_nm_;
  const double energy_cost_per_hop_;

  std::set<std::string> holders_;
  std::vector<std::vector<std::string>> paths_;
  uint64_t total_hops_ = 0;
  mutable std::mutex mutex_;
};

using ChunkPtr = std::shared_ptr<Chunk>;

struct FileMetadata {
  std::string file_type;
  std::string description;
  std::string category;
};

struct MediaFile {
  std::string file_id;
  std::string filename;
  uint64_t size = 0;
  std::string content_hash;
  FileMetadata metadata;
  std::vector<ChunkPtr> chunks;
  std::chrono::system_clock::time_point uploaded;

  // Cost to move every chunk across a single hop
  double energy_cost_single_hop() const;
  // Energy actually spent by all deliveries so far
  double energy_spent_all_hops() const;
};

using MediaFilePtr = std::shared_ptr<const MediaFile>;

} // namespace store
} // namespace wavemesh

#endif // WAVEMESH_STORE_CHUNK_HPP
