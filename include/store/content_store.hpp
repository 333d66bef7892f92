#pragma once

#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "store/chunk.hpp"
#include "store/energy_model.hpp"

namespace wavemesh {
namespace store {

class ContentStore {
public:
  static constexpr std::size_t FILE_ID_CHARS = 12;
  // Upper bound on chunks synthesized for one registered file
  static constexpr uint64_t MAX_SYNTHESIZED_CHUNKS = 1u << 20;

  // Delete copy constructor and assignment operator
  ContentStore(const ContentStore&) = delete;
  ContentStore& operator=(const ContentStore&) = delete;


  // ---- CONSTRUCTOR ----
  explicit ContentStore(const ChunkingParameters& params = {});


  // ---- REGISTRATION ----
  // Registers a file whose bytes are simulated from its content identity. Without an explicit
  // identity the file name and size define it, so differently named files never share bytes.
  // Two files given the same identity produce identical chunks at identical indices.
  // Registering an already known file id returns the existing file.
  // Throws std::invalid_argument when the size needs more than MAX_SYNTHESIZED_CHUNKS chunks.
  MediaFilePtr register_file(const std::string& filename, uint64_t size,
                             const FileMetadata& metadata = {},
                             const std::optional<std::string>& content_identity = std::nullopt);
  // Chunks and hashes real bytes read from the stream
  MediaFilePtr register_stream(const std::string& filename, std::istream& input,
                               const FileMetadata& metadata = {});


  // ---- QUERY OPERATIONS ----
  MediaFilePtr file(const std::string& file_id) const;
  std::vector<MediaFilePtr> files() const;
  std::vector<MediaFilePtr> files_by_category(const std::string& category) const;
  // Every chunk, from any file, carrying the given content hash
  std::vector<ChunkPtr> chunks_with_hash(const std::string& content_hash) const;
  // Union of holders over all chunks sharing the hash
  std::set<std::string> holders_of(const std::string& content_hash) const;
  std::size_t file_count() const;
  std::size_t total_chunks() const;
  std::size_t distinct_contents() const;
  // File count per category
  std::map<std::string, std::size_t> library_summary() const;
  const ChunkingParameters& parameters() const { return params_; }


  // ---- HOLDER MAINTENANCE ----
  // Drops a departed node from every chunk's holder set
  void forget_holder(const std::string& node_id);


  // ---- CAS SUPPORT ----
  // First 12 hex chars of SHA-256(filename)
  static std::string make_file_id(const std::string& filename);
  // Deterministic chunk bytes for a content identity and chunk position
  static std::vector<uint8_t> synthesize_chunk(const std::string& content_identity,
                                               std::size_t index, uint64_t size);

private:
  // ---- PARAMETERS ----
  ChunkingParameters params_;

  std::map<std::string, MediaFilePtr> files_;
  std::map<std::string, std::vector<ChunkPtr>> content_index_;
  std::size_t total_chunks_ = 0;
  mutable std::mutex mutex_;


  // ---- CHUNKING ----
  ChunkPtr make_chunk(const std::string& file_id, std::size_t index, std::size_t total_chunks,
                      uint64_t size, const std::string& content_hash) const;
  uint64_t chunk_count_for(uint64_t size) const;
  // Inserts the file and indexes its chunks, or returns the file already stored under its id
  MediaFilePtr commit(std::shared_ptr<MediaFile> media_file);
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace wavemesh
