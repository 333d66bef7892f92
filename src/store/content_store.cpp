#include "store/content_store.hpp"
#include "crypto/hash.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <stdexcept>

namespace wavemesh {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

ContentStore::ContentStore(const ChunkingParameters& params) : params_(params) {
  if (params_.chunk_size == 0) {
    throw std::invalid_argument("Content store: chunk size must be positive");
  }
  if (!(params_.min_wavelength_nm > 0.0) || params_.max_wavelength_nm < params_.min_wavelength_nm) {
    throw std::invalid_argument("Content store: invalid wavelength range");
  }
  BOOST_LOG_TRIVIAL(info) << "Content store: Initialized with chunk size " << params_.chunk_size << " bytes";
}


//==============================================
// REGISTRATION
//==============================================

MediaFilePtr ContentStore::register_file(const std::string& filename, uint64_t size,
                                         const FileMetadata& metadata,
                                         const std::optional<std::string>& content_identity) {
  BOOST_LOG_TRIVIAL(info) << "Content store: Registering file: " << filename << " (" << size << " bytes)";

  uint64_t chunk_count = chunk_count_for(size);
  if (chunk_count > MAX_SYNTHESIZED_CHUNKS) {
    BOOST_LOG_TRIVIAL(error) << "Content store: " << filename << " needs " << chunk_count
                             << " chunks, limit is " << MAX_SYNTHESIZED_CHUNKS;
    throw std::invalid_argument("Content store: file too large to synthesize: " + filename);
  }

  std::string file_id = make_file_id(filename);
  if (auto existing = file(file_id)) {
    BOOST_LOG_TRIVIAL(debug) << "Content store: File already registered: " << file_id;
    return existing;
  }

  // The identity stands in for the file's bytes
  std::string identity;
  if (content_identity) {
    identity = *content_identity;
  } else {
    crypto::Digest seed = crypto::sha256("FILE_CONTENT_" + filename + "_" + std::to_string(size));
    identity.assign(seed.begin(), seed.end());
  }

  auto media_file = std::make_shared<MediaFile>();
  media_file->file_id = file_id;
  media_file->filename = filename;
  media_file->size = size;
  media_file->content_hash = crypto::sha256_hex(identity);
  media_file->metadata = metadata;
  media_file->uploaded = std::chrono::system_clock::now();

  auto total = static_cast<std::size_t>(chunk_count);
  media_file->chunks.reserve(total);
  for (std::size_t i = 0; i < total; ++i) {
    uint64_t chunk_size = (i == total - 1) ? size - i * params_.chunk_size : params_.chunk_size;
    std::vector<uint8_t> bytes = synthesize_chunk(identity, i, chunk_size);
    media_file->chunks.push_back(make_chunk(file_id, i, total, chunk_size, crypto::sha256_hex(bytes.data(), bytes.size())));
  }

  return commit(std::move(media_file));
}

MediaFilePtr ContentStore::register_stream(const std::string& filename, std::istream& input,
                                           const FileMetadata& metadata) {
  BOOST_LOG_TRIVIAL(info) << "Content store: Registering stream for file: " << filename;

  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Invalid input stream provided for file: " << filename;
    throw StoreError("Content store: Invalid input stream");
  }

  std::string file_id = make_file_id(filename);
  if (auto existing = file(file_id)) {
    BOOST_LOG_TRIVIAL(debug) << "Content store: File already registered: " << file_id;
    return existing;
  }

  crypto::Sha256Stream file_digest;
  std::vector<char> buffer(params_.chunk_size);
  std::vector<std::pair<uint64_t, std::string>> pieces;
  uint64_t total_size = 0;

  // Read input stream in chunk-sized pieces, handling the final partial piece
  while (true) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize got = input.gcount();
    if (got <= 0) {
      break;
    }
    file_digest.update(buffer.data(), static_cast<size_t>(got));
    pieces.emplace_back(static_cast<uint64_t>(got), crypto::sha256_hex(buffer.data(), static_cast<size_t>(got)));
    total_size += static_cast<uint64_t>(got);
    if (!input) {
      break;
    }
  }

  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Read error on stream for file: " << filename;
    throw StoreError("Content store: Failed to read input stream");
  }

  auto media_file = std::make_shared<MediaFile>();
  media_file->file_id = file_id;
  media_file->filename = filename;
  media_file->size = total_size;
  media_file->content_hash = crypto::to_hex(file_digest.finalize());
  media_file->metadata = metadata;
  media_file->uploaded = std::chrono::system_clock::now();

  media_file->chunks.reserve(pieces.size());
  for (std::size_t i = 0; i < pieces.size(); ++i) {
    media_file->chunks.push_back(make_chunk(file_id, i, pieces.size(), pieces[i].first, pieces[i].second));
  }

  return commit(std::move(media_file));
}


//==============================================
// QUERY OPERATIONS
//==============================================

MediaFilePtr ContentStore::file(const std::string& file_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = files_.find(file_id);
  if (it == files_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<MediaFilePtr> ContentStore::files() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<MediaFilePtr> result;
  result.reserve(files_.size());
  for (const auto& [id, media_file] : files_) {
    result.push_back(media_file);
  }
  return result;
}

std::vector<MediaFilePtr> ContentStore::files_by_category(const std::string& category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<MediaFilePtr> result;
  for (const auto& [id, media_file] : files_) {
    if (media_file->metadata.category == category) {
      result.push_back(media_file);
    }
  }
  return result;
}

std::vector<ChunkPtr> ContentStore::chunks_with_hash(const std::string& content_hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = content_index_.find(content_hash);
  if (it == content_index_.end()) {
    return {};
  }
  return it->second;
}

std::set<std::string> ContentStore::holders_of(const std::string& content_hash) const {
  std::set<std::string> holders;
  for (const auto& chunk : chunks_with_hash(content_hash)) {
    auto chunk_holders = chunk->holders();
    holders.insert(chunk_holders.begin(), chunk_holders.end());
  }
  return holders;
}

std::size_t ContentStore::file_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_.size();
}

std::size_t ContentStore::total_chunks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_chunks_;
}

std::size_t ContentStore::distinct_contents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return content_index_.size();
}

std::map<std::string, std::size_t> ContentStore::library_summary() const {
  std::map<std::string, std::size_t> summary{
    {"university", 0}, {"refugee", 0}, {"rural", 0}, {"crisis", 0}};

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, media_file] : files_) {
    if (!media_file->metadata.category.empty()) {
      ++summary[media_file->metadata.category];
    }
  }
  return summary;
}


//==============================================
// HOLDER MAINTENANCE
//==============================================

void ContentStore::forget_holder(const std::string& node_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t cleared = 0;
  for (auto& [hash, chunks] : content_index_) {
    for (auto& chunk : chunks) {
      if (chunk->remove_holder(node_id)) {
        ++cleared;
      }
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Content store: Cleared node " << node_id << " from " << cleared << " holder sets";
}


//==============================================
// CAS SUPPORT
//==============================================

std::string ContentStore::make_file_id(const std::string& filename) {
  return crypto::sha256_hex(filename).substr(0, FILE_ID_CHARS);
}

std::vector<uint8_t> ContentStore::synthesize_chunk(const std::string& content_identity,
                                                    std::size_t index, uint64_t size) {
  crypto::Digest chunk_seed = crypto::sha256(content_identity + "_chunk_" + std::to_string(index));
  return crypto::sha256_keystream(chunk_seed, size);
}


//==============================================
// CHUNKING
//==============================================

ChunkPtr ContentStore::make_chunk(const std::string& file_id, std::size_t index, std::size_t total_chunks,
                                  uint64_t size, const std::string& content_hash) const {
  double wavelength = assign_wavelength(index, total_chunks, params_);
  double cost = energy_cost_per_hop(size, wavelength, params_.energy_multiplier);
  return std::make_shared<Chunk>(file_id + "_chunk_" + std::to_string(index), file_id, index, total_chunks,
                                 size, content_hash, wavelength, cost);
}

uint64_t ContentStore::chunk_count_for(uint64_t size) const {
  return size / params_.chunk_size + (size % params_.chunk_size != 0 ? 1 : 0);
}

MediaFilePtr ContentStore::commit(std::shared_ptr<MediaFile> media_file) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto existing = files_.find(media_file->file_id);
  if (existing != files_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Content store: Lost registration race for file: " << media_file->file_id;
    return existing->second;
  }

  std::size_t shared = 0;
  for (const auto& chunk : media_file->chunks) {
    auto& entry = content_index_[chunk->content_hash()];
    if (!entry.empty()) {
      ++shared;
    }
    entry.push_back(chunk);
  }
  total_chunks_ += media_file->chunks.size();

  BOOST_LOG_TRIVIAL(info) << "Content store: Registered file " << media_file->filename
                          << " as " << media_file->file_id << " with " << media_file->chunks.size()
                          << " chunks (" << shared << " already indexed)";

  MediaFilePtr stored = media_file;
  files_.emplace(stored->file_id, stored);
  return stored;
}

} // namespace store
} // namespace wavemesh
