#ifndef WAVEMESH_CRYPTO_HASH_HPP
#define WAVEMESH_CRYPTO_HASH_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace wavemesh::crypto {

static constexpr size_t DIGEST_SIZE = 32;  // SHA-256
using Digest = std::array<uint8_t, DIGEST_SIZE>;

// SHA-256 over a byte range using OpenSSL EVP, throws DigestError on failure
Digest sha256(const void* data, size_t length);
Digest sha256(const std::string& data);
Digest sha256(const std::vector<uint8_t>& data);

// Lower-case hex rendering
std::string to_hex(const uint8_t* data, size_t length);
std::string to_hex(const Digest& digest);

std::string sha256_hex(const void* data, size_t length);
std::string sha256_hex(const std::string& data);

// Counter-mode expansion of a seed: block k = SHA-256(seed || k as 8 big-endian bytes)
std::vector<uint8_t> sha256_keystream(const Digest& seed, uint64_t length);

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 for streamed input
class Sha256Stream {
public:
  Sha256Stream();
  ~Sha256Stream();

  Sha256Stream(const Sha256Stream&) = delete;
  Sha256Stream& operator=(const Sha256Stream&) = delete;

  void update(const void* data, size_t length);
  // Finishes the digest; the stream must not be updated afterwards
  Digest finalize();

private:
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

} // namespace wavemesh::crypto

#endif // WAVEMESH_CRYPTO_HASH_HPP
