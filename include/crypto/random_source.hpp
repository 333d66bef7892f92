#ifndef WAVEMESH_CRYPTO_RANDOM_SOURCE_HPP
#define WAVEMESH_CRYPTO_RANDOM_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "crypto_error.hpp"

namespace wavemesh::crypto {

// Source of seed material for node addresses
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Fills the buffer with random bytes, throws RandomError if the source fails
  virtual void fill(uint8_t* buffer, size_t length) = 0;

  std::vector<uint8_t> bytes(size_t length);
};

// Cryptographically secure source backed by OpenSSL RAND_bytes
class SecureRandomSource : public RandomSource {
public:
  void fill(uint8_t* buffer, size_t length) override;
};

} // namespace wavemesh::crypto

#endif // WAVEMESH_CRYPTO_RANDOM_SOURCE_HPP
