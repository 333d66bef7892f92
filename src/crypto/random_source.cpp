#include "crypto/random_source.hpp"
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <limits>

namespace wavemesh::crypto {

std::vector<uint8_t> RandomSource::bytes(size_t length) {
  std::vector<uint8_t> out(length);
  if (length > 0) {
    fill(out.data(), out.size());
  }
  return out;
}

void SecureRandomSource::fill(uint8_t* buffer, size_t length) {
  if (length > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw RandomError("request too large");
  }

  if (RAND_bytes(buffer, static_cast<int>(length)) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Random source: RAND_bytes failed for " << length << " bytes";
    throw RandomError("failed to generate random bytes");
  }
}

} // namespace wavemesh::crypto
