#include "crypto/hash.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>

namespace wavemesh::crypto {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

Digest sha256(const void* data, size_t length) {
  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    BOOST_LOG_TRIVIAL(error) << "Hash: Failed to create digest context";
    throw DigestError("failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw DigestError("failed to initialize hash context");
  }

  if (length > 0 && !EVP_DigestUpdate(ctx.get(), data, length)) {
    throw DigestError("failed to update hash");
  }

  Digest digest{};
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) || digest_len != DIGEST_SIZE) {
    throw DigestError("failed to finalize hash");
  }

  return digest;
}

Digest sha256(const std::string& data) {
  return sha256(data.data(), data.size());
}

Digest sha256(const std::vector<uint8_t>& data) {
  return sha256(data.data(), data.size());
}

std::string to_hex(const uint8_t* data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::string to_hex(const Digest& digest) {
  return to_hex(digest.data(), digest.size());
}

std::string sha256_hex(const void* data, size_t length) {
  return to_hex(sha256(data, length));
}

std::string sha256_hex(const std::string& data) {
  return to_hex(sha256(data));
}

//==============================================
// INCREMENTAL DIGEST
//==============================================

struct DigestContext {
  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx;
};

Sha256Stream::Sha256Stream()
  : context_(std::make_unique<DigestContext>()) {
  context_->ctx.reset(EVP_MD_CTX_new());
  if (!context_->ctx) {
    throw DigestError("failed to create hash context");
  }
  if (!EVP_DigestInit_ex(context_->ctx.get(), EVP_sha256(), nullptr)) {
    throw DigestError("failed to initialize hash context");
  }
}

Sha256Stream::~Sha256Stream() = default;

void Sha256Stream::update(const void* data, size_t length) {
  if (finalized_) {
    throw DigestError("update after finalize");
  }
  if (length > 0 && !EVP_DigestUpdate(context_->ctx.get(), data, length)) {
    throw DigestError("failed to update hash");
  }
}

Digest Sha256Stream::finalize() {
  if (finalized_) {
    throw DigestError("digest already finalized");
  }
  Digest digest{};
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context_->ctx.get(), digest.data(), &digest_len) || digest_len != DIGEST_SIZE) {
    throw DigestError("failed to finalize hash");
  }
  finalized_ = true;
  return digest;
}

std::vector<uint8_t> sha256_keystream(const Digest& seed, uint64_t length) {
  std::vector<uint8_t> stream;
  stream.reserve(static_cast<size_t>(length));
  std::vector<uint8_t> block_input(seed.begin(), seed.end());
  block_input.resize(DIGEST_SIZE + 8);

  for (uint64_t counter = 0; stream.size() < length; ++counter) {
    for (size_t i = 0; i < 8; ++i) {
      block_input[DIGEST_SIZE + i] = static_cast<uint8_t>((counter >> (56 - 8 * i)) & 0xFF);
    }
    Digest block = sha256(block_input);
    size_t take = static_cast<size_t>(std::min<uint64_t>(block.size(), length - stream.size()));
    stream.insert(stream.end(), block.begin(), block.begin() + take);
  }

  return stream;
}

} // namespace wavemesh::crypto
