#ifndef WAVEMESH_CRYPTO_ERROR_HPP
#define WAVEMESH_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace wavemesh::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError("Digest error: " + message) {}
};

class RandomError : public CryptoError {
public:
    explicit RandomError(const std::string& message)
        : CryptoError("Random source error: " + message) {}
};

} // namespace wavemesh::crypto

#endif // WAVEMESH_CRYPTO_ERROR_HPP
