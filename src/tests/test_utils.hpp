#ifndef WAVEMESH_TEST_UTILS_HPP
#define WAVEMESH_TEST_UTILS_HPP

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto/random_source.hpp"

namespace wavemesh::test {

// Only errors reach the console while tests run
inline void quiet_logging() {
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= boost::log::trivial::error
    );
}

// Deterministic seed material: every call yields a different but reproducible buffer
class CountingRandomSource : public crypto::RandomSource {
public:
    explicit CountingRandomSource(uint8_t start = 1) : next_(start) {}

    void fill(uint8_t* buffer, size_t length) override {
        for (size_t i = 0; i < length; ++i) {
            buffer[i] = static_cast<uint8_t>(next_ + i * 7);
        }
        ++next_;
    }

private:
    uint8_t next_;
};

// Source that always fails, for exercising error propagation
class FailingRandomSource : public crypto::RandomSource {
public:
    void fill(uint8_t*, size_t) override {
        throw crypto::RandomError("random source exhausted");
    }
};

// 150 KiB: two full chunks and a 22528 byte tail
static constexpr uint64_t THREE_CHUNK_FILE_SIZE = 150 * 1024;

} // namespace wavemesh::test

#endif // WAVEMESH_TEST_UTILS_HPP
