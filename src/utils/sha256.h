#ifndef GEOWORDS_UTILS_SHA256_H
#define GEOWORDS_UTILS_SHA256_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace GeoWords {

// Incremental SHA-256 (FIPS 180-4)
class SHA256 {
public:
    using Digest = std::array<uint8_t, 32>;

    SHA256();
    void update(const uint8_t* data, size_t len);
    void update(const std::string& data);
    Digest digest();          // finalises and resets
    std::string hexdigest();  // 64 lowercase hex chars
    void reset();

    // One-shot lowercase hex digest of a string
    static std::string hex(const std::string& message);

private:
    uint32_t state_[8];
    uint64_t bitlen_;
    uint8_t block_[64];
    size_t blockLen_;
    void transform(const uint8_t* chunk);
};

} // namespace GeoWords

#endif // GEOWORDS_UTILS_SHA256_H
