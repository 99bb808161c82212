#ifndef INTEGER_PACKER_HPP
#define INTEGER_PACKER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace GeoWords {

// Bit layout of one address variant
struct PackingLayout {
    size_t wordCount;     // number of groups
    unsigned groupBits;   // width of each group
    bool padded;          // 3 low bits of slack reserved via pad()/unpad()
};

// Lossless conversions between a geohash string, its integer value and
// the per-word index groups of an address.
class IntegerPacker {
public:
    // Longest geohash whose value fits in 64 bits
    static constexpr size_t MAX_GEOHASH_LENGTH = 12;

    // Big-endian base-32 value of a geohash. Throws InvalidSymbolError.
    static uint64_t stringToInteger(const std::string& geohash);

    // Inverse of stringToInteger without leading-zero padding: 0 maps to "".
    static std::string integerToString(uint64_t value);

    // Same as integerToString, left-padded with '0' to a fixed width
    static std::string integerToGeohash(uint64_t value, size_t width);

    static uint64_t pad(uint64_t value) { return value << 3; }
    static uint64_t unpad(uint64_t value) { return value >> 3; }

    // Slice value into groupCount groups of groupBits, most significant first
    static std::vector<uint32_t> splitBits(uint64_t value, unsigned groupBits, size_t groupCount);
    static uint64_t joinBits(const std::vector<uint32_t>& groups, unsigned groupBits);

    // Layout for 3, 4 or 6 words. Throws WordCountMismatchError otherwise.
    static PackingLayout layoutFor(size_t wordCount);

    // geohash integer -> index tuple, padding first when the layout needs it
    static std::vector<uint32_t> toIndices(uint64_t geohashValue, size_t wordCount);
    // index tuple -> geohash integer
    static uint64_t fromIndices(const std::vector<uint32_t>& indices, size_t wordCount);
};

} // namespace GeoWords

#endif // INTEGER_PACKER_HPP
