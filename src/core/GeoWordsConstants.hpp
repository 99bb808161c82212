#ifndef GEOWORDS_CONSTANTS_HPP
#define GEOWORDS_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>

namespace GeoWords {

// Base-32 geohash alphabet; a symbol's position is its digit value
extern const char GEOHASH_ALPHABET[33];

// Every address is derived from a geohash of this many characters
constexpr int GEOHASH_PRECISION = 9;

// Seed of the build-time normalisation shuffle. Not secret, never the user key.
extern const uint32_t WORD_LIST_SHUFFLE_SEED;

// Required word list lengths per address variant
constexpr size_t THREE_WORD_LIST_SIZE = size_t(1) << 15;
constexpr size_t FOUR_WORD_LIST_SIZE = size_t(1) << 12;
constexpr size_t SIX_WORD_LIST_SIZE = size_t(1) << 8;

// Address separator, plus the alternative accepted on decode
constexpr char ADDRESS_SEPARATOR = '-';
constexpr char ADDRESS_ALT_SEPARATOR = '.';

extern const char* const THREE_WORD_LIST_FILE;
extern const char* const FOUR_WORD_LIST_FILE;

} // namespace GeoWords

#endif // GEOWORDS_CONSTANTS_HPP
