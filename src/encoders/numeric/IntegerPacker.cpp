#include "IntegerPacker.hpp"
#include "../../core/GeoWordsConstants.hpp"
#include "../../core/GeoWordsError.hpp"
#include <algorithm>
#include <stdexcept>

namespace GeoWords {

namespace {

constexpr uint64_t BASE = 32;

int symbolValue(char symbol) {
    for (int i = 0; i < 32; ++i) {
        if (GEOHASH_ALPHABET[i] == symbol) return i;
    }
    return -1;
}

} // namespace

uint64_t IntegerPacker::stringToInteger(const std::string& geohash) {
    if (geohash.size() > MAX_GEOHASH_LENGTH) {
        throw InvalidSymbolError("Geohash '" + geohash + "' is longer than " +
                                 std::to_string(MAX_GEOHASH_LENGTH) + " symbols");
    }
    uint64_t number = 0;
    for (char symbol : geohash) {
        int digit = symbolValue(symbol);
        if (digit < 0) {
            throw InvalidSymbolError(std::string("Invalid geohash symbol '") + symbol + "' in '" + geohash + "'");
        }
        number = number * BASE + static_cast<uint64_t>(digit);
    }
    return number;
}

std::string IntegerPacker::integerToString(uint64_t value) {
    std::string symbols;
    while (value > 0) {
        symbols.push_back(GEOHASH_ALPHABET[value % BASE]);
        value /= BASE;
    }
    std::reverse(symbols.begin(), symbols.end());
    return symbols;
}

std::string IntegerPacker::integerToGeohash(uint64_t value, size_t width) {
    std::string symbols = integerToString(value);
    if (symbols.size() < width) {
        symbols.insert(symbols.begin(), width - symbols.size(), GEOHASH_ALPHABET[0]);
    }
    return symbols;
}

std::vector<uint32_t> IntegerPacker::splitBits(uint64_t value, unsigned groupBits, size_t groupCount) {
    if (groupBits == 0 || groupBits > 32 || groupBits * groupCount > 64) {
        throw std::invalid_argument("splitBits: unsupported layout of " + std::to_string(groupCount) +
                                    " x " + std::to_string(groupBits) + " bits");
    }
    const uint64_t mask = (uint64_t(1) << groupBits) - 1;
    std::vector<uint32_t> groups(groupCount);
    for (size_t i = 0; i < groupCount; ++i) {
        const unsigned shift = groupBits * static_cast<unsigned>(groupCount - 1 - i);
        groups[i] = static_cast<uint32_t>((value >> shift) & mask);
    }
    return groups;
}

uint64_t IntegerPacker::joinBits(const std::vector<uint32_t>& groups, unsigned groupBits) {
    if (groupBits == 0 || groupBits > 32 || groupBits * groups.size() > 64) {
        throw std::invalid_argument("joinBits: unsupported layout of " + std::to_string(groups.size()) +
                                    " x " + std::to_string(groupBits) + " bits");
    }
    const uint64_t mask = (uint64_t(1) << groupBits) - 1;
    uint64_t value = 0;
    for (uint32_t group : groups) {
        value = (value << groupBits) | (static_cast<uint64_t>(group) & mask);
    }
    return value;
}

PackingLayout IntegerPacker::layoutFor(size_t wordCount) {
    switch (wordCount) {
        case 3: return {3, 15, false};  // 45 bits, the native width of a 9-symbol geohash
        case 4: return {4, 12, true};   // 48 padded bits
        case 6: return {6, 8, true};    // 48 padded bits
        default:
            throw WordCountMismatchError("Cannot use a set of " + std::to_string(wordCount) +
                                         " words; expected 3, 4 or 6");
    }
}

std::vector<uint32_t> IntegerPacker::toIndices(uint64_t geohashValue, size_t wordCount) {
    const PackingLayout layout = layoutFor(wordCount);
    const uint64_t value = layout.padded ? pad(geohashValue) : geohashValue;
    return splitBits(value, layout.groupBits, layout.wordCount);
}

uint64_t IntegerPacker::fromIndices(const std::vector<uint32_t>& indices, size_t wordCount) {
    const PackingLayout layout = layoutFor(wordCount);
    if (indices.size() != layout.wordCount) {
        throw WordCountMismatchError("Expected " + std::to_string(layout.wordCount) + " indices, got " +
                                     std::to_string(indices.size()));
    }
    const uint64_t value = joinBits(indices, layout.groupBits);
    return layout.padded ? unpad(value) : value;
}

} // namespace GeoWords
