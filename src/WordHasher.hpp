#ifndef GEOWORDS_WORD_HASHER_HPP
#define GEOWORDS_WORD_HASHER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "encoders/text/WordList.hpp"
#include "io/WordListLoader.hpp"

namespace GeoWords {

// Converts coordinates into 3, 4 or 6 word addresses and back.
//
// A WordHasher binds one key to the three keyed word lists for its whole
// lifetime; build one per key and reuse it. All methods are const and safe
// to call from several threads at once.
class WordHasher {
public:
    explicit WordHasher(std::shared_ptr<const BaseWordLists> baseLists,
                        std::optional<std::string> key = std::nullopt);

    // coordinates -> geohash (9 symbols) -> integer -> indices -> words
    // Throws CoordinateFormatError for out-of-range coordinates and
    // WordCountMismatchError for a word count other than 3, 4 or 6.
    std::string encode(double latitude, double longitude, size_t wordCount = 3) const;
    // Accepts "lat lon", "lat,lon" or "lat, lon"
    std::string encode(const std::string& coordinates, size_t wordCount = 3) const;

    std::string threeWords(double latitude, double longitude) const { return encode(latitude, longitude, 3); }
    std::string fourWords(double latitude, double longitude) const { return encode(latitude, longitude, 4); }
    std::string sixWords(double latitude, double longitude) const { return encode(latitude, longitude, 6); }

    // Address ('-' or '.' separated) -> centre of its geohash cell.
    // The variant is taken from the number of words.
    //
    // The key is not recorded in the address. Decoding with a different key
    // either yields a different location or fails with UnknownWordError,
    // exactly like a malformed address would.
    std::pair<double, double> decode(const std::string& address) const;
    // Same, but the address must have exactly wordCount words
    std::pair<double, double> decode(const std::string& address, size_t wordCount) const;

    // Word positions of an address in the keyed lists
    std::vector<uint32_t> addressToIndices(const std::string& address, size_t wordCount) const;
    std::string indicesToAddress(const std::vector<uint32_t>& indices, size_t wordCount) const;

    // Splits on '-' and '.'
    static std::vector<std::string> splitAddress(const std::string& address);

    const WordList& wordList(size_t wordCount) const;
    bool hasKey() const { return key_.has_value(); }

private:
    std::vector<uint32_t> lookupIndices(const std::vector<std::string>& tokens, size_t wordCount) const;
    std::pair<double, double> decodeTokens(const std::vector<std::string>& tokens, size_t wordCount) const;

    std::shared_ptr<const BaseWordLists> baseLists_;
    std::optional<std::string> key_;
    WordList threeWords_;
    WordList fourWords_;
    WordList sixWords_;
};

} // namespace GeoWords

#endif // GEOWORDS_WORD_HASHER_HPP
