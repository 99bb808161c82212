#include "WordHasher.hpp"
#include "core/GeoWordsConstants.hpp"
#include "core/GeoWordsError.hpp"
#include "encoders/geo/GeohashCodec.hpp"
#include "encoders/numeric/IntegerPacker.hpp"
#include "encoders/text/KeyedPermuter.hpp"
#include "utils/CoordinateParser.hpp"
#include <stdexcept>

namespace GeoWords {

WordHasher::WordHasher(std::shared_ptr<const BaseWordLists> baseLists, std::optional<std::string> key)
    : baseLists_(std::move(baseLists)) {
    if (!baseLists_) {
        throw std::invalid_argument("WordHasher requires loaded word lists");
    }
    if (KeyedPermuter::hasKey(key)) {
        key_ = std::move(key);
    }
    threeWords_ = KeyedPermuter::permute(baseLists_->threeWords, key_);
    fourWords_ = KeyedPermuter::permute(baseLists_->fourWords, key_);
    sixWords_ = KeyedPermuter::permute(baseLists_->sixWords, key_);
}

const WordList& WordHasher::wordList(size_t wordCount) const {
    switch (wordCount) {
        case 3: return threeWords_;
        case 4: return fourWords_;
        case 6: return sixWords_;
        default:
            throw WordCountMismatchError("Cannot use a set of " + std::to_string(wordCount) +
                                         " words; expected 3, 4 or 6");
    }
}

std::string WordHasher::encode(double latitude, double longitude, size_t wordCount) const {
    const std::string geohash = GeohashCodec::encode(latitude, longitude, GEOHASH_PRECISION);
    return indicesToAddress(IntegerPacker::toIndices(IntegerPacker::stringToInteger(geohash), wordCount),
                            wordCount);
}

std::string WordHasher::encode(const std::string& coordinates, size_t wordCount) const {
    const auto latLon = parseCoordinates(coordinates);
    return encode(latLon.first, latLon.second, wordCount);
}

std::vector<std::string> WordHasher::splitAddress(const std::string& address) {
    std::vector<std::string> tokens(1);
    for (char c : address) {
        if (c == ADDRESS_SEPARATOR || c == ADDRESS_ALT_SEPARATOR) {
            tokens.emplace_back();
        } else {
            tokens.back() += c;
        }
    }
    return tokens;
}

std::vector<uint32_t> WordHasher::addressToIndices(const std::string& address, size_t wordCount) const {
    const std::vector<std::string> tokens = splitAddress(address);
    if (tokens.size() != wordCount) {
        throw WordCountMismatchError("Address '" + address + "' has " + std::to_string(tokens.size()) +
                                     " words, expected " + std::to_string(wordCount));
    }
    return lookupIndices(tokens, wordCount);
}

std::string WordHasher::indicesToAddress(const std::vector<uint32_t>& indices, size_t wordCount) const {
    const WordList& list = wordList(wordCount);
    if (indices.size() != wordCount) {
        throw WordCountMismatchError("Expected " + std::to_string(wordCount) + " indices, got " +
                                     std::to_string(indices.size()));
    }
    std::string address;
    for (uint32_t index : indices) {
        if (!address.empty()) address += ADDRESS_SEPARATOR;
        address += list.wordAt(index);
    }
    return address;
}

std::pair<double, double> WordHasher::decode(const std::string& address) const {
    const std::vector<std::string> tokens = splitAddress(address);
    const size_t count = tokens.size();
    if (count != 3 && count != 4 && count != 6) {
        throw WordCountMismatchError("Cannot decode a set of " + std::to_string(count) + " words");
    }
    return decodeTokens(tokens, count);
}

std::pair<double, double> WordHasher::decode(const std::string& address, size_t wordCount) const {
    const std::vector<std::string> tokens = splitAddress(address);
    const size_t count = tokens.size();
    if (count != 3 && count != 4 && count != 6) {
        throw WordCountMismatchError("Cannot decode a set of " + std::to_string(count) + " words");
    }
    if (count != wordCount) {
        throw WordCountMismatchError("Address has " + std::to_string(count) + " words but " +
                                     std::to_string(wordCount) + " were declared");
    }
    return decodeTokens(tokens, count);
}

std::vector<uint32_t> WordHasher::lookupIndices(const std::vector<std::string>& tokens, size_t wordCount) const {
    const WordList& list = wordList(wordCount);
    std::vector<uint32_t> indices;
    indices.reserve(tokens.size());
    for (const auto& token : tokens) {
        auto index = list.indexOf(token);
        if (!index) {
            throw UnknownWordError(token, wordCount);
        }
        indices.push_back(static_cast<uint32_t>(*index));
    }
    return indices;
}

std::pair<double, double> WordHasher::decodeTokens(const std::vector<std::string>& tokens, size_t wordCount) const {
    const uint64_t value = IntegerPacker::fromIndices(lookupIndices(tokens, wordCount), wordCount);
    return GeohashCodec::decode(IntegerPacker::integerToGeohash(value, GEOHASH_PRECISION));
}

} // namespace GeoWords
