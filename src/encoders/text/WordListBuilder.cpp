#include "WordListBuilder.hpp"
#include "../../core/GeoWordsConstants.hpp"
#include "../../core/GeoWordsError.hpp"
#include <random>
#include <utility>

namespace GeoWords {

namespace {

// Uniform value in [0, bound) from raw generator output
uint32_t boundedDraw(std::mt19937& rng, uint32_t bound) {
    const uint64_t range = uint64_t(1) << 32;
    const uint64_t limit = range - (range % bound);
    uint64_t r;
    do {
        r = rng();
    } while (r >= limit);
    return static_cast<uint32_t>(r % bound);
}

} // namespace

void WordListBuilder::shuffle(std::vector<std::string>& words, uint32_t seed) {
    if (words.size() < 2) return;
    std::mt19937 rng(seed);
    for (size_t i = words.size() - 1; i > 0; --i) {
        const size_t j = boundedDraw(rng, static_cast<uint32_t>(i + 1));
        std::swap(words[i], words[j]);
    }
}

WordList WordListBuilder::build(std::vector<std::string> rawWords, size_t requiredSize) {
    if (rawWords.size() < requiredSize) {
        throw InsufficientWordsError("Word list has " + std::to_string(rawWords.size()) +
                                     " words, at least " + std::to_string(requiredSize) + " are required");
    }
    shuffle(rawWords, WORD_LIST_SHUFFLE_SEED);
    rawWords.resize(requiredSize);
    return WordList(std::move(rawWords));
}

WordList WordListBuilder::buildFixed(std::vector<std::string> words, size_t requiredSize) {
    if (words.size() < requiredSize) {
        throw InsufficientWordsError("Fixed vocabulary has " + std::to_string(words.size()) +
                                     " words, exactly " + std::to_string(requiredSize) + " are required");
    }
    if (words.size() > requiredSize) {
        throw GeoWordsError("Fixed vocabulary has " + std::to_string(words.size()) +
                            " words, exactly " + std::to_string(requiredSize) + " are required");
    }
    return WordList(std::move(words));
}

} // namespace GeoWords
