#ifndef WORD_LIST_BUILDER_HPP
#define WORD_LIST_BUILDER_HPP

#include "WordList.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace GeoWords {

// Turns raw candidate words into the base list of one address variant.
class WordListBuilder {
public:
    // Shuffle with the fixed non-secret seed, truncate to requiredSize and
    // verify uniqueness. Throws InsufficientWordsError / DuplicateWordError.
    static WordList build(std::vector<std::string> rawWords, size_t requiredSize);

    // Validate a fixed vocabulary that is used in its given order.
    // The list must hold exactly requiredSize distinct words.
    static WordList buildFixed(std::vector<std::string> words, size_t requiredSize);

    // Fisher-Yates shuffle driven by std::mt19937. Bounded draws use
    // rejection sampling on the raw 32-bit output, so the order is the
    // same with every standard library. It is not the order that other
    // runtimes' seeded shuffles produce for the same seed.
    static void shuffle(std::vector<std::string>& words, uint32_t seed);
};

} // namespace GeoWords

#endif // WORD_LIST_BUILDER_HPP
