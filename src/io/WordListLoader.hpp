#ifndef WORD_LIST_LOADER_HPP
#define WORD_LIST_LOADER_HPP

#include "../encoders/text/WordList.hpp"
#include <memory>
#include <string>
#include <vector>

namespace GeoWords {

// Locations of the word list files. Files ending in .gz are decompressed.
struct WordListConfig {
    std::string threeWordPath;
    std::string fourWordPath;

    // Default file names inside a directory
    static WordListConfig fromDirectory(const std::string& directory);
    // Directory chosen at build time (GEOWORDS_DEFAULT_WORDS_DIR)
    static WordListConfig defaults();
};

// Base (unkeyed) lists of the three address variants
struct BaseWordLists {
    WordList threeWords;
    WordList fourWords;
    WordList sixWords;

    const WordList& forWordCount(size_t wordCount) const;
};

class WordListLoader {
public:
    // One word per line, surrounding whitespace trimmed, blank lines skipped.
    // Reads plain and gzip files through zlib. Throws WordListIOError.
    static std::vector<std::string> loadWords(const std::string& path);

    // Load, normalise and validate all three lists
    static std::shared_ptr<const BaseWordLists> loadBaseWordLists(const WordListConfig& config);
};

} // namespace GeoWords

#endif // WORD_LIST_LOADER_HPP
