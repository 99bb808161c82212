#ifndef WORD_LIST_HPP
#define WORD_LIST_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace GeoWords {

// Immutable ordered vocabulary; a word's position is its index.
// The reverse map is built once so lookups do not scan the list.
class WordList {
public:
    WordList() = default;
    // Throws DuplicateWordError if a word appears twice
    explicit WordList(std::vector<std::string> words);

    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }

    // Throws std::out_of_range for an index past the end
    const std::string& wordAt(size_t index) const;
    std::optional<size_t> indexOf(const std::string& word) const;
    bool contains(const std::string& word) const { return wordToIndex_.count(word) != 0; }

    const std::vector<std::string>& words() const { return words_; }

private:
    std::vector<std::string> words_;
    std::unordered_map<std::string, size_t> wordToIndex_;
};

} // namespace GeoWords

#endif // WORD_LIST_HPP
