#include "WordList.hpp"
#include "../../core/GeoWordsError.hpp"
#include <stdexcept>
#include <utility>

namespace GeoWords {

WordList::WordList(std::vector<std::string> words) : words_(std::move(words)) {
    wordToIndex_.reserve(words_.size());
    for (size_t i = 0; i < words_.size(); ++i) {
        if (!wordToIndex_.emplace(words_[i], i).second) {
            throw DuplicateWordError("Duplicate word '" + words_[i] + "' at positions " +
                                     std::to_string(wordToIndex_[words_[i]]) + " and " + std::to_string(i));
        }
    }
}

const std::string& WordList::wordAt(size_t index) const {
    if (index >= words_.size()) {
        throw std::out_of_range("Word index " + std::to_string(index) + " is outside a list of " +
                                std::to_string(words_.size()) + " words");
    }
    return words_[index];
}

std::optional<size_t> WordList::indexOf(const std::string& word) const {
    auto it = wordToIndex_.find(word);
    if (it == wordToIndex_.end()) return std::nullopt;
    return it->second;
}

} // namespace GeoWords
