#include "KeyedPermuter.hpp"
#include "../../utils/sha256.h"
#include <algorithm>
#include <utility>

namespace GeoWords {

std::vector<std::string> KeyedPermuter::permute(const std::vector<std::string>& words,
                                                const std::optional<std::string>& key) {
    if (!hasKey(key)) return words;

    std::vector<std::pair<std::string, const std::string*>> hashed;
    hashed.reserve(words.size());
    SHA256 sha;
    for (const auto& word : words) {
        sha.update(*key);
        sha.update(word);
        hashed.emplace_back(sha.hexdigest(), &word);
    }
    std::stable_sort(hashed.begin(), hashed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> ordered;
    ordered.reserve(words.size());
    for (const auto& entry : hashed) {
        ordered.push_back(*entry.second);
    }
    return ordered;
}

WordList KeyedPermuter::permute(const WordList& list, const std::optional<std::string>& key) {
    if (!hasKey(key)) return list;
    return WordList(permute(list.words(), key));
}

} // namespace GeoWords
