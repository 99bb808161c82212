#ifndef KEYED_PERMUTER_HPP
#define KEYED_PERMUTER_HPP

#include "WordList.hpp"
#include <optional>
#include <string>
#include <vector>

namespace GeoWords {

// Key-dependent ordering of a word list: words are sorted by the lowercase
// hex SHA-256 of key + word. No key (or an empty key) keeps the input order.
//
// The sort is stable, so two words with colliding digests keep their base
// order. Collisions are not expected in practice.
class KeyedPermuter {
public:
    static std::vector<std::string> permute(const std::vector<std::string>& words,
                                            const std::optional<std::string>& key);

    static WordList permute(const WordList& list, const std::optional<std::string>& key);

    static bool hasKey(const std::optional<std::string>& key) { return key && !key->empty(); }
};

} // namespace GeoWords

#endif // KEYED_PERMUTER_HPP
