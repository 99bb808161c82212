#ifndef HUMAN_WORD_LIST_HPP
#define HUMAN_WORD_LIST_HPP

#include <string>
#include <vector>

namespace GeoWords {

// Fixed 256-word vocabulary of the 6-word variant, in index order
const std::vector<std::string>& humanWordList();

} // namespace GeoWords

#endif // HUMAN_WORD_LIST_HPP
