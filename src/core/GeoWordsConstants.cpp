#include "GeoWordsConstants.hpp"

namespace GeoWords {

const char GEOHASH_ALPHABET[33] = "0123456789bcdefghjkmnpqrstuvwxyz";
const uint32_t WORD_LIST_SHUFFLE_SEED = 634634;

const char* const THREE_WORD_LIST_FILE = "three_word_list.txt";
const char* const FOUR_WORD_LIST_FILE = "four_word_list.txt";

} // namespace GeoWords
