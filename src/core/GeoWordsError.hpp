#ifndef GEOWORDS_ERROR_HPP
#define GEOWORDS_ERROR_HPP

#include <stdexcept>
#include <string>

namespace GeoWords {

// Base class for every error raised by the address codec and its word lists
class GeoWordsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A geohash string contains a character outside the base-32 alphabet
class InvalidSymbolError : public GeoWordsError {
public:
    using GeoWordsError::GeoWordsError;
};

// Input coordinates do not parse into exactly two usable numbers
class CoordinateFormatError : public GeoWordsError {
public:
    using GeoWordsError::GeoWordsError;
};

// Address token count is not 3, 4 or 6, or disagrees with the declared variant
class WordCountMismatchError : public GeoWordsError {
public:
    using GeoWordsError::GeoWordsError;
};

// A decoded token is absent from the active word list.
// Decoding with the wrong key cannot be told apart from this.
class UnknownWordError : public GeoWordsError {
public:
    UnknownWordError(const std::string& word, size_t wordCount)
        : GeoWordsError("Unknown word '" + word + "' for the " + std::to_string(wordCount) + "-word list"),
          word_(word) {}

    const std::string& word() const { return word_; }

private:
    std::string word_;
};

// Word list construction errors
class InsufficientWordsError : public GeoWordsError {
public:
    using GeoWordsError::GeoWordsError;
};

class DuplicateWordError : public GeoWordsError {
public:
    using GeoWordsError::GeoWordsError;
};

// A word list file could not be opened or read
class WordListIOError : public GeoWordsError {
public:
    using GeoWordsError::GeoWordsError;
};

} // namespace GeoWords

#endif // GEOWORDS_ERROR_HPP
