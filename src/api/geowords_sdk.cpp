#include "geowords_sdk.h"
#include "../WordHasher.hpp"
#include "../core/GeoWordsError.hpp"
#include "../debug_utils.hpp"
#include "../io/WordListLoader.hpp"
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace GeoWords;

#define GEOWORDS_SDK_VERSION "1.0.0"

namespace {

// Immutable snapshots, swapped with std::atomic_store
std::shared_ptr<const BaseWordLists> g_baseLists;
std::shared_ptr<const WordHasher> g_defaultHasher;

char* str_to_c(const std::string& str) {
    char* cstr = new char[str.length() + 1];
    std::memcpy(cstr, str.c_str(), str.length() + 1);
    return cstr;
}

GeowordsError make_error(int code, const std::string& message) {
    return {str_to_c(message), code};
}

GeowordsError success() {
    return {nullptr, GEOWORDS_SUCCESS};
}

// Maps the exception in flight to a status code
GeowordsError convert_current_exception() {
    try {
        throw;
    } catch (const UnknownWordError& e) {
        return make_error(GEOWORDS_ERROR_UNKNOWN_WORD, e.what());
    } catch (const WordCountMismatchError& e) {
        return make_error(GEOWORDS_ERROR_WORD_COUNT, e.what());
    } catch (const CoordinateFormatError& e) {
        return make_error(GEOWORDS_ERROR_COORDINATE_FORMAT, e.what());
    } catch (const InvalidSymbolError& e) {
        return make_error(GEOWORDS_ERROR_INVALID_SYMBOL, e.what());
    } catch (const InsufficientWordsError& e) {
        return make_error(GEOWORDS_ERROR_WORD_LIST, e.what());
    } catch (const DuplicateWordError& e) {
        return make_error(GEOWORDS_ERROR_WORD_LIST, e.what());
    } catch (const WordListIOError& e) {
        return make_error(GEOWORDS_ERROR_FILE_IO, e.what());
    } catch (const std::invalid_argument& e) {
        return make_error(GEOWORDS_ERROR_INVALID_ARGUMENT, e.what());
    } catch (const std::exception& e) {
        return make_error(GEOWORDS_ERROR_UNKNOWN, e.what());
    } catch (...) {
        return make_error(GEOWORDS_ERROR_UNKNOWN, "Unknown error");
    }
}

// Default hasher for a NULL key, otherwise a hasher bound to key
std::shared_ptr<const WordHasher> hasher_for(const char* key) {
    if (!key) {
        return std::atomic_load(&g_defaultHasher);
    }
    auto lists = std::atomic_load(&g_baseLists);
    if (!lists) return nullptr;
    return std::make_shared<const WordHasher>(lists, std::string(key));
}

} // namespace

void geowords_error_free(GeowordsError* error) {
    if (error && error->message) {
        delete[] error->message;
        error->message = nullptr;
    }
}

GeowordsError geowords_initialize(const char* words_dir) {
    try {
        const WordListConfig config = words_dir ? WordListConfig::fromDirectory(words_dir)
                                                : WordListConfig::defaults();
        auto lists = WordListLoader::loadBaseWordLists(config);
        auto hasher = std::make_shared<const WordHasher>(lists);
        std::atomic_store(&g_baseLists, lists);
        std::atomic_store(&g_defaultHasher, hasher);
        return success();
    } catch (...) {
        return convert_current_exception();
    }
}

GeowordsError geowords_set_key(const char* key) {
    try {
        auto lists = std::atomic_load(&g_baseLists);
        if (!lists) {
            return make_error(GEOWORDS_ERROR_NOT_INITIALIZED, "geowords_initialize() has not been called");
        }
        std::optional<std::string> newKey;
        if (key) newKey = std::string(key);
        auto hasher = std::make_shared<const WordHasher>(lists, newKey);
        std::atomic_store(&g_defaultHasher, hasher);
        return success();
    } catch (...) {
        return convert_current_exception();
    }
}

GeowordsError geowords_set_verbose(int verbose) {
    DebugUtils::setVerbose(verbose != 0);
    return success();
}

GeowordsError geowords_encode(double latitude, double longitude, int word_count,
                              const char* key, char** address) {
    try {
        if (!address) {
            return make_error(GEOWORDS_ERROR_INVALID_ARGUMENT, "Invalid arguments (null pointers)");
        }
        if (word_count < 0) {
            return make_error(GEOWORDS_ERROR_WORD_COUNT, "Word count must be 3, 4 or 6");
        }
        auto hasher = hasher_for(key);
        if (!hasher) {
            return make_error(GEOWORDS_ERROR_NOT_INITIALIZED, "geowords_initialize() has not been called");
        }
        const std::string result = hasher->encode(latitude, longitude, static_cast<size_t>(word_count));
        DebugUtils::printMessage("ENCODE", "(" + std::to_string(latitude) + ", " + std::to_string(longitude) +
                                           ") -> " + result);
        *address = str_to_c(result);
        return success();
    } catch (...) {
        return convert_current_exception();
    }
}

GeowordsError geowords_decode(const char* address, int word_count, const char* key,
                              double* latitude, double* longitude) {
    try {
        if (!address || !latitude || !longitude) {
            return make_error(GEOWORDS_ERROR_INVALID_ARGUMENT, "Invalid arguments (null pointers)");
        }
        if (word_count < 0) {
            return make_error(GEOWORDS_ERROR_WORD_COUNT, "Word count must be 0, 3, 4 or 6");
        }
        auto hasher = hasher_for(key);
        if (!hasher) {
            return make_error(GEOWORDS_ERROR_NOT_INITIALIZED, "geowords_initialize() has not been called");
        }
        const auto coords = word_count == 0 ? hasher->decode(address)
                                            : hasher->decode(address, static_cast<size_t>(word_count));
        *latitude = coords.first;
        *longitude = coords.second;
        return success();
    } catch (...) {
        return convert_current_exception();
    }
}

void geowords_string_free(char* str) {
    delete[] str;
}

const char* geowords_version(void) {
    return GEOWORDS_SDK_VERSION;
}
