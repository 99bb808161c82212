#ifndef GEOWORDS_SDK_H
#define GEOWORDS_SDK_H

#include "geowords_export.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @file geowords_sdk.h
 * @brief C interface to the GeoWords address codec
 *
 * Call geowords_initialize() once before any other function. Encoding and
 * decoding without an explicit key use the process-wide default hasher,
 * which geowords_set_key() replaces atomically.
 */

/* ===== Error Handling ===== */

typedef enum {
    GEOWORDS_SUCCESS = 0,
    GEOWORDS_ERROR_INVALID_ARGUMENT = -1,
    GEOWORDS_ERROR_NOT_INITIALIZED = -2,
    GEOWORDS_ERROR_FILE_IO = -3,
    GEOWORDS_ERROR_INVALID_SYMBOL = -4,
    GEOWORDS_ERROR_COORDINATE_FORMAT = -5,
    GEOWORDS_ERROR_WORD_COUNT = -6,
    GEOWORDS_ERROR_UNKNOWN_WORD = -7,
    GEOWORDS_ERROR_WORD_LIST = -8,
    GEOWORDS_ERROR_UNKNOWN = -99
} GeowordsStatus;

/**
 * Result of every call. message is NULL on success and must be released
 * with geowords_error_free() otherwise.
 */
typedef struct {
    const char* message;
    int code;
} GeowordsError;

GEOWORDS_API void geowords_error_free(GeowordsError* error);

/* ===== Setup ===== */

/**
 * Load the word lists from a directory (NULL for the built-in default)
 * and create the unkeyed default hasher.
 */
GEOWORDS_API GeowordsError geowords_initialize(const char* words_dir);

/**
 * Replace the default hasher with one bound to key (NULL or "" for no key)
 */
GEOWORDS_API GeowordsError geowords_set_key(const char* key);

/**
 * Enable diagnostic output on stderr
 */
GEOWORDS_API GeowordsError geowords_set_verbose(int verbose);

/* ===== Encoding ===== */

/**
 * Encode coordinates as a word_count (3, 4 or 6) word address.
 * key == NULL uses the default hasher. *address must be released with
 * geowords_string_free().
 */
GEOWORDS_API GeowordsError geowords_encode(double latitude, double longitude, int word_count,
                                           const char* key, char** address);

/**
 * Decode an address. word_count == 0 takes the variant from the address.
 */
GEOWORDS_API GeowordsError geowords_decode(const char* address, int word_count, const char* key,
                                           double* latitude, double* longitude);

GEOWORDS_API void geowords_string_free(char* str);

GEOWORDS_API const char* geowords_version(void);

#ifdef __cplusplus
}
#endif

#endif // GEOWORDS_SDK_H
