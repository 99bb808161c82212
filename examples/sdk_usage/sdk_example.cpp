#include "geowords_sdk.h"
#include <iomanip>
#include <iostream>
#include <string>

// Helper function to print error information
void print_error(GeowordsError& error) {
    if (error.code != GEOWORDS_SUCCESS) {
        std::cerr << "Error " << error.code << ": " << (error.message ? error.message : "Unknown error") << std::endl;
        geowords_error_free(&error);
    }
}

int main(int argc, char* argv[]) {
    std::cout << "GeoWords SDK Example - Version: " << geowords_version() << std::endl;
    std::cout << "======================================================" << std::endl;

    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <lat> <lon> [key] [words_dir]" << std::endl;
        std::cout << "Example: " << argv[0] << " -33.8675 151.2070 secret" << std::endl;
        return 1;
    }

    double lat = 0.0, lon = 0.0;
    try {
        lat = std::stod(argv[1]);
        lon = std::stod(argv[2]);
    } catch (const std::exception&) {
        std::cerr << "Latitude and longitude must be numbers" << std::endl;
        return 1;
    }
    const char* key = argc > 3 ? argv[3] : nullptr;
    const char* words_dir = argc > 4 ? argv[4] : nullptr;

    // Step 1: Load the word lists
    GeowordsError error = geowords_initialize(words_dir);
    if (error.code != GEOWORDS_SUCCESS) {
        print_error(error);
        return 1;
    }

    std::cout << std::setprecision(17);
    for (int words : {3, 4, 6}) {
        // Step 2: Encode
        char* address = nullptr;
        error = geowords_encode(lat, lon, words, key, &address);
        if (error.code != GEOWORDS_SUCCESS) {
            print_error(error);
            return 1;
        }

        // Step 3: Decode back to the cell centre
        double decoded_lat = 0.0, decoded_lon = 0.0;
        error = geowords_decode(address, words, key, &decoded_lat, &decoded_lon);
        if (error.code != GEOWORDS_SUCCESS) {
            print_error(error);
            geowords_string_free(address);
            return 1;
        }

        std::cout << words << " words: " << address
                  << " -> (" << decoded_lat << ", " << decoded_lon << ")" << std::endl;
        geowords_string_free(address);
    }

    return 0;
}
