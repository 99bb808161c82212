#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept> // For exception handling
#include <string>
#include <vector>

#include "WordHasher.hpp"
#include "core/GeoWordsConstants.hpp"
#include "core/GeoWordsError.hpp"
#include "debug_utils.hpp"
#include "encoders/geo/GeohashCodec.hpp"
#include "encoders/numeric/IntegerPacker.hpp"
#include "io/WordListLoader.hpp"
#include "utils/CoordinateParser.hpp"

using namespace GeoWords;

// Function to print usage
void printUsage(const char* progName) {
    std::cerr << "Usage:" << std::endl;
    std::cerr << "  " << progName << " encode [--key <key>] [--words {3,4,6}] <lat,lon | lat lon>" << std::endl;
    std::cerr << "  " << progName << " decode [--key <key>] [--words {3,4,6}] <address>" << std::endl;
    std::cerr << "\nOptions:" << std::endl;
    std::cerr << "  --key, -k <key>        Secret key for shuffling the word lists" << std::endl;
    std::cerr << "  --words, -w <n>        Number of words: 3, 4 or 6. Default: 3 (decode: taken from the address)" << std::endl;
    std::cerr << "  --words-dir <dir>      Directory holding the word list files" << std::endl;
    std::cerr << "  --verbose, -v          Print the geohash, integer and word indices" << std::endl;
    std::cerr << "  --help, -h             Show this message" << std::endl;
}

// Negative coordinates such as "-33.8" or "-33.8,151.2" are positional, not options
static bool isPositional(const std::string& arg) {
    if (arg.empty() || arg[0] != '-') return true;
    std::string number = arg;
    if (number.back() == ',') number.pop_back();
    if (looksLikeNumber(number)) return true;
    try {
        parseCoordinates(arg);
        return true;
    } catch (const CoordinateFormatError&) {
        return false;
    }
}

static size_t parseWordCount(const std::string& value) {
    if (value == "3") return 3;
    if (value == "4") return 4;
    if (value == "6") return 6;
    throw std::invalid_argument("--words must be 3, 4 or 6, got '" + value + "'");
}

static std::string formatCoordinates(const std::pair<double, double>& coords) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10)
        << "(" << coords.first << ", " << coords.second << ")";
    return oss.str();
}

static void traceEncode(const std::string& coordinates, size_t wordCount) {
    if (!DebugUtils::isVerbose()) return;
    const auto latLon = parseCoordinates(coordinates);
    const std::string geohash = GeohashCodec::encode(latLon.first, latLon.second, GEOHASH_PRECISION);
    const uint64_t value = IntegerPacker::stringToInteger(geohash);
    DebugUtils::printGeohash("ENCODE", geohash, value);
    DebugUtils::printIndices("ENCODE", IntegerPacker::toIndices(value, wordCount));
}

static void traceDecode(const WordHasher& hasher, const std::string& address, size_t wordCount) {
    if (!DebugUtils::isVerbose()) return;
    const std::vector<uint32_t> indices = hasher.addressToIndices(address, wordCount);
    DebugUtils::printIndices("DECODE", indices);
    const uint64_t value = IntegerPacker::fromIndices(indices, wordCount);
    DebugUtils::printGeohash("DECODE", IntegerPacker::integerToGeohash(value, GEOHASH_PRECISION), value);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }
    std::string mode = argv[1];
    if (mode == "--help" || mode == "-h") {
        printUsage(argv[0]);
        return 0;
    }
    if (mode != "encode" && mode != "decode") {
        std::cerr << "Error: Invalid command '" << mode << "'." << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    std::optional<std::string> key;
    std::optional<size_t> wordCount;
    std::string wordsDir;
    std::vector<std::string> positional;

    try {
        int i = 2;
        while (i < argc) {
            std::string arg = argv[i];
            if (arg == "--key" || arg == "-k" || arg == "--words" || arg == "-w" || arg == "--words-dir") {
                if (i + 1 >= argc) {
                    std::cerr << "Error: " << arg << " requires a value." << std::endl;
                    printUsage(argv[0]);
                    return 1;
                }
                std::string value = argv[++i];
                if (arg == "--key" || arg == "-k") {
                    key = value;
                } else if (arg == "--words" || arg == "-w") {
                    wordCount = parseWordCount(value);
                } else {
                    wordsDir = value;
                }
            } else if (arg == "--verbose" || arg == "-v") {
                DebugUtils::setVerbose(true);
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (isPositional(arg)) {
                positional.push_back(arg);
            } else {
                std::cerr << "Error: Unknown option '" << arg << "'." << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            ++i;
        }
        if (positional.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        const WordListConfig config = wordsDir.empty() ? WordListConfig::defaults()
                                                       : WordListConfig::fromDirectory(wordsDir);
        WordHasher hasher(WordListLoader::loadBaseWordLists(config), key);

        if (mode == "encode") {
            std::string coordinates;
            for (const auto& part : positional) {
                if (!coordinates.empty()) coordinates += " ";
                coordinates += part;
            }
            const size_t count = wordCount.value_or(3);
            traceEncode(coordinates, count);
            std::cout << "Encoded address: " << hasher.encode(coordinates, count) << std::endl;
        } else {
            if (positional.size() != 1) {
                std::cerr << "Error: decode takes exactly one address." << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            const std::string& address = positional[0];
            const auto coords = wordCount ? hasher.decode(address, *wordCount) : hasher.decode(address);
            traceDecode(hasher, address, wordCount.value_or(WordHasher::splitAddress(address).size()));
            std::cout << "Decoded coordinates: " << formatCoordinates(coords) << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "An error occurred: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
