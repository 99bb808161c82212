#ifndef GEOWORDS_DEBUG_UTILS_HPP
#define GEOWORDS_DEBUG_UTILS_HPP

#include <atomic>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "encoders/text/WordList.hpp"

// Diagnostic output for word list loading and the encode/decode pipeline.
// Everything is written to std::cerr and only when verbose output is on.

namespace DebugUtils {

inline std::atomic<bool> verboseEnabled{false};

inline void setVerbose(bool enabled) { verboseEnabled.store(enabled); }
inline bool isVerbose() { return verboseEnabled.load(); }

inline void printMessage(const std::string& prefix, const std::string& message) {
    if (!isVerbose()) return;
    std::cerr << "[DEBUG-" << prefix << "] " << message << std::endl;
}

// Print word list size and its first few words
inline void printWordListInfo(const GeoWords::WordList& list, const std::string& name) {
    if (!isVerbose()) return;
    std::cerr << "[DEBUG-LOAD] " << name << ": " << list.size() << " words, first 5: ";
    for (size_t i = 0; i < list.size() && i < 5; ++i) {
        std::cerr << "'" << list.wordAt(i) << "' ";
    }
    std::cerr << std::endl;
}

inline void printGeohash(const std::string& prefix, const std::string& geohash, uint64_t value) {
    if (!isVerbose()) return;
    std::cerr << "[DEBUG-" << prefix << "] geohash " << geohash << " = " << value << std::endl;
}

inline void printIndices(const std::string& prefix, const std::vector<uint32_t>& indices) {
    if (!isVerbose()) return;
    std::cerr << "[DEBUG-" << prefix << "] indices: ";
    for (auto idx : indices) {
        std::cerr << idx << " ";
    }
    std::cerr << std::endl;
}

} // namespace DebugUtils

#endif // GEOWORDS_DEBUG_UTILS_HPP
