#include "CoordinateParser.hpp"
#include "../core/GeoWordsError.hpp"
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace GeoWords {

namespace {

bool parseNumber(const std::string& token, double& value) {
    if (token.empty()) return false;
    const char* begin = token.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    return end == begin + token.size() && std::isfinite(value);
}

std::vector<std::string> splitTokens(const std::string& text) {
    std::vector<std::string> parts;
    if (text.find(',') != std::string::npos) {
        std::stringstream ss(text);
        std::string part;
        while (std::getline(ss, part, ',')) {
            std::stringstream trimmer(part);
            std::string piece, rest;
            trimmer >> piece;
            if (piece.empty()) continue;
            // "1 2, 3" is not a coordinate pair
            if (trimmer >> rest) {
                parts.push_back(piece + " " + rest);
                continue;
            }
            parts.push_back(piece);
        }
    } else {
        std::stringstream ss(text);
        std::string piece;
        while (ss >> piece) parts.push_back(piece);
    }
    return parts;
}

} // namespace

std::pair<double, double> parseCoordinates(const std::string& text) {
    const std::vector<std::string> parts = splitTokens(text);
    if (parts.size() != 2) {
        throw CoordinateFormatError("Coordinate string must contain exactly two numbers: '" + text + "'");
    }
    double lat = 0.0, lon = 0.0;
    if (!parseNumber(parts[0], lat) || !parseNumber(parts[1], lon)) {
        throw CoordinateFormatError("Could not parse coordinates: '" + text + "'");
    }
    return {lat, lon};
}

bool looksLikeNumber(const std::string& text) {
    double ignored = 0.0;
    return parseNumber(text, ignored);
}

} // namespace GeoWords
