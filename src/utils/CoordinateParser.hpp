#ifndef COORDINATE_PARSER_HPP
#define COORDINATE_PARSER_HPP

#include <string>
#include <utility>

namespace GeoWords {

// Parse "lat lon", "lat,lon" or "lat, lon" into (latitude, longitude).
// Throws CoordinateFormatError unless exactly two finite numbers are present.
std::pair<double, double> parseCoordinates(const std::string& text);

// True if the whole string is one number, e.g. "-33.86"
bool looksLikeNumber(const std::string& text);

} // namespace GeoWords

#endif // COORDINATE_PARSER_HPP
