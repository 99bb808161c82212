#ifndef GEOHASH_CODEC_HPP
#define GEOHASH_CODEC_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace GeoWords {

// Standard base-32 geohash of a latitude/longitude pair
class GeohashCodec {
public:
    static constexpr double LAT_MIN = -90.0;
    static constexpr double LAT_MAX = 90.0;
    static constexpr double LON_MIN = -180.0;
    static constexpr double LON_MAX = 180.0;
    static constexpr int MAX_PRECISION = 12;
    static constexpr int BASE32_BITS = 5;

    // Geohash of exactly `precision` characters.
    // Throws CoordinateFormatError for non-finite or out-of-range input.
    static std::string encode(double latitude, double longitude, int precision);

    // Centre of the geohash cell as (latitude, longitude). Throws InvalidSymbolError.
    static std::pair<double, double> decode(const std::string& geohash);

    // Half the cell extent as (latitude error, longitude error) for a precision
    static std::pair<double, double> cellError(int precision);
};

} // namespace GeoWords

#endif // GEOHASH_CODEC_HPP
