#include "GeohashCodec.hpp"
#include "../numeric/IntegerPacker.hpp"
#include "../../core/GeoWordsConstants.hpp"
#include "../../core/GeoWordsError.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace GeoWords {

std::string GeohashCodec::encode(double latitude, double longitude, int precision) {
    if (precision < 1 || precision > MAX_PRECISION) {
        throw std::invalid_argument("Geohash precision must be between 1 and " + std::to_string(MAX_PRECISION));
    }
    if (!std::isfinite(latitude) || !std::isfinite(longitude) ||
        latitude < LAT_MIN || latitude > LAT_MAX || longitude < LON_MIN || longitude > LON_MAX) {
        std::ostringstream oss;
        oss << "Coordinates out of range: (" << latitude << ", " << longitude << ")";
        throw CoordinateFormatError(oss.str());
    }

    double latLow = LAT_MIN, latHigh = LAT_MAX;
    double lonLow = LON_MIN, lonHigh = LON_MAX;
    // Bits alternate starting with longitude
    bool isLonBit = true;
    uint64_t hashBits = 0;
    const int numOfHashBits = precision * BASE32_BITS;
    for (int i = 0; i < numOfHashBits; ++i) {
        if (isLonBit) {
            double lonMid = lonLow + (lonHigh - lonLow) / 2;
            if (longitude >= lonMid) {
                hashBits = (hashBits << 1) | 1;
                lonLow = lonMid;
            } else {
                hashBits <<= 1;
                lonHigh = lonMid;
            }
        } else {
            double latMid = latLow + (latHigh - latLow) / 2;
            if (latitude >= latMid) {
                hashBits = (hashBits << 1) | 1;
                latLow = latMid;
            } else {
                hashBits <<= 1;
                latHigh = latMid;
            }
        }
        isLonBit = !isLonBit;
    }
    return IntegerPacker::integerToGeohash(hashBits, static_cast<size_t>(precision));
}

std::pair<double, double> GeohashCodec::decode(const std::string& geohash) {
    if (geohash.empty()) {
        throw InvalidSymbolError("Cannot decode an empty geohash");
    }
    const uint64_t hashBits = IntegerPacker::stringToInteger(geohash);
    const int numOfHashBits = static_cast<int>(geohash.size()) * BASE32_BITS;

    double latLow = LAT_MIN, latHigh = LAT_MAX;
    double lonLow = LON_MIN, lonHigh = LON_MAX;
    bool isLonBit = true;
    for (int i = 0; i < numOfHashBits; ++i) {
        const bool bit = ((hashBits >> (numOfHashBits - 1 - i)) & 1) != 0;
        if (isLonBit) {
            double lonMid = lonLow + (lonHigh - lonLow) / 2;
            if (bit) lonLow = lonMid; else lonHigh = lonMid;
        } else {
            double latMid = latLow + (latHigh - latLow) / 2;
            if (bit) latLow = latMid; else latHigh = latMid;
        }
        isLonBit = !isLonBit;
    }
    return {latLow + (latHigh - latLow) / 2, lonLow + (lonHigh - lonLow) / 2};
}

std::pair<double, double> GeohashCodec::cellError(int precision) {
    const int bits = precision * BASE32_BITS;
    const int lonBits = (bits + 1) / 2;
    const int latBits = bits / 2;
    return {(LAT_MAX - LAT_MIN) / std::ldexp(1.0, latBits) / 2,
            (LON_MAX - LON_MIN) / std::ldexp(1.0, lonBits) / 2};
}

} // namespace GeoWords
