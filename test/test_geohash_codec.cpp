#include <gtest/gtest.h>
#include "../src/encoders/geo/GeohashCodec.hpp"
#include "../src/core/GeoWordsError.hpp"
#include <cmath>
#include <limits>

using namespace GeoWords;

TEST(GeohashCodecTest, EncodesKnownLocations) {
    EXPECT_EQ(GeohashCodec::encode(57.64911, 10.40744, 11), "u4pruydqqvj");
    EXPECT_EQ(GeohashCodec::encode(-33.867480754852295, 151.20700120925903, 9), "r3gx2f9ed");
    EXPECT_EQ(GeohashCodec::encode(51.5007, -0.1246, 9), "gcpuvpmm2");
    EXPECT_EQ(GeohashCodec::encode(0.0, 0.0, 9), "s00000000");
}

TEST(GeohashCodecTest, CornersOfTheWorld) {
    EXPECT_EQ(GeohashCodec::encode(-90.0, -180.0, 9), "000000000");
    EXPECT_EQ(GeohashCodec::encode(90.0, 180.0, 9), "zzzzzzzzz");
}

TEST(GeohashCodecTest, OutputHasRequestedPrecision) {
    for (int precision = 1; precision <= GeohashCodec::MAX_PRECISION; ++precision) {
        EXPECT_EQ(GeohashCodec::encode(12.5, -45.25, precision).size(), static_cast<size_t>(precision));
    }
    EXPECT_THROW(GeohashCodec::encode(0, 0, 0), std::invalid_argument);
    EXPECT_THROW(GeohashCodec::encode(0, 0, 13), std::invalid_argument);
}

TEST(GeohashCodecTest, DecodeReturnsCellCentre) {
    auto centre = GeohashCodec::decode("r3gx2f9ed");
    EXPECT_DOUBLE_EQ(centre.first, -33.867480754852295);
    EXPECT_DOUBLE_EQ(centre.second, 151.20700120925903);

    auto origin = GeohashCodec::decode("s0000000");
    EXPECT_DOUBLE_EQ(origin.first, 8.58306884765625e-05);
    EXPECT_DOUBLE_EQ(origin.second, 0.000171661376953125);
}

TEST(GeohashCodecTest, RoundTripStaysInsideTheCell) {
    const auto error = GeohashCodec::cellError(9);
    for (double lat = -89.5; lat <= 89.5; lat += 7.3) {
        for (double lon = -179.5; lon <= 179.5; lon += 11.1) {
            auto decoded = GeohashCodec::decode(GeohashCodec::encode(lat, lon, 9));
            EXPECT_LE(std::fabs(decoded.first - lat), error.first);
            EXPECT_LE(std::fabs(decoded.second - lon), error.second);
        }
    }
}

TEST(GeohashCodecTest, CellErrorAtPrecisionNine) {
    const auto error = GeohashCodec::cellError(9);
    // 45 bits: 23 for longitude, 22 for latitude
    EXPECT_DOUBLE_EQ(error.first, 180.0 / std::ldexp(1.0, 22) / 2);
    EXPECT_DOUBLE_EQ(error.second, 360.0 / std::ldexp(1.0, 23) / 2);
}

TEST(GeohashCodecTest, RejectsInvalidInput) {
    EXPECT_THROW(GeohashCodec::encode(90.5, 0.0, 9), CoordinateFormatError);
    EXPECT_THROW(GeohashCodec::encode(0.0, -180.1, 9), CoordinateFormatError);
    EXPECT_THROW(GeohashCodec::encode(std::numeric_limits<double>::quiet_NaN(), 0.0, 9), CoordinateFormatError);
    EXPECT_THROW(GeohashCodec::encode(0.0, std::numeric_limits<double>::infinity(), 9), CoordinateFormatError);
    EXPECT_THROW(GeohashCodec::decode(""), InvalidSymbolError);
    EXPECT_THROW(GeohashCodec::decode("r3gx2f9ea"), InvalidSymbolError);
}
