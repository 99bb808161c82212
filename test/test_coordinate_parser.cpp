#include <gtest/gtest.h>
#include "../src/utils/CoordinateParser.hpp"
#include "../src/core/GeoWordsError.hpp"

using namespace GeoWords;

TEST(CoordinateParserTest, AcceptsTheThreeFormats) {
    for (const char* text : {"-33.867480754852295 151.20700120925903",
                             "-33.867480754852295,151.20700120925903",
                             "-33.867480754852295, 151.20700120925903",
                             "  -33.867480754852295 ,  151.20700120925903  "}) {
        auto coords = parseCoordinates(text);
        EXPECT_DOUBLE_EQ(coords.first, -33.867480754852295) << text;
        EXPECT_DOUBLE_EQ(coords.second, 151.20700120925903) << text;
    }
    auto integers = parseCoordinates("10 -20");
    EXPECT_DOUBLE_EQ(integers.first, 10.0);
    EXPECT_DOUBLE_EQ(integers.second, -20.0);
}

TEST(CoordinateParserTest, RejectsAnythingButTwoNumbers) {
    EXPECT_THROW(parseCoordinates("abc"), CoordinateFormatError);
    EXPECT_THROW(parseCoordinates(""), CoordinateFormatError);
    EXPECT_THROW(parseCoordinates("12.5"), CoordinateFormatError);
    EXPECT_THROW(parseCoordinates("1 2 3"), CoordinateFormatError);
    EXPECT_THROW(parseCoordinates("1,2,3"), CoordinateFormatError);
    EXPECT_THROW(parseCoordinates("1 2, 3"), CoordinateFormatError);
    EXPECT_THROW(parseCoordinates("12.5,north"), CoordinateFormatError);
    EXPECT_THROW(parseCoordinates("12.5x 3"), CoordinateFormatError);
    EXPECT_THROW(parseCoordinates("nan 3"), CoordinateFormatError);
    EXPECT_THROW(parseCoordinates("inf,3"), CoordinateFormatError);
}

TEST(CoordinateParserTest, LooksLikeNumber) {
    EXPECT_TRUE(looksLikeNumber("-33.86"));
    EXPECT_TRUE(looksLikeNumber("151"));
    EXPECT_TRUE(looksLikeNumber("1e3"));
    EXPECT_FALSE(looksLikeNumber("-k"));
    EXPECT_FALSE(looksLikeNumber("--words"));
    EXPECT_FALSE(looksLikeNumber(""));
    EXPECT_FALSE(looksLikeNumber("1,2"));
}
