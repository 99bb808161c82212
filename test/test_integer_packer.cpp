#include <gtest/gtest.h>
#include "../src/encoders/numeric/IntegerPacker.hpp"
#include "../src/core/GeoWordsError.hpp"
#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

using namespace GeoWords;

namespace {
constexpr uint64_t MAX_45_BIT = (uint64_t(1) << 45) - 1;
}

TEST(IntegerPackerTest, GeohashToIntegerIsBigEndianBase32) {
    EXPECT_EQ(IntegerPacker::stringToInteger("0"), 0u);
    EXPECT_EQ(IntegerPacker::stringToInteger("z"), 31u);
    EXPECT_EQ(IntegerPacker::stringToInteger("10"), 32u);
    EXPECT_EQ(IntegerPacker::stringToInteger("000000000"), 0u);
    EXPECT_EQ(IntegerPacker::stringToInteger("zzzzzzzzz"), MAX_45_BIT);
    EXPECT_EQ(IntegerPacker::stringToInteger("r3gx2f9ed"), 25408928425388u);
}

TEST(IntegerPackerTest, RejectsSymbolsOutsideTheAlphabet) {
    // a, i, l and o are not geohash symbols
    EXPECT_THROW(IntegerPacker::stringToInteger("r3gx2f9ea"), InvalidSymbolError);
    EXPECT_THROW(IntegerPacker::stringToInteger("i"), InvalidSymbolError);
    EXPECT_THROW(IntegerPacker::stringToInteger("R3GX"), InvalidSymbolError);
    EXPECT_THROW(IntegerPacker::stringToInteger("r3gx-2f9e"), InvalidSymbolError);
    EXPECT_THROW(IntegerPacker::stringToInteger("0123456789bcd"), InvalidSymbolError);
}

TEST(IntegerPackerTest, IntegerToStringDropsLeadingZeros) {
    EXPECT_EQ(IntegerPacker::integerToString(0), "");
    EXPECT_EQ(IntegerPacker::integerToString(31), "z");
    EXPECT_EQ(IntegerPacker::integerToString(25408928425388u), "r3gx2f9ed");
    EXPECT_EQ(IntegerPacker::integerToString(IntegerPacker::stringToInteger("00bc")), "bc");

    EXPECT_EQ(IntegerPacker::integerToGeohash(0, 9), "000000000");
    EXPECT_EQ(IntegerPacker::integerToGeohash(IntegerPacker::stringToInteger("00bc"), 9), "0000000bc");
    EXPECT_EQ(IntegerPacker::integerToGeohash(25408928425388u, 9), "r3gx2f9ed");
}

TEST(IntegerPackerTest, PadReservesThreeLowBits) {
    EXPECT_EQ(IntegerPacker::pad(1), 8u);
    EXPECT_EQ(IntegerPacker::pad(MAX_45_BIT), (uint64_t(1) << 48) - 8);
    EXPECT_EQ(IntegerPacker::pad(12345) & 0x7, 0u);

    std::mt19937_64 rng(42);
    for (int i = 0; i < 1000; ++i) {
        uint64_t v = rng() & MAX_45_BIT;
        EXPECT_EQ(IntegerPacker::unpad(IntegerPacker::pad(v)), v);
    }
    EXPECT_EQ(IntegerPacker::unpad(IntegerPacker::pad(0)), 0u);
    EXPECT_EQ(IntegerPacker::unpad(IntegerPacker::pad(MAX_45_BIT)), MAX_45_BIT);
}

TEST(IntegerPackerTest, SplitBitsTakesMostSignificantGroupFirst) {
    EXPECT_EQ(IntegerPacker::splitBits(25408928425388u, 15, 3), (std::vector<uint32_t>{23663, 29774, 9644}));
    EXPECT_EQ(IntegerPacker::splitBits(MAX_45_BIT, 15, 3), (std::vector<uint32_t>{32767, 32767, 32767}));
    EXPECT_EQ(IntegerPacker::splitBits(1, 15, 3), (std::vector<uint32_t>{0, 0, 1}));

    const uint64_t padded = IntegerPacker::pad(25408928425388u);
    EXPECT_EQ(IntegerPacker::splitBits(padded, 12, 4), (std::vector<uint32_t>{2957, 4049, 914, 3424}));
    EXPECT_EQ(IntegerPacker::splitBits(padded, 8, 6), (std::vector<uint32_t>{184, 223, 209, 57, 45, 96}));
}

TEST(IntegerPackerTest, JoinBitsInvertsSplitBits) {
    struct Layout { unsigned bits; size_t groups; bool padded; };
    const Layout layouts[] = {{15, 3, false}, {12, 4, true}, {8, 6, true}};

    std::mt19937_64 rng(7);
    std::vector<uint64_t> samples = {0, 1, MAX_45_BIT, MAX_45_BIT - 1, uint64_t(1) << 44};
    for (int i = 0; i < 500; ++i) samples.push_back(rng() & MAX_45_BIT);

    for (const auto& layout : layouts) {
        for (uint64_t v : samples) {
            const uint64_t value = layout.padded ? IntegerPacker::pad(v) : v;
            const auto groups = IntegerPacker::splitBits(value, layout.bits, layout.groups);
            ASSERT_EQ(groups.size(), layout.groups);
            for (uint32_t g : groups) {
                EXPECT_LT(g, 1u << layout.bits);
            }
            EXPECT_EQ(IntegerPacker::joinBits(groups, layout.bits), value);
        }
    }
}

TEST(IntegerPackerTest, IndicesFollowTheVariantLayout) {
    const uint64_t value = 25408928425388u;
    EXPECT_EQ(IntegerPacker::toIndices(value, 3), (std::vector<uint32_t>{23663, 29774, 9644}));
    EXPECT_EQ(IntegerPacker::toIndices(value, 4), (std::vector<uint32_t>{2957, 4049, 914, 3424}));
    EXPECT_EQ(IntegerPacker::toIndices(value, 6), (std::vector<uint32_t>{184, 223, 209, 57, 45, 96}));

    for (size_t count : {3, 4, 6}) {
        EXPECT_EQ(IntegerPacker::fromIndices(IntegerPacker::toIndices(value, count), count), value);
        EXPECT_EQ(IntegerPacker::fromIndices(IntegerPacker::toIndices(MAX_45_BIT, count), count), MAX_45_BIT);
    }
}

TEST(IntegerPackerTest, UnsupportedWordCountsAreRejected) {
    EXPECT_THROW(IntegerPacker::layoutFor(2), WordCountMismatchError);
    EXPECT_THROW(IntegerPacker::layoutFor(5), WordCountMismatchError);
    EXPECT_THROW(IntegerPacker::toIndices(1, 0), WordCountMismatchError);
    EXPECT_THROW(IntegerPacker::fromIndices({1, 2, 3}, 4), WordCountMismatchError);
    EXPECT_THROW(IntegerPacker::splitBits(1, 0, 3), std::invalid_argument);
    EXPECT_THROW(IntegerPacker::splitBits(1, 16, 5), std::invalid_argument);
}
