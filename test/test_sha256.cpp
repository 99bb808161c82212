#include <gtest/gtest.h>
#include "../src/utils/sha256.h"
#include <string>

using namespace GeoWords;

TEST(SHA256Test, KnownVectors) {
    EXPECT_EQ(SHA256::hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(SHA256::hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(SHA256::hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
    EXPECT_EQ(SHA256::hex("secretalpha"), "f542412a34c61b16e3093c3f3bd420b5f4276c644b5ff13bc353d102123c13e2");
}

TEST(SHA256Test, IncrementalUpdatesMatchOneShot) {
    const std::string message(1000, 'a');
    SHA256 sha;
    for (size_t i = 0; i < message.size(); i += 37) {
        sha.update(message.substr(i, 37));
    }
    EXPECT_EQ(sha.hexdigest(), SHA256::hex(message));

    // digest() resets the state
    sha.update("abc");
    EXPECT_EQ(sha.hexdigest(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, BlockBoundaryLengths) {
    // 55, 56 and 64 bytes exercise both padding branches
    SHA256 sha;
    for (size_t len : {55u, 56u, 63u, 64u, 65u}) {
        std::string message(len, 'x');
        sha.update(message);
        EXPECT_EQ(sha.hexdigest(), SHA256::hex(message));
    }
    EXPECT_EQ(SHA256::hex(std::string(64, 'a')),
              "ffe054fe7ae0cb6dc65c3af9b61d5209f439851db43d0ba5997337df154668eb");
}
