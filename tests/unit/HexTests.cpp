#include <gtest/gtest.h>
#include <etl/string.h>
#include <etl/vector.h>
#include "Utils/Hex.h"

TEST(HexTests, ToHexIsUppercase)
{
    const uint8_t bytes[] = {0x00, 0x4F, 0xab, 0xFF};
    etl::string<16> hex;

    ASSERT_TRUE(utils::toHex(bytes, sizeof(bytes), hex));
    EXPECT_STREQ(hex.c_str(), "004FABFF");
}

TEST(HexTests, ToHexFailsWhenOutputTooSmall)
{
    const uint8_t bytes[] = {0x01, 0x02, 0x03};
    etl::string<4> hex;

    EXPECT_FALSE(utils::toHex(bytes, sizeof(bytes), hex));
    EXPECT_TRUE(hex.empty());
}

TEST(HexTests, FromHexAcceptsMixedCase)
{
    etl::vector<uint8_t, 8> bytes;

    ASSERT_TRUE(utils::fromHex("08429a71B536", bytes));
    ASSERT_EQ(bytes.size(), 6U);
    EXPECT_EQ(bytes[0], 0x08);
    EXPECT_EQ(bytes[3], 0x71);
    EXPECT_EQ(bytes[5], 0x36);
}

TEST(HexTests, FromHexRejectsOddLength)
{
    etl::vector<uint8_t, 8> bytes;
    EXPECT_FALSE(utils::fromHex("ABC", bytes));
}

TEST(HexTests, FromHexRejectsNonHexCharacters)
{
    etl::vector<uint8_t, 8> bytes;
    EXPECT_FALSE(utils::fromHex("12G4", bytes));
    EXPECT_TRUE(bytes.empty());
}

TEST(HexTests, FromHexRejectsOverflow)
{
    etl::vector<uint8_t, 2> bytes;
    EXPECT_FALSE(utils::fromHex("010203", bytes));
}

TEST(HexTests, ConcatJoinsInOrder)
{
    etl::vector<uint8_t, 2> first;
    first.push_back(0xC1);
    first.push_back(0x06);
    etl::vector<uint8_t, 2> second;
    second.push_back(0x0A);

    etl::vector<uint8_t, 4> joined;
    ASSERT_TRUE(utils::concat(first, second, joined));
    ASSERT_EQ(joined.size(), 3U);
    EXPECT_EQ(joined[0], 0xC1);
    EXPECT_EQ(joined[2], 0x0A);

    etl::vector<uint8_t, 2> tooSmall;
    EXPECT_FALSE(utils::concat(first, second, tooSmall));
}
