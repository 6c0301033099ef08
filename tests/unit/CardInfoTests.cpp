#include <gtest/gtest.h>
#include "Mcrw/Card/CardInfo.h"
#include "Utils/Hex.h"

using namespace mcrw;
using namespace error;

namespace
{
    etl::vector<uint8_t, buffer::ATR_MAX> atrFromHex(const char* hex)
    {
        etl::vector<uint8_t, buffer::ATR_MAX> atr;
        EXPECT_TRUE(utils::fromHex(hex, atr));
        return atr;
    }
}

TEST(CardInfoTests, Classic1KProfile)
{
    auto info = CardInfo::fromAtr(atrFromHex("3B8F8001804F0CA000000306030001000000006A"));
    ASSERT_TRUE(info.has_value()) << info.error().toString().c_str();

    EXPECT_EQ(info.value().type, CardType::MifareClassic1K);
    EXPECT_EQ(info.value().blocksNumber, 64);
    EXPECT_EQ(info.value().sectorsNumber, 16);
    EXPECT_EQ(info.value().typeName(), etl::string_view("Mifare Classic 1K"));
    EXPECT_STREQ(info.value().atrHexString().c_str(), "3B8F8001804F0CA000000306030001000000006A");
}

TEST(CardInfoTests, Classic4KProfile)
{
    auto info = CardInfo::fromAtr(atrFromHex("3B8F8001804F0CA0000003060300020000000069"));
    ASSERT_TRUE(info.has_value());

    EXPECT_EQ(info.value().type, CardType::MifareClassic4K);
    EXPECT_EQ(info.value().blocksNumber, 256);
    EXPECT_EQ(info.value().sectorsNumber, 40);
    EXPECT_TRUE(info.value().isValidSector(39));
    EXPECT_FALSE(info.value().isValidSector(40));
    EXPECT_TRUE(info.value().isValidBlock(255));
}

TEST(CardInfoTests, ShortAtrIsUnknown)
{
    auto info = CardInfo::fromAtr(atrFromHex("3B8F8001804F0CA0000003060300"));
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().get<CardError>(), CardError::UnknownCardType);
    EXPECT_STREQ(info.error().message().c_str(), "Unknown Card Type.");
}

TEST(CardInfoTests, OtherCardNameIsUnsupported)
{
    // Mifare Ultralight card name 0003
    auto info = CardInfo::fromAtr(atrFromHex("3B8F8001804F0CA0000003060300030000000068"));
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().get<CardError>(), CardError::UnsupportedCardType);
    EXPECT_STREQ(info.error().message().c_str(), "Unsupported Card Type: 0003");
}

TEST(CardInfoTests, ToStringListsProfile)
{
    auto info = CardInfo::fromAtr(atrFromHex("3B8F8001804F0CA000000306030001000000006A"));
    ASSERT_TRUE(info.has_value());

    const auto text = info.value().toString();
    EXPECT_NE(text.find("Mifare Classic 1K"), etl::string<255>::npos);
    EXPECT_NE(text.find("Blocks: 64"), etl::string<255>::npos);
    EXPECT_NE(text.find("Sectors: 16"), etl::string<255>::npos);
}
