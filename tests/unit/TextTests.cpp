#include <gtest/gtest.h>
#include <etl/string.h>
#include "Utils/Text.h"

TEST(TextTests, PrintableAsciiIsKept)
{
    const uint8_t bytes[] = {'H', 'e', 'l', 'l', 'o'};
    etl::string<16> text;

    utils::renderPrintable(bytes, sizeof(bytes), text);
    EXPECT_STREQ(text.c_str(), "Hello");
}

TEST(TextTests, ControlCharactersBecomeSpaces)
{
    const uint8_t bytes[] = {'A', 0x00, 0x0A, 'B', 0x7F};
    etl::string<16> text;

    utils::renderPrintable(bytes, sizeof(bytes), text);
    EXPECT_STREQ(text.c_str(), "A  B ");
}

TEST(TextTests, MultiByteSequencesArePreserved)
{
    // "Añ" followed by a C1 control (U+0085)
    const uint8_t bytes[] = {'A', 0xC3, 0xB1, 0xC2, 0x85};
    etl::string<16> text;

    utils::renderPrintable(bytes, sizeof(bytes), text);
    EXPECT_STREQ(text.c_str(), "A\xC3\xB1 ");
}

TEST(TextTests, MalformedBytesBecomeOneSpaceEach)
{
    const uint8_t bytes[] = {0xFF, 0xC3, 'x'};
    etl::string<16> text;

    utils::renderPrintable(bytes, sizeof(bytes), text);
    EXPECT_STREQ(text.c_str(), "  x");
}

TEST(TextTests, ReplacementCharacterIsHidden)
{
    const uint8_t bytes[] = {0xEF, 0xBF, 0xBD, 'z'};
    etl::string<16> text;

    utils::renderPrintable(bytes, sizeof(bytes), text);
    EXPECT_STREQ(text.c_str(), " z");
}

TEST(TextTests, ToTextDropsTrailingZeroPadding)
{
    const uint8_t bytes[] = {'E', 'x', 0x00, 'y', 0x00, 0x00};
    etl::string<16> text;

    ASSERT_TRUE(utils::toText(bytes, sizeof(bytes), text));
    ASSERT_EQ(text.size(), 4U);
    EXPECT_EQ(text[2], '\0');
    EXPECT_EQ(text[3], 'y');
}

TEST(TextTests, ToTextFailsWhenOutputTooSmall)
{
    const uint8_t bytes[] = {'a', 'b', 'c'};
    etl::string<2> text;

    EXPECT_FALSE(utils::toText(bytes, sizeof(bytes), text));
}
