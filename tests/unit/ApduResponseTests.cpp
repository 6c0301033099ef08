#include <gtest/gtest.h>
#include "Mcrw/Apdu/ApduResponse.h"

using namespace mcrw;
using namespace error;

TEST(ApduResponseTests, FromRawSplitsDataAndStatus)
{
    etl::vector<uint8_t, 8> raw;
    raw.push_back(0x04);
    raw.push_back(0xA1);
    raw.push_back(0x90);
    raw.push_back(0x00);

    auto response = ApduResponse::fromRaw(raw);
    ASSERT_TRUE(response.has_value());
    ASSERT_EQ(response.value().data.size(), 2U);
    EXPECT_EQ(response.value().data[1], 0xA1);
    EXPECT_EQ(response.value().getStatusWord(), 0x9000);
    EXPECT_TRUE(response.value().isSuccess());
}

TEST(ApduResponseTests, FromRawRejectsShortResponse)
{
    etl::vector<uint8_t, 8> raw;
    raw.push_back(0x90);

    auto response = ApduResponse::fromRaw(raw);
    ASSERT_FALSE(response.has_value());
    EXPECT_TRUE(response.error().is<ApduError>());
    EXPECT_EQ(response.error().get<ApduError>(), ApduError::WrongLength);
}

TEST(ApduResponseTests, CheckStatusSuccess)
{
    etl::vector<uint8_t, 1> empty;
    ApduResponse response(empty, 0x90, 0x00);
    EXPECT_TRUE(response.checkStatus().has_value());
}

TEST(ApduResponseTests, CheckStatusSecurityNotSatisfied)
{
    etl::vector<uint8_t, 1> empty;
    ApduResponse response(empty, 0x69, 0x82);

    auto status = response.checkStatus();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().get<ApduError>(), ApduError::SecurityStatusNotSatisfied);
    EXPECT_EQ(status.error().statusWord(), 0x6982);
}

TEST(ApduResponseTests, CheckStatusOtherCodes)
{
    etl::vector<uint8_t, 1> empty;
    ApduResponse response(empty, 0x63, 0x00);

    auto status = response.checkStatus();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().get<ApduError>(), ApduError::UnexpectedStatus);
    EXPECT_STREQ(status.error().message().c_str(), "0x6300");
}
