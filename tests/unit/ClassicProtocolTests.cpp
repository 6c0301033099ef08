#include <gtest/gtest.h>
#include "Mcrw/Classic/ClassicProtocol.h"
#include "Mcrw/Classic/PcscCommandSet.h"
#include "SimulatedClassicCard.h"

using namespace mcrw;
using namespace error;

namespace
{
    KeyData defaultKey()
    {
        return KeyData(6, 0xFF);
    }
}

TEST(ClassicProtocolTests, GetUidReturnsResponseData)
{
    SimulatedClassicCard card;
    PcscCommandSet commandSet;
    ClassicProtocol protocol(card, commandSet);

    auto uid = protocol.getUid();
    ASSERT_TRUE(uid.has_value()) << uid.error().toString().c_str();
    ASSERT_EQ(uid.value().size(), 4U);
    EXPECT_EQ(uid.value()[0], 0x04);
    EXPECT_EQ(uid.value()[3], 0xC3);
}

TEST(ClassicProtocolTests, SuccessStatusCompletesRead)
{
    SimulatedClassicCard card;
    PcscCommandSet commandSet;
    ClassicProtocol protocol(card, commandSet);

    ASSERT_TRUE(protocol.loadKey(KeyType::A, defaultKey()).has_value());
    card.blocks[5][0] = 0x42;

    auto block = protocol.readBlock(5);
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block.value().size(), 16U);
    EXPECT_EQ(block.value()[0], 0x42);
}

TEST(ClassicProtocolTests, SecurityStatusNotSatisfiedWithoutKey)
{
    SimulatedClassicCard card;
    PcscCommandSet commandSet;
    ClassicProtocol protocol(card, commandSet);

    auto block = protocol.readBlock(5);
    ASSERT_FALSE(block.has_value());
    EXPECT_EQ(block.error().get<ApduError>(), ApduError::SecurityStatusNotSatisfied);
    EXPECT_STREQ(block.error().message().c_str(), "0x6982 - Security status not satisfied.");
}

TEST(ClassicProtocolTests, OtherStatusIsReportedAsHexCode)
{
    SimulatedClassicCard card;
    PcscCommandSet commandSet;
    ClassicProtocol protocol(card, commandSet);
    card.forcedStatus = 0x6300;

    auto written = protocol.writeBlock(4, BlockData(16, 0x00));
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().get<ApduError>(), ApduError::UnexpectedStatus);
    EXPECT_EQ(written.error().statusWord(), 0x6300);
    EXPECT_STREQ(written.error().message().c_str(), "0x6300");
}

TEST(ClassicProtocolTests, TransportFailureIsPropagated)
{
    SimulatedClassicCard card;
    PcscCommandSet commandSet;
    ClassicProtocol protocol(card, commandSet);
    card.failTransport = true;

    auto uid = protocol.getUid();
    ASSERT_FALSE(uid.has_value());
    EXPECT_EQ(uid.error().get<TransportError>(), TransportError::TransmitFailed);
}

TEST(ClassicProtocolTests, CommandSetErrorSendsNothing)
{
    SimulatedClassicCard card;
    PcscCommandSet commandSet;
    ClassicProtocol protocol(card, commandSet);

    auto loaded = protocol.loadKey(KeyType::A, KeyData(4, 0xFF));
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().get<ClassicError>(), ClassicError::InvalidKeyLength);
    EXPECT_EQ(card.commandCount(), 0U);
}

TEST(ClassicProtocolTests, LoadedKeySupersedesPrevious)
{
    SimulatedClassicCard card;
    PcscCommandSet commandSet;
    ClassicProtocol protocol(card, commandSet);

    ASSERT_TRUE(protocol.loadKey(KeyType::A, defaultKey()).has_value());
    ASSERT_TRUE(protocol.readBlock(1).has_value());

    ASSERT_TRUE(protocol.loadKey(KeyType::A, KeyData(6, 0x11)).has_value());
    auto block = protocol.readBlock(1);
    ASSERT_FALSE(block.has_value());
    EXPECT_EQ(block.error().get<ApduError>(), ApduError::SecurityStatusNotSatisfied);
}
