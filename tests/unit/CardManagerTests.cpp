#include <gtest/gtest.h>
#include "Mcrw/Card/CardManager.h"
#include "Mcrw/Classic/PcscCommandSet.h"
#include "SimulatedClassicCard.h"

using namespace mcrw;
using namespace error;

TEST(CardManagerTests, DetectCardReturnsProfile)
{
    SimulatedClassicCard simulated;
    PcscCommandSet commandSet;
    CardManager manager(simulated, simulated, commandSet);

    EXPECT_TRUE(manager.isCardPresent());

    auto info = manager.detectCard();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info.value().type, CardType::MifareClassic1K);
}

TEST(CardManagerTests, CreateSessionDetectsCardFirst)
{
    SimulatedClassicCard simulated;
    PcscCommandSet commandSet;
    CardManager manager(simulated, simulated, commandSet);

    EXPECT_FALSE(manager.getActiveSession().has_value());

    auto session = manager.createSession();
    ASSERT_TRUE(session.has_value()) << session.error().toString().c_str();
    EXPECT_EQ(simulated.detectCount, 1);
    EXPECT_EQ(session.value()->getCardType(), CardType::MifareClassic1K);
    EXPECT_EQ(session.value()->getCardInfo().sectorsNumber, 16);

    auto active = manager.getActiveSession();
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active.value(), session.value());
}

TEST(CardManagerTests, SessionOperatesOnCard)
{
    SimulatedClassicCard simulated;
    PcscCommandSet commandSet;
    CardManager manager(simulated, simulated, commandSet);

    auto session = manager.createSession();
    ASSERT_TRUE(session.has_value());

    MifareClassicCard& card = session.value()->getMifareClassicCard();
    ASSERT_TRUE(card.loadKey(KeyType::A, "FFFFFFFFFFFF").has_value());
    ASSERT_TRUE(card.writeBlockString(1, "session").has_value());
    EXPECT_EQ(simulated.blocks[1][0], 's');
}

TEST(CardManagerTests, NoCardPresent)
{
    SimulatedClassicCard simulated;
    simulated.present = false;
    PcscCommandSet commandSet;
    CardManager manager(simulated, simulated, commandSet);

    EXPECT_FALSE(manager.isCardPresent());

    auto session = manager.createSession();
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().get<CardError>(), CardError::NoCardPresent);
    EXPECT_FALSE(manager.getActiveSession().has_value());
}

TEST(CardManagerTests, UnsupportedCardCreatesNoSession)
{
    SimulatedClassicCard simulated;
    simulated.atr[14] = 0x03;
    PcscCommandSet commandSet;
    CardManager manager(simulated, simulated, commandSet);

    auto session = manager.createSession();
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().get<CardError>(), CardError::UnsupportedCardType);
    EXPECT_EQ(session.error().detail(), 0x0003);
    EXPECT_FALSE(manager.getActiveSession().has_value());
}

TEST(CardManagerTests, SessionRequiresKnownCardType)
{
    SimulatedClassicCard simulated;
    PcscCommandSet commandSet;
    CardInfo unknown;

    auto session = CardSession::create(simulated, commandSet, unknown);
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().get<CardError>(), CardError::UnsupportedCardType);
}

TEST(CardManagerTests, ClearSessionReleasesCard)
{
    SimulatedClassicCard simulated;
    PcscCommandSet commandSet;
    CardManager manager(simulated, simulated, commandSet);

    ASSERT_TRUE(manager.createSession().has_value());
    ASSERT_TRUE(manager.clearSession().has_value());

    EXPECT_EQ(simulated.releaseCount, 1);
    EXPECT_FALSE(manager.getActiveSession().has_value());

    // A new session detects the card again
    ASSERT_TRUE(manager.createSession().has_value());
    EXPECT_EQ(simulated.detectCount, 2);
}

TEST(CardManagerTests, IndependentSessionsDoNotShareState)
{
    SimulatedClassicCard first;
    SimulatedClassicCard second(true);
    PcscCommandSet commandSet;
    CardManager firstManager(first, first, commandSet);
    CardManager secondManager(second, second, commandSet);

    auto firstSession = firstManager.createSession();
    auto secondSession = secondManager.createSession();
    ASSERT_TRUE(firstSession.has_value());
    ASSERT_TRUE(secondSession.has_value());

    EXPECT_EQ(firstSession.value()->getCardType(), CardType::MifareClassic1K);
    EXPECT_EQ(secondSession.value()->getCardType(), CardType::MifareClassic4K);

    ASSERT_TRUE(firstSession.value()->getMifareClassicCard().loadKey(KeyType::A, "FFFFFFFFFFFF").has_value());
    EXPECT_TRUE(first.keyALoaded);
    EXPECT_FALSE(second.keyALoaded);
}
