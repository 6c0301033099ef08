/**
 * @file CardInfo.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Implementation of CardInfo methods
 * @version 0.2
 * @date 2026-10-14
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Mcrw/Card/CardInfo.h"
#include "Utils/Hex.h"
#include <cstdio>

using namespace mcrw;

namespace
{
    // Card name bytes inside the PC/SC storage card ATR
    constexpr size_t ATR_CARD_NAME_OFFSET = 13;
    constexpr size_t ATR_MIN_LENGTH = ATR_CARD_NAME_OFFSET + 2;

    constexpr uint16_t CARD_NAME_MIFARE_1K = 0x0001;
    constexpr uint16_t CARD_NAME_MIFARE_4K = 0x0002;
}

etl::expected<CardInfo, error::Error> CardInfo::fromAtr(const etl::ivector<uint8_t>& atr)
{
    if (atr.size() < ATR_MIN_LENGTH || atr.size() > buffer::ATR_MAX)
    {
        return etl::unexpected(error::Error::fromCard(error::CardError::UnknownCardType));
    }

    CardInfo info;
    info.atr.assign(atr.begin(), atr.end());

    const uint16_t cardName = static_cast<uint16_t>(
        (static_cast<uint16_t>(atr[ATR_CARD_NAME_OFFSET]) << 8) | atr[ATR_CARD_NAME_OFFSET + 1]);

    switch (cardName)
    {
        case CARD_NAME_MIFARE_1K:
            info.type = CardType::MifareClassic1K;
            info.blocksNumber = 64;
            info.sectorsNumber = 16;
            break;

        case CARD_NAME_MIFARE_4K:
            info.type = CardType::MifareClassic4K;
            info.blocksNumber = 256;
            info.sectorsNumber = 40;
            break;

        default:
            return etl::unexpected(error::Error::fromCard(error::CardError::UnsupportedCardType, cardName));
    }

    return info;
}

bool CardInfo::isValidBlock(uint16_t block) const
{
    return block < blocksNumber;
}

bool CardInfo::isValidSector(uint16_t sector) const
{
    return sector < sectorsNumber;
}

etl::string_view CardInfo::typeName() const
{
    switch (type)
    {
        case CardType::MifareClassic1K:
            return "Mifare Classic 1K";
        case CardType::MifareClassic4K:
            return "Mifare Classic 4K";
        default:
            return "Unknown";
    }
}

etl::string<buffer::ATR_HEX_MAX> CardInfo::atrHexString() const
{
    etl::string<buffer::ATR_HEX_MAX> hex;
    utils::toHex(atr, hex);
    return hex;
}

etl::string<255> CardInfo::toString() const
{
    char text[256];
    const auto name = typeName();
    const auto atrHex = atrHexString();

    std::snprintf(text, sizeof(text),
                 "Card Type: %.*s\n"
                 "ATR: %s\n"
                 "Blocks: %u\n"
                 "Sectors: %u",
                 static_cast<int>(name.size()), name.data(),
                 atrHex.c_str(),
                 static_cast<unsigned>(blocksNumber),
                 static_cast<unsigned>(sectorsNumber));

    return etl::string<255>(text);
}
