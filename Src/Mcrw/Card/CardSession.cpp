/**
 * @file CardSession.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card session implementation
 * @version 0.2
 * @date 2026-10-15
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Mcrw/Card/CardSession.h"
#include "Utils/Logging.h"

namespace mcrw
{
    CardSession::CardSession(
        IApduTransceiver& transceiver,
        const ICardCommandSet& commandSet,
        const CardInfo& info)
        : card(transceiver, commandSet, info)
    {
    }

    MifareClassicCard& CardSession::getMifareClassicCard()
    {
        return card;
    }

    CardType CardSession::getCardType() const
    {
        return card.getCardInfo().type;
    }

    const CardInfo& CardSession::getCardInfo() const
    {
        return card.getCardInfo();
    }

    etl::expected<CardSession, error::Error> CardSession::create(
        IApduTransceiver& transceiver,
        const ICardCommandSet& commandSet,
        const CardInfo& info)
    {
        switch (info.type)
        {
            case CardType::MifareClassic1K:
            case CardType::MifareClassic4K:
                break;

            default:
                LOG_ERROR("Cannot open a session on an unidentified card");
                return etl::unexpected(error::Error::fromCard(error::CardError::UnsupportedCardType));
        }

        LOG_INFO("Session opened on %.*s (%u blocks, %u sectors)",
                 static_cast<int>(info.typeName().size()), info.typeName().data(),
                 static_cast<unsigned>(info.blocksNumber), static_cast<unsigned>(info.sectorsNumber));

        return CardSession(transceiver, commandSet, info);
    }

} // namespace mcrw
