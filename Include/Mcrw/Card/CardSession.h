/**
 * @file CardSession.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card session management
 * @version 0.2
 * @date 2026-10-15
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/expected.h>

#include "CardInfo.h"
#include "Mcrw/Classic/MifareClassicCard.h"
#include "Error/Error.h"

namespace mcrw
{
    class IApduTransceiver;
    class ICardCommandSet;

    /**
     * @brief Card session class
     * 
     * Binds an identified card to the transceiver it was detected on.
     * Valid until the card is released.
     */
    class CardSession
    {
    public:
        /**
         * @brief Get MIFARE Classic card
         * 
         * @return MifareClassicCard& Card operations of this session
         */
        MifareClassicCard& getMifareClassicCard();

        /**
         * @brief Get card type
         * 
         * @return CardType Card type
         */
        CardType getCardType() const;

        /**
         * @brief Get card info
         * 
         * @return const CardInfo& Card information
         */
        const CardInfo& getCardInfo() const;

        /**
         * @brief Create a card session
         * 
         * @param transceiver APDU transceiver
         * @param commandSet Reader command set
         * @param info Card information
         * @return etl::expected<CardSession, error::Error> Card session, or
         *         UnsupportedCardType for a card without a profile
         */
        static etl::expected<CardSession, error::Error> create(
            IApduTransceiver& transceiver,
            const ICardCommandSet& commandSet,
            const CardInfo& info);

    private:
        CardSession(IApduTransceiver& transceiver, const ICardCommandSet& commandSet, const CardInfo& info);

        MifareClassicCard card;
    };

} // namespace mcrw
