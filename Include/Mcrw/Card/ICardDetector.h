/**
 * @file ICardDetector.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card detection interface
 * @version 0.2
 * @date 2026-10-14
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/expected.h>

#include "Error/Error.h"
#include "CardInfo.h"

namespace mcrw
{
    /**
     * @brief Interface for card detection and connection lifecycle
     */
    class ICardDetector
    {
    public:
        virtual ~ICardDetector() = default;

        /**
         * @brief Wait for a card, connect to it and identify it from its ATR
         * 
         * @return etl::expected<CardInfo, error::Error> Card profile or error
         */
        virtual etl::expected<CardInfo, error::Error> detectCard() = 0;

        /**
         * @brief Check if a card is present
         * 
         * @return bool True if card is present
         */
        virtual bool isCardPresent() = 0;

        /**
         * @brief Disconnect from the current card
         * 
         * @return etl::expected<void, error::Error> Success or error
         */
        virtual etl::expected<void, error::Error> releaseCard() = 0;
    };

} // namespace mcrw
