/**
 * @file CardManager.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card manager for reader operations
 * @version 0.2
 * @date 2026-10-15
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/optional.h>
#include <etl/expected.h>

#include "Mcrw/Apdu/IApduTransceiver.h"
#include "Mcrw/Card/ICardDetector.h"
#include "Mcrw/Classic/ICardCommandSet.h"
#include "CardInfo.h"
#include "CardSession.h"
#include "Error/Error.h"

namespace mcrw
{
    /**
     * @brief Card manager for reader operations
     * 
     * Manages card detection and the lifetime of the single active session
     */
    class CardManager
    {
    public:
        /**
         * @brief Construct a new CardManager
         * 
         * @param transceiver APDU transceiver reference
         * @param detector Card detector reference
         * @param commandSet Command set spoken by the reader
         */
        CardManager(
            IApduTransceiver& transceiver,
            ICardDetector& detector,
            const ICardCommandSet& commandSet);

        /**
         * @brief Detect card
         * 
         * @return etl::expected<CardInfo, error::Error> Card info or error
         */
        etl::expected<CardInfo, error::Error> detectCard();

        bool isCardPresent();

        /**
         * @brief Create a card session
         * 
         * Detects the card first when none has been detected yet. A previous
         * session is replaced.
         * 
         * @return etl::expected<CardSession*, error::Error> Pointer to session or error
         */
        etl::expected<CardSession*, error::Error> createSession();

        /**
         * @brief Get active session
         * 
         * @return etl::optional<CardSession*> Pointer to session if active
         */
        etl::optional<CardSession*> getActiveSession();

        /**
         * @brief Drop the active session and release the card
         * 
         * @return etl::expected<void, error::Error> Result of the release
         */
        etl::expected<void, error::Error> clearSession();

    private:
        IApduTransceiver& transceiver;
        ICardDetector& detector;
        const ICardCommandSet& commandSet;

        etl::optional<CardInfo> currentCardInfo;
        etl::optional<CardSession> activeSession;
    };

} // namespace mcrw
