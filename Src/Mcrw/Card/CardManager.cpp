/**
 * @file CardManager.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card manager implementation
 * @version 0.2
 * @date 2026-10-15
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Mcrw/Card/CardManager.h"
#include "Utils/Logging.h"

namespace mcrw
{
    CardManager::CardManager(
        IApduTransceiver& transceiverRef,
        ICardDetector& detectorRef,
        const ICardCommandSet& commandSetRef)
        : transceiver(transceiverRef)
        , detector(detectorRef)
        , commandSet(commandSetRef)
    {
    }

    etl::expected<CardInfo, error::Error> CardManager::detectCard()
    {
        auto result = detector.detectCard();

        if (result.has_value())
        {
            currentCardInfo = result.value();
            return result.value();
        }

        currentCardInfo.reset();
        return etl::unexpected(result.error());
    }

    bool CardManager::isCardPresent()
    {
        return detector.isCardPresent();
    }

    etl::expected<CardSession*, error::Error> CardManager::createSession()
    {
        if (!currentCardInfo.has_value())
        {
            auto detectResult = detectCard();
            if (!detectResult.has_value())
            {
                return etl::unexpected(detectResult.error());
            }
        }

        auto sessionResult = CardSession::create(transceiver, commandSet, currentCardInfo.value());

        if (!sessionResult.has_value())
        {
            return etl::unexpected(sessionResult.error());
        }

        // Sessions hold references, so replace instead of assigning
        activeSession.reset();
        activeSession.emplace(sessionResult.value());
        return &activeSession.value();
    }

    etl::optional<CardSession*> CardManager::getActiveSession()
    {
        if (activeSession.has_value())
        {
            return &activeSession.value();
        }
        return etl::nullopt;
    }

    etl::expected<void, error::Error> CardManager::clearSession()
    {
        activeSession.reset();
        currentCardInfo.reset();

        auto released = detector.releaseCard();
        if (!released)
        {
            LOG_WARN("Card release failed: %s", released.error().toString().c_str());
        }
        return released;
    }

} // namespace mcrw
