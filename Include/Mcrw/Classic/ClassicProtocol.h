/**
 * @file ClassicProtocol.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief MIFARE Classic APDU protocol layer
 * @version 0.1
 * @date 2026-10-14
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <etl/vector.h>
#include <cstdint>

#include "Mcrw/Apdu/ApduCommand.h"
#include "Mcrw/Apdu/ApduResponse.h"
#include "Mcrw/Classic/ClassicTypes.h"
#include "Error/Error.h"

namespace mcrw
{
    class IApduTransceiver;
    class ICardCommandSet;

    /**
     * @brief One logical card operation per command exchange
     *
     * Builds the frame through the command set, transmits it and classifies
     * the status word. Nothing is retried; the first failure is returned.
     * Authentication state is not tracked here, the reader answers 0x6982
     * when the loaded key does not open the addressed sector.
     */
    class ClassicProtocol
    {
    public:
        ClassicProtocol(IApduTransceiver& transceiver, const ICardCommandSet& commandSet);

        /**
         * @brief Read the card UID
         *
         * @return etl::expected<UidData, error::Error> UID bytes or error
         */
        etl::expected<UidData, error::Error> getUid();

        /**
         * @brief Load a key into the reader for the given slot
         *
         * Supersedes any key previously loaded for that slot.
         *
         * @param keyType Key slot (A or B)
         * @param key 6 byte key
         * @return etl::expected<void, error::Error> Success or error
         */
        etl::expected<void, error::Error> loadKey(KeyType keyType, const etl::ivector<uint8_t>& key);

        etl::expected<BlockData, error::Error> readBlock(uint8_t block);

        etl::expected<void, error::Error> writeBlock(uint8_t block, const etl::ivector<uint8_t>& data);

        /**
         * @brief Increment or decrement a value block
         *
         * @param operation Direction
         * @param block Value block
         * @param value Amount
         * @return etl::expected<void, error::Error> Success or error
         */
        etl::expected<void, error::Error> valueBlockCommand(ValueOperation operation, uint8_t block, int32_t value);

    private:
        etl::expected<ApduResponse, error::Error> exchange(
            const etl::expected<ApduCommand, error::Error>& command);

        IApduTransceiver& transceiver;
        const ICardCommandSet& commandSet;
    };

} // namespace mcrw
