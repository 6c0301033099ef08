/**
 * @file ICardCommandSet.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Reader specific MIFARE Classic command set interface
 * @version 0.1
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <etl/string_view.h>
#include <etl/vector.h>
#include <cstdint>

#include "Mcrw/Apdu/ApduCommand.h"
#include "Mcrw/Classic/ClassicTypes.h"
#include "Error/Error.h"

namespace mcrw
{
    /**
     * @brief Builds the command APDUs for MIFARE Classic operations
     *
     * Readers expose MIFARE Classic through vendor APDUs. ClassicProtocol
     * only depends on this interface, so a reader with different command
     * bytes gets its own implementation instead of a protocol subclass.
     */
    class ICardCommandSet
    {
    public:
        virtual ~ICardCommandSet() = default;

        /**
         * @brief Get command set name
         *
         * @return etl::string_view Name used in logs
         */
        virtual etl::string_view name() const = 0;

        virtual etl::expected<ApduCommand, error::Error> getUid() const = 0;

        /**
         * @brief Build a load key command
         *
         * @param keyType Key slot
         * @param key 6 byte key
         * @return etl::expected<ApduCommand, error::Error> Command or error
         */
        virtual etl::expected<ApduCommand, error::Error> loadKey(
            KeyType keyType,
            const etl::ivector<uint8_t>& key) const = 0;

        virtual etl::expected<ApduCommand, error::Error> readBlock(uint8_t block) const = 0;

        virtual etl::expected<ApduCommand, error::Error> writeBlock(
            uint8_t block,
            const etl::ivector<uint8_t>& data) const = 0;

        /**
         * @brief Build a value block increment/decrement command
         *
         * @param operation Increment or decrement
         * @param block Target value block
         * @param value Amount, little-endian in the frame
         * @return etl::expected<ApduCommand, error::Error> Command or error
         */
        virtual etl::expected<ApduCommand, error::Error> valueBlock(
            ValueOperation operation,
            uint8_t block,
            int32_t value) const = 0;
    };

} // namespace mcrw
