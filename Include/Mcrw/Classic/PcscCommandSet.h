/**
 * @file PcscCommandSet.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief PC/SC pseudo-APDU command set for MIFARE Classic
 * @version 0.1
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "Mcrw/Classic/ICardCommandSet.h"

namespace mcrw
{
    /**
     * @brief PC/SC Part 3 storage card commands (CLA 0xFF)
     *
     * Frames:
     * - Get UID:      FF CA 00 00 00
     * - Load key:     FF 82 00 <60|61> 06 <key>
     * - Read block:   FF B0 00 <block> 10
     * - Write block:  FF D6 00 <block> 10 <data>
     * - Value block:  FF F0 00 <block> 06 <C0|C1> <block> <LE32 value>
     */
    class PcscCommandSet : public ICardCommandSet
    {
    public:
        static constexpr uint8_t CLASS = 0xFF;
        static constexpr uint8_t GET_UID = 0xCA;
        static constexpr uint8_t LOAD_KEY = 0x82;
        static constexpr uint8_t READ_BLOCK = 0xB0;
        static constexpr uint8_t WRITE_BLOCK = 0xD6;
        static constexpr uint8_t VALUE_BLOCK_COMMAND = 0xF0;

        etl::string_view name() const override;

        etl::expected<ApduCommand, error::Error> getUid() const override;

        etl::expected<ApduCommand, error::Error> loadKey(
            KeyType keyType,
            const etl::ivector<uint8_t>& key) const override;

        etl::expected<ApduCommand, error::Error> readBlock(uint8_t block) const override;

        etl::expected<ApduCommand, error::Error> writeBlock(
            uint8_t block,
            const etl::ivector<uint8_t>& data) const override;

        etl::expected<ApduCommand, error::Error> valueBlock(
            ValueOperation operation,
            uint8_t block,
            int32_t value) const override;
    };

} // namespace mcrw
