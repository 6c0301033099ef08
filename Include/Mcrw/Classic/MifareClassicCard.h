/**
 * @file MifareClassicCard.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief MIFARE Classic card implementation
 * @version 0.2
 * @date 2026-10-14
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <etl/string_view.h>
#include <etl/vector.h>

#include <cstdint>
#include <string>

#include "Mcrw/Card/CardInfo.h"
#include "Mcrw/Classic/ClassicProtocol.h"
#include "Mcrw/Classic/ClassicTypes.h"
#include "Mcrw/Classic/Sector.h"
#include "Error/Error.h"

namespace mcrw
{
    class IApduTransceiver;
    class ICardCommandSet;

    /**
     * @brief MIFARE Classic card class
     *
     * Block, sector and value block operations on top of ClassicProtocol.
     * Every block and sector index is checked against the card profile.
     * Sector trailers are only reachable through the *SectorTrailer calls
     * (or allowTrailer), plain block access to a trailer fails before any
     * command is sent.
     */
    class MifareClassicCard
    {
    public:
        /**
         * @brief Construct a new MifareClassicCard
         *
         * @param transceiver APDU transceiver of the connected card
         * @param commandSet Reader command set
         * @param info Card profile
         */
        MifareClassicCard(IApduTransceiver& transceiver, const ICardCommandSet& commandSet, const CardInfo& info);

        const CardInfo& getCardInfo() const;

        // ---------------------------------------------------------------------
        // Identification and keys
        // ---------------------------------------------------------------------

        etl::expected<UidData, error::Error> getUid();

        etl::expected<UidHexString, error::Error> getUidHexString();

        /**
         * @brief Load a key into the reader
         *
         * @param keyType Key slot
         * @param key 6 byte key
         * @return etl::expected<void, error::Error> Success or error
         */
        etl::expected<void, error::Error> loadKey(KeyType keyType, const etl::ivector<uint8_t>& key);

        /**
         * @brief Load a key given as 12 hex digits
         */
        etl::expected<void, error::Error> loadKey(KeyType keyType, etl::string_view hexKey);

        // ---------------------------------------------------------------------
        // Blocks
        // ---------------------------------------------------------------------

        /**
         * @brief Read one block
         *
         * @param block Absolute block index
         * @param allowTrailer Permit reading a sector trailer
         * @return etl::expected<BlockData, error::Error> 16 bytes or error
         */
        etl::expected<BlockData, error::Error> readBlock(uint16_t block, bool allowTrailer = false);

        etl::expected<BlockHexString, error::Error> readBlockHexString(uint16_t block);

        etl::expected<BlockText, error::Error> readBlockString(uint16_t block);

        /**
         * @brief Write one block
         *
         * @param block Absolute block index
         * @param data Exactly 16 bytes
         * @param allowTrailer Permit writing a sector trailer
         * @return etl::expected<void, error::Error> Success or error
         */
        etl::expected<void, error::Error> writeBlock(
            uint16_t block,
            const etl::ivector<uint8_t>& data,
            bool allowTrailer = false);

        etl::expected<void, error::Error> writeBlockHexString(uint16_t block, etl::string_view hexData);

        /**
         * @brief Write up to 16 bytes of UTF-8 text, zero padded
         */
        etl::expected<void, error::Error> writeBlockString(uint16_t block, etl::string_view text);

        etl::expected<void, error::Error> clearBlock(uint16_t block);

        // ---------------------------------------------------------------------
        // Value blocks
        // ---------------------------------------------------------------------

        etl::expected<int32_t, error::Error> readValueBlock(uint16_t block);

        /**
         * @brief Add a non-negative amount to a value block
         */
        etl::expected<void, error::Error> incrementValueBlock(uint16_t block, int32_t value);

        /**
         * @brief Subtract a non-negative amount from a value block
         */
        etl::expected<void, error::Error> decrementValueBlock(uint16_t block, int32_t value);

        /**
         * @brief Write a zero valued value block (address byte 0x00)
         */
        etl::expected<void, error::Error> formatValueBlock(uint16_t block);

        // ---------------------------------------------------------------------
        // Sectors
        // ---------------------------------------------------------------------

        /**
         * @brief Read the data blocks of a sector, trailer excluded
         *
         * @param sector Sector index
         * @return etl::expected<SectorData, error::Error> dataBlocks * 16 bytes or error
         */
        etl::expected<SectorData, error::Error> readSector(uint16_t sector);

        etl::expected<SectorHexString, error::Error> readSectorHexString(uint16_t sector);

        etl::expected<SectorText, error::Error> readSectorString(uint16_t sector);

        /**
         * @brief Write the data blocks of a sector
         *
         * Data shorter than the sector capacity is padded with zero bytes.
         *
         * @param sector Sector index
         * @param data At most dataBlocks * 16 bytes
         * @return etl::expected<void, error::Error> Success or error
         */
        etl::expected<void, error::Error> writeSector(uint16_t sector, const etl::ivector<uint8_t>& data);

        etl::expected<void, error::Error> writeSectorHexString(uint16_t sector, etl::string_view hexData);

        etl::expected<void, error::Error> writeSectorString(uint16_t sector, etl::string_view text);

        etl::expected<void, error::Error> clearSector(uint16_t sector);

        // ---------------------------------------------------------------------
        // Sector trailers
        // ---------------------------------------------------------------------

        etl::expected<BlockData, error::Error> readSectorTrailer(uint16_t sector);

        etl::expected<BlockHexString, error::Error> readSectorTrailerHexString(uint16_t sector);

        etl::expected<void, error::Error> writeSectorTrailer(uint16_t sector, const etl::ivector<uint8_t>& data);

        etl::expected<void, error::Error> writeSectorTrailerHexString(uint16_t sector, etl::string_view hexData);

        // ---------------------------------------------------------------------
        // Reports
        // ---------------------------------------------------------------------

        /**
         * @brief Dump every block of a sector, trailer included
         *
         * One line per block: index, hex dump and an annotation, or the error
         * message if the block could not be read. Never fails as a whole.
         *
         * @param sector Sector index
         * @return std::string Report
         */
        std::string readSectorInfo(uint16_t sector);

        /**
         * @brief Card summary followed by readSectorInfo for every sector
         *
         * @param readerName Name of the reader the card sits on
         * @return std::string Report
         */
        std::string readCardInfo(etl::string_view readerName);

    private:
        etl::expected<Sector, error::Error> resolveSector(uint16_t sector) const;

        etl::expected<uint8_t, error::Error> checkBlock(uint16_t block, bool allowTrailer) const;

        etl::expected<void, error::Error> valueBlockCommand(ValueOperation operation, uint16_t block, int32_t value);

        ClassicProtocol protocol;
        CardInfo info;
    };

} // namespace mcrw
