/**
 * @file BufferSizes.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Buffer size constants for the APDU and MIFARE Classic layers
 * @version 0.2
 * @date 2026-10-12
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstddef>

namespace mcrw
{
    namespace buffer
    {
        // ========================================================================
        // ISO 7816-4 APDU Layer
        // ========================================================================

        /**
         * @brief Maximum APDU command size
         *
         * Calculation:
         * - Header: 4 bytes (CLA INS P1 P2)
         * - Lc: 1 byte (data length)
         * - Data: 255 bytes maximum
         * - Le: 1 byte (expected response length)
         * Total: 4 + 1 + 255 + 1 = 261 bytes
         */
        constexpr size_t APDU_COMMAND_MAX = 261;

        /**
         * @brief Maximum APDU response size
         *
         * Calculation:
         * - Data: 256 bytes maximum
         * - Status: 2 bytes (SW1 SW2)
         * Total: 256 + 2 = 258 bytes
         */
        constexpr size_t APDU_RESPONSE_MAX = 258;

        /**
         * @brief Maximum APDU response data (without status)
         */
        constexpr size_t APDU_DATA_MAX = 256;

        /**
         * @brief APDU command data maximum (excluding CLA INS P1 P2 Lc Le)
         */
        constexpr size_t APDU_COMMAND_DATA_MAX = 255;

        /**
         * @brief CLA(1) + INS(1) + P1(1) + P2(1) = 4 bytes
         */
        constexpr size_t APDU_HEADER_SIZE = 4;

        /**
         * @brief SW1(1) + SW2(1) = 2 bytes
         */
        constexpr size_t APDU_STATUS_SIZE = 2;

        // ========================================================================
        // Card identification
        // ========================================================================

        /**
         * @brief Maximum ATR length (ISO 7816-3)
         */
        constexpr size_t ATR_MAX = 33;

        constexpr size_t ATR_HEX_MAX = ATR_MAX * 2;

        /**
         * @brief UID maximum size (4, 7 or 10 bytes)
         */
        constexpr size_t CARD_UID_MAX = 10;

        constexpr size_t CARD_UID_HEX_MAX = CARD_UID_MAX * 2;

        // ========================================================================
        // MIFARE Classic memory layout
        // ========================================================================

        /**
         * @brief Bytes per block
         */
        constexpr size_t BLOCK_SIZE = 16;

        constexpr size_t BLOCK_HEX_SIZE = BLOCK_SIZE * 2;

        /**
         * @brief Key A / Key B size
         */
        constexpr size_t KEY_SIZE = 6;

        constexpr size_t KEY_HEX_SIZE = KEY_SIZE * 2;

        /**
         * @brief Largest sector data area
         *
         * Calculation:
         * - Sectors 32-39 of a 4K card have 16 blocks
         * - Minus the sector trailer: 15 data blocks
         * Total: 15 * 16 = 240 bytes
         */
        constexpr size_t SECTOR_DATA_MAX = 15 * BLOCK_SIZE;

        constexpr size_t SECTOR_HEX_MAX = SECTOR_DATA_MAX * 2;

    } // namespace buffer

} // namespace mcrw
