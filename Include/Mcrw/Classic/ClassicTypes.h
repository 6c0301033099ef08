/**
 * @file ClassicTypes.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief MIFARE Classic shared types
 * @version 0.1
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/string.h>
#include <cstdint>

#include "Mcrw/BufferSizes.h"

namespace mcrw
{
    /**
     * @brief Key slot used for sector authentication
     *
     * Values are the MIFARE authentication command codes the reader expects.
     */
    enum class KeyType : uint8_t
    {
        A = 0x60,
        B = 0x61
    };

    /**
     * @brief Value block operation
     *
     * Values are the MIFARE value command codes.
     */
    enum class ValueOperation : uint8_t
    {
        Decrement = 0xC0,
        Increment = 0xC1
    };

    using BlockData = etl::vector<uint8_t, buffer::BLOCK_SIZE>;
    using SectorData = etl::vector<uint8_t, buffer::SECTOR_DATA_MAX>;
    using KeyData = etl::vector<uint8_t, buffer::KEY_SIZE>;
    using UidData = etl::vector<uint8_t, buffer::CARD_UID_MAX>;

    using BlockHexString = etl::string<buffer::BLOCK_HEX_SIZE>;
    using BlockText = etl::string<buffer::BLOCK_SIZE>;
    using SectorHexString = etl::string<buffer::SECTOR_HEX_MAX>;
    using SectorText = etl::string<buffer::SECTOR_DATA_MAX>;
    using UidHexString = etl::string<buffer::CARD_UID_HEX_MAX>;

} // namespace mcrw
