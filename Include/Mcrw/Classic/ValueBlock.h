/**
 * @file ValueBlock.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief MIFARE Classic value block codec
 * @version 0.1
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <cstdint>

#include "Mcrw/Classic/ClassicTypes.h"

namespace mcrw
{
    namespace valueblock
    {
        /**
         * @brief Encode a value block
         *
         * Layout: LE32(value) | LE32(~value) | LE32(value) | addr ~addr addr ~addr
         *
         * @param value Signed counter value
         * @param address Address byte stored with the value
         * @return BlockData 16 byte block
         */
        BlockData encode(int32_t value, uint8_t address);

        /**
         * @brief Decode the value of a value block
         *
         * Reads the first 4 bytes as little-endian int32. The redundant copies
         * are not checked.
         *
         * @param block Block data, at least 4 bytes
         * @return int32_t Value
         */
        int32_t decodeValue(const etl::ivector<uint8_t>& block);

        void writeLe32(int32_t value, etl::ivector<uint8_t>& out);

        int32_t readLe32(const uint8_t* data);

    } // namespace valueblock

} // namespace mcrw
