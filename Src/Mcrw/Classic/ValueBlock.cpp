/**
 * @file ValueBlock.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief MIFARE Classic value block codec
 * @version 0.1
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Mcrw/Classic/ValueBlock.h"

namespace mcrw
{
    namespace valueblock
    {
        void writeLe32(int32_t value, etl::ivector<uint8_t>& out)
        {
            const uint32_t raw = static_cast<uint32_t>(value);
            out.push_back(static_cast<uint8_t>(raw & 0xFFU));
            out.push_back(static_cast<uint8_t>((raw >> 8U) & 0xFFU));
            out.push_back(static_cast<uint8_t>((raw >> 16U) & 0xFFU));
            out.push_back(static_cast<uint8_t>((raw >> 24U) & 0xFFU));
        }

        int32_t readLe32(const uint8_t* data)
        {
            const uint32_t raw = static_cast<uint32_t>(data[0]) |
                                 (static_cast<uint32_t>(data[1]) << 8U) |
                                 (static_cast<uint32_t>(data[2]) << 16U) |
                                 (static_cast<uint32_t>(data[3]) << 24U);
            return static_cast<int32_t>(raw);
        }

        BlockData encode(int32_t value, uint8_t address)
        {
            BlockData block;
            const uint8_t invertedAddress = static_cast<uint8_t>(~address);

            writeLe32(value, block);
            writeLe32(~value, block);
            writeLe32(value, block);

            block.push_back(address);
            block.push_back(invertedAddress);
            block.push_back(address);
            block.push_back(invertedAddress);

            return block;
        }

        int32_t decodeValue(const etl::ivector<uint8_t>& block)
        {
            if (block.size() < 4U)
            {
                return 0;
            }
            return readLe32(block.data());
        }

    } // namespace valueblock

} // namespace mcrw
