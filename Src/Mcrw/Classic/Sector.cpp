/**
 * @file Sector.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief MIFARE Classic sector addressing
 * @version 0.1
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Mcrw/Classic/Sector.h"

namespace
{
    constexpr uint16_t SMALL_SECTOR_COUNT = 32;
    constexpr uint16_t SMALL_SECTOR_BLOCKS = 4;
    constexpr uint16_t LARGE_SECTOR_BLOCKS = 16;
    constexpr uint16_t LARGE_SECTOR_FIRST_BLOCK = SMALL_SECTOR_COUNT * SMALL_SECTOR_BLOCKS; // 128
}

namespace mcrw
{
    Sector Sector::resolve(uint16_t sectorIndex)
    {
        Sector sector;
        sector.number = sectorIndex;

        if (sectorIndex < SMALL_SECTOR_COUNT)
        {
            sector.startBlock = static_cast<uint16_t>(sectorIndex * SMALL_SECTOR_BLOCKS);
            sector.blocksInSector = SMALL_SECTOR_BLOCKS;
        }
        else
        {
            sector.startBlock = static_cast<uint16_t>(
                LARGE_SECTOR_FIRST_BLOCK + (sectorIndex - SMALL_SECTOR_COUNT) * LARGE_SECTOR_BLOCKS);
            sector.blocksInSector = LARGE_SECTOR_BLOCKS;
        }

        return sector;
    }

    bool isSectorTrailer(uint16_t block)
    {
        return block < LARGE_SECTOR_FIRST_BLOCK
            ? (block + 1U) % SMALL_SECTOR_BLOCKS == 0U
            : (block + 1U) % LARGE_SECTOR_BLOCKS == 0U;
    }

    uint16_t sectorOfBlock(uint16_t block)
    {
        if (block < LARGE_SECTOR_FIRST_BLOCK)
        {
            return static_cast<uint16_t>(block / SMALL_SECTOR_BLOCKS);
        }
        return static_cast<uint16_t>(SMALL_SECTOR_COUNT + (block - LARGE_SECTOR_FIRST_BLOCK) / LARGE_SECTOR_BLOCKS);
    }

} // namespace mcrw
