/**
 * @file Sector.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief MIFARE Classic sector addressing
 * @version 0.1
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>

namespace mcrw
{
    /**
     * @brief Physical block range of one sector
     *
     * Sectors 0-31 hold 4 blocks, sectors 32 and up (4K cards) hold 16. The
     * last block of every sector is its trailer.
     */
    struct Sector
    {
        uint16_t number;
        uint16_t startBlock;
        uint16_t blocksInSector;

        /**
         * @brief Resolve a sector index to its block range
         *
         * Does not check the index against the card size.
         *
         * @param sectorIndex Sector number
         * @return Sector Block range
         */
        static Sector resolve(uint16_t sectorIndex);

        uint16_t dataBlocks() const
        {
            return static_cast<uint16_t>(blocksInSector - 1U);
        }

        uint16_t trailerBlock() const
        {
            return static_cast<uint16_t>(startBlock + blocksInSector - 1U);
        }

        bool contains(uint16_t block) const
        {
            return block >= startBlock && block < startBlock + blocksInSector;
        }
    };

    /**
     * @brief Check whether a block is a sector trailer
     *
     * @param block Absolute block index
     * @return true Block is the last block of its sector
     */
    bool isSectorTrailer(uint16_t block);

    /**
     * @brief Sector index containing a block
     */
    uint16_t sectorOfBlock(uint16_t block);

} // namespace mcrw
