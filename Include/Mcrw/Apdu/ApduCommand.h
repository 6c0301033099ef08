/**
 * @file ApduCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines APDU command structure
 * @version 0.1
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <cstdint>

#include "Mcrw/BufferSizes.h"

namespace mcrw
{
    /**
     * @brief Short ISO 7816-4 command APDU
     *
     * Serialized as CLA INS P1 P2 [Lc Data] [Le]. An expected length of 256
     * is encoded as Le = 0x00; 0 means no Le byte.
     */
    struct ApduCommand
    {
        uint8_t cla;
        uint8_t ins;
        uint8_t p1;
        uint8_t p2;
        etl::vector<uint8_t, buffer::APDU_COMMAND_DATA_MAX> data;
        uint16_t expectedLength;

        ApduCommand() : cla(0), ins(0), p1(0), p2(0), data(), expectedLength(0) {}

        ApduCommand(uint8_t cla, uint8_t ins, uint8_t p1, uint8_t p2, uint16_t expectedLength = 0)
            : cla(cla), ins(ins), p1(p1), p2(p2), data(), expectedLength(expectedLength) {}

        etl::vector<uint8_t, buffer::APDU_COMMAND_MAX> serialize() const;
    };

} // namespace mcrw
