/**
 * @file ClassicError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines MIFARE Classic usage and validation error codes
 * @version 0.1
 * @date 2026-10-12
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    /**
     * @brief MIFARE Classic operation error codes
     * 
     * The offending value (length, block, sector) is kept in Error::detail().
     */
    enum class ClassicError : uint8_t {
        Ok = 0,
        TrailerAccessDenied,
        InvalidDataLength,
        InvalidStringLength,
        InvalidKeyLength,
        InvalidKeyType,
        InvalidHexString,
        BlockOutOfRange,
        SectorOutOfRange,
        NegativeValue
    };

} // namespace error
