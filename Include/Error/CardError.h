/**
 * @file CardError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines card identification and session error codes
 * @version 0.1
 * @date 2026-10-12
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class CardError : uint8_t {
        Ok = 0,
        NoCardPresent,
        UnknownCardType,
        UnsupportedCardType
    };

} // namespace error
