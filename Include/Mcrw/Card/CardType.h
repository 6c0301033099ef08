/**
 * @file CardType.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines supported card types
 * @version 0.2
 * @date 2026-10-14
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <cstdint>

namespace mcrw
{
    enum class CardType : uint8_t {
        Unknown = 0,
        MifareClassic1K,
        MifareClassic4K
    };

} // namespace mcrw
