/**
 * @file CardInfo.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines card profile derived from the ATR
 * @version 0.2
 * @date 2026-10-14
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/vector.h>
#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/expected.h>

#include <cstdint>

#include "CardType.h"
#include "Mcrw/BufferSizes.h"
#include "Error/Error.h"

namespace mcrw
{

   struct CardInfo {
      etl::vector<uint8_t, buffer::ATR_MAX> atr;   // Answer To Reset
      CardType type;                               // Detected card type
      uint16_t blocksNumber;                       // Total blocks on the card
      uint16_t sectorsNumber;                      // Total sectors on the card

      CardInfo() : atr(), type(CardType::Unknown), blocksNumber(0), sectorsNumber(0) {}

      /**
       * @brief Build the card profile from an ATR
       *
       * PC/SC readers report storage cards with the card name code in ATR
       * bytes 13-14 (hex characters 26-30): 0001 is a 1K card, 0002 a 4K card.
       *
       * @param atr ATR bytes
       * @return etl::expected<CardInfo, error::Error> Profile, UnknownCardType if
       *         the ATR is too short, UnsupportedCardType for other codes
       */
      static etl::expected<CardInfo, error::Error> fromAtr(const etl::ivector<uint8_t>& atr);

      bool isValidBlock(uint16_t block) const;

      bool isValidSector(uint16_t sector) const;

      etl::string_view typeName() const;

      etl::string<buffer::ATR_HEX_MAX> atrHexString() const;

      etl::string<255> toString() const;
   };

} // namespace mcrw
