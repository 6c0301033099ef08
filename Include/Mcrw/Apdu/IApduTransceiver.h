/**
 * @file IApduTransceiver.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines APDU transceiver interface
 * @version 0.2
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <etl/vector.h>

#include "Error/Error.h"
#include "Mcrw/Apdu/ApduResponse.h"

namespace mcrw
{
    /**
     * @brief Interface for APDU transceivers
     * 
     * One call is one command/response exchange with the connected card.
     * Failures of the exchange itself are returned as errors; the card's
     * status word is returned untouched inside the ApduResponse.
     */
    class IApduTransceiver
    {
    public:
        virtual ~IApduTransceiver() = default;

        /**
         * @brief Transmits a serialized command APDU and receives the response
         *
         * @param apdu Command APDU bytes (CLA INS P1 P2 [Lc Data] [Le])
         * @return etl::expected<ApduResponse, error::Error> 
         *         Response with status word, or transport error
         */
        virtual etl::expected<ApduResponse, error::Error> transceive(
            const etl::ivector<uint8_t> &apdu) = 0;
    };

} // namespace mcrw
