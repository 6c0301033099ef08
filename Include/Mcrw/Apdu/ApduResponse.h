/**
 * @file ApduResponse.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines APDU response structure
 * @version 0.2
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/expected.h>
#include <cstdint>

#include "Mcrw/BufferSizes.h"
#include "Error/Error.h"

namespace mcrw
{
    constexpr uint16_t SW_SUCCESS = 0x9000;
    constexpr uint16_t SW_SECURITY_STATUS_NOT_SATISFIED = 0x6982;

    class ApduResponse
    {
    public:
        etl::vector<uint8_t, buffer::APDU_DATA_MAX> data; // Response data without SW1 SW2
        uint8_t sw1;
        uint8_t sw2;

        ApduResponse() : sw1(0), sw2(0) {}

        ApduResponse(const etl::ivector<uint8_t> &responseData, uint8_t status1, uint8_t status2)
            : data(responseData.begin(), responseData.end()), sw1(status1), sw2(status2) {}

        bool isSuccess() const
        {
            return getStatusWord() == SW_SUCCESS;
        }

        uint16_t getStatusWord() const
        {
            return (static_cast<uint16_t>(sw1) << 8) | sw2;
        }

        /**
         * @brief Split a raw card answer [Data...][SW1][SW2]
         *
         * @param raw Bytes as received from the reader
         * @return etl::expected<ApduResponse, error::Error> Response, or WrongLength if shorter than the status word
         */
        static etl::expected<ApduResponse, error::Error> fromRaw(const etl::ivector<uint8_t> &raw);

        /**
         * @brief Classify the status word
         *
         * 0x9000 succeeds, 0x6982 maps to SecurityStatusNotSatisfied, every
         * other value to UnexpectedStatus carrying the raw code.
         *
         * @return etl::expected<void, error::Error> Success or status error
         */
        etl::expected<void, error::Error> checkStatus() const;
    };

} // namespace mcrw
