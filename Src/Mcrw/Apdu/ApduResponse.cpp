/**
 * @file ApduResponse.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief APDU response parsing and status classification
 * @version 0.1
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Mcrw/Apdu/ApduResponse.h"

using namespace mcrw;
using namespace mcrw::buffer;

etl::expected<ApduResponse, error::Error> ApduResponse::fromRaw(const etl::ivector<uint8_t> &raw)
{
    if (raw.size() < APDU_STATUS_SIZE || raw.size() > APDU_RESPONSE_MAX)
    {
        return etl::unexpected(error::Error::fromApdu(error::ApduError::WrongLength));
    }

    ApduResponse response;
    response.data.assign(raw.begin(), raw.end() - APDU_STATUS_SIZE);
    response.sw1 = raw[raw.size() - 2];
    response.sw2 = raw[raw.size() - 1];
    return response;
}

etl::expected<void, error::Error> ApduResponse::checkStatus() const
{
    const uint16_t status = getStatusWord();

    switch (status)
    {
        case SW_SUCCESS:
            return {};

        case SW_SECURITY_STATUS_NOT_SATISFIED:
            return etl::unexpected(error::Error::fromApdu(error::ApduError::SecurityStatusNotSatisfied, status));

        default:
            return etl::unexpected(error::Error::fromApdu(error::ApduError::UnexpectedStatus, status));
    }
}
