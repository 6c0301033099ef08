/**
 * @file ApduCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief APDU command serialization
 * @version 0.1
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Mcrw/Apdu/ApduCommand.h"

using namespace mcrw;
using namespace mcrw::buffer;

etl::vector<uint8_t, APDU_COMMAND_MAX> ApduCommand::serialize() const
{
    etl::vector<uint8_t, APDU_COMMAND_MAX> apdu;

    apdu.push_back(cla);
    apdu.push_back(ins);
    apdu.push_back(p1);
    apdu.push_back(p2);

    if (!data.empty())
    {
        apdu.push_back(static_cast<uint8_t>(data.size())); // Lc
        apdu.insert(apdu.end(), data.begin(), data.end());
    }

    if (expectedLength > 0)
    {
        // Le: 1..255 as is, 256 as 0x00
        apdu.push_back(static_cast<uint8_t>(expectedLength >= 256U ? 0x00U : expectedLength));
    }

    return apdu;
}
