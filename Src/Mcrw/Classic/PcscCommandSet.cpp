/**
 * @file PcscCommandSet.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief PC/SC pseudo-APDU command set for MIFARE Classic
 * @version 0.1
 * @date 2026-10-13
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Mcrw/Classic/PcscCommandSet.h"
#include "Mcrw/Classic/ValueBlock.h"
#include "Utils/Hex.h"

using namespace mcrw;
using namespace mcrw::buffer;

etl::string_view PcscCommandSet::name() const
{
    return "PC/SC";
}

etl::expected<ApduCommand, error::Error> PcscCommandSet::getUid() const
{
    // Le = 256: return the full UID whatever its length
    return ApduCommand(CLASS, GET_UID, 0x00, 0x00, 256);
}

etl::expected<ApduCommand, error::Error> PcscCommandSet::loadKey(
    KeyType keyType,
    const etl::ivector<uint8_t>& key) const
{
    if (key.size() != KEY_SIZE)
    {
        return etl::unexpected(error::Error::fromClassic(
            error::ClassicError::InvalidKeyLength, static_cast<int32_t>(key.size())));
    }

    ApduCommand command(CLASS, LOAD_KEY, 0x00, static_cast<uint8_t>(keyType));
    command.data.assign(key.begin(), key.end());
    return command;
}

etl::expected<ApduCommand, error::Error> PcscCommandSet::readBlock(uint8_t block) const
{
    return ApduCommand(CLASS, READ_BLOCK, 0x00, block, BLOCK_SIZE);
}

etl::expected<ApduCommand, error::Error> PcscCommandSet::writeBlock(
    uint8_t block,
    const etl::ivector<uint8_t>& data) const
{
    if (data.size() != BLOCK_SIZE)
    {
        return etl::unexpected(error::Error::fromClassic(
            error::ClassicError::InvalidDataLength, static_cast<int32_t>(data.size())));
    }

    ApduCommand command(CLASS, WRITE_BLOCK, 0x00, block);
    command.data.assign(data.begin(), data.end());
    return command;
}

etl::expected<ApduCommand, error::Error> PcscCommandSet::valueBlock(
    ValueOperation operation,
    uint8_t block,
    int32_t value) const
{
    etl::vector<uint8_t, 2> header;
    header.push_back(static_cast<uint8_t>(operation));
    header.push_back(block);

    etl::vector<uint8_t, 4> valueBytes;
    valueblock::writeLe32(value, valueBytes);

    ApduCommand command(CLASS, VALUE_BLOCK_COMMAND, 0x00, block);
    if (!utils::concat(header, valueBytes, command.data))
    {
        return etl::unexpected(error::Error::fromApdu(error::ApduError::CommandTooLong));
    }
    return command;
}
