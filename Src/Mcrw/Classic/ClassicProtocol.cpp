/**
 * @file ClassicProtocol.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief MIFARE Classic APDU protocol layer
 * @version 0.1
 * @date 2026-10-14
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Mcrw/Classic/ClassicProtocol.h"
#include "Mcrw/Classic/ICardCommandSet.h"
#include "Mcrw/Apdu/IApduTransceiver.h"
#include "Utils/Logging.h"

using namespace mcrw;
using namespace mcrw::buffer;

ClassicProtocol::ClassicProtocol(IApduTransceiver& transceiverRef, const ICardCommandSet& commandSetRef)
    : transceiver(transceiverRef)
    , commandSet(commandSetRef)
{
    const auto name = commandSet.name();
    LOG_DEBUG("Using %.*s command set", static_cast<int>(name.size()), name.data());
}

etl::expected<ApduResponse, error::Error> ClassicProtocol::exchange(
    const etl::expected<ApduCommand, error::Error>& command)
{
    if (!command)
    {
        return etl::unexpected(command.error());
    }

    const auto apdu = command.value().serialize();
    LOG_HEX("APDU TX", apdu.data(), apdu.size());

    auto responseResult = transceiver.transceive(apdu);
    if (!responseResult)
    {
        LOG_ERROR("Transceive failed: %s", responseResult.error().toString().c_str());
        return etl::unexpected(responseResult.error());
    }

    const ApduResponse& response = responseResult.value();
    LOG_HEX("APDU RX", response.data.data(), response.data.size());

    auto status = response.checkStatus();
    if (!status)
    {
        LOG_ERROR("INS 0x%02X failed: %s", command.value().ins, status.error().message().c_str());
        return etl::unexpected(status.error());
    }

    return response;
}

etl::expected<UidData, error::Error> ClassicProtocol::getUid()
{
    auto response = exchange(commandSet.getUid());
    if (!response)
    {
        return etl::unexpected(response.error());
    }

    const auto& data = response.value().data;
    if (data.empty() || data.size() > CARD_UID_MAX)
    {
        return etl::unexpected(error::Error::fromApdu(error::ApduError::WrongLength, response.value().getStatusWord()));
    }

    return UidData(data.begin(), data.end());
}

etl::expected<void, error::Error> ClassicProtocol::loadKey(KeyType keyType, const etl::ivector<uint8_t>& key)
{
    auto response = exchange(commandSet.loadKey(keyType, key));
    if (!response)
    {
        return etl::unexpected(response.error());
    }

    LOG_DEBUG("Key %c loaded", keyType == KeyType::A ? 'A' : 'B');
    return {};
}

etl::expected<BlockData, error::Error> ClassicProtocol::readBlock(uint8_t block)
{
    auto response = exchange(commandSet.readBlock(block));
    if (!response)
    {
        return etl::unexpected(response.error());
    }

    const auto& data = response.value().data;
    if (data.size() != BLOCK_SIZE)
    {
        LOG_ERROR("Block %u read returned %zu bytes", static_cast<unsigned>(block), data.size());
        return etl::unexpected(error::Error::fromApdu(error::ApduError::WrongLength, response.value().getStatusWord()));
    }

    return BlockData(data.begin(), data.end());
}

etl::expected<void, error::Error> ClassicProtocol::writeBlock(uint8_t block, const etl::ivector<uint8_t>& data)
{
    auto response = exchange(commandSet.writeBlock(block, data));
    if (!response)
    {
        return etl::unexpected(response.error());
    }
    return {};
}

etl::expected<void, error::Error> ClassicProtocol::valueBlockCommand(
    ValueOperation operation,
    uint8_t block,
    int32_t value)
{
    auto response = exchange(commandSet.valueBlock(operation, block, value));
    if (!response)
    {
        return etl::unexpected(response.error());
    }
    return {};
}
