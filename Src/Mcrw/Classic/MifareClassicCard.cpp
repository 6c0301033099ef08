/**
 * @file MifareClassicCard.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief MIFARE Classic card implementation
 * @version 0.2
 * @date 2026-10-14
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Mcrw/Classic/MifareClassicCard.h"
#include "Mcrw/Classic/ValueBlock.h"
#include "Utils/Hex.h"
#include "Utils/Text.h"
#include "Utils/Logging.h"

#include <cstdio>

using namespace mcrw;
using namespace mcrw::buffer;

namespace
{
    /**
     * @brief Decode hex input, reporting over-long input as a data length error
     */
    etl::expected<void, error::Error> decodeHex(etl::string_view text, etl::ivector<uint8_t>& out)
    {
        if ((text.size() % 2U) == 0U && (text.size() / 2U) > out.capacity())
        {
            return etl::unexpected(error::Error::fromClassic(
                error::ClassicError::InvalidDataLength, static_cast<int32_t>(text.size() / 2U)));
        }

        if (!utils::fromHex(text, out))
        {
            return etl::unexpected(error::Error::fromClassic(error::ClassicError::InvalidHexString));
        }
        return {};
    }

    int decimalDigits(uint16_t value)
    {
        int digits = 1;
        while (value >= 10U)
        {
            value = static_cast<uint16_t>(value / 10U);
            ++digits;
        }
        return digits;
    }

    void appendError(std::string& report, const error::Error& err)
    {
        const auto message = err.message();
        report.append("Error: ");
        report.append(message.data(), message.size());
    }
}

MifareClassicCard::MifareClassicCard(
    IApduTransceiver& transceiver,
    const ICardCommandSet& commandSet,
    const CardInfo& cardInfo)
    : protocol(transceiver, commandSet)
    , info(cardInfo)
{
}

const CardInfo& MifareClassicCard::getCardInfo() const
{
    return info;
}

etl::expected<Sector, error::Error> MifareClassicCard::resolveSector(uint16_t sector) const
{
    if (!info.isValidSector(sector))
    {
        return etl::unexpected(error::Error::fromClassic(error::ClassicError::SectorOutOfRange, sector));
    }
    return Sector::resolve(sector);
}

etl::expected<uint8_t, error::Error> MifareClassicCard::checkBlock(uint16_t block, bool allowTrailer) const
{
    if (!info.isValidBlock(block))
    {
        return etl::unexpected(error::Error::fromClassic(error::ClassicError::BlockOutOfRange, block));
    }

    if (!allowTrailer && isSectorTrailer(block))
    {
        LOG_WARN("Block %u is a sector trailer", static_cast<unsigned>(block));
        return etl::unexpected(error::Error::fromClassic(error::ClassicError::TrailerAccessDenied, block));
    }

    return static_cast<uint8_t>(block);
}

// ---------------------------------------------------------------------------
// Identification and keys
// ---------------------------------------------------------------------------

etl::expected<UidData, error::Error> MifareClassicCard::getUid()
{
    return protocol.getUid();
}

etl::expected<UidHexString, error::Error> MifareClassicCard::getUidHexString()
{
    auto uid = getUid();
    if (!uid)
    {
        return etl::unexpected(uid.error());
    }

    UidHexString hex;
    utils::toHex(uid.value(), hex);
    return hex;
}

etl::expected<void, error::Error> MifareClassicCard::loadKey(KeyType keyType, const etl::ivector<uint8_t>& key)
{
    if (keyType != KeyType::A && keyType != KeyType::B)
    {
        return etl::unexpected(error::Error::fromClassic(error::ClassicError::InvalidKeyType));
    }

    if (key.size() != KEY_SIZE)
    {
        return etl::unexpected(error::Error::fromClassic(
            error::ClassicError::InvalidKeyLength, static_cast<int32_t>(key.size())));
    }

    return protocol.loadKey(keyType, key);
}

etl::expected<void, error::Error> MifareClassicCard::loadKey(KeyType keyType, etl::string_view hexKey)
{
    if (hexKey.size() != KEY_HEX_SIZE)
    {
        return etl::unexpected(error::Error::fromClassic(
            error::ClassicError::InvalidKeyLength, static_cast<int32_t>(hexKey.size())));
    }

    KeyData key;
    if (!utils::fromHex(hexKey, key))
    {
        return etl::unexpected(error::Error::fromClassic(error::ClassicError::InvalidHexString));
    }

    return loadKey(keyType, key);
}

// ---------------------------------------------------------------------------
// Blocks
// ---------------------------------------------------------------------------

etl::expected<BlockData, error::Error> MifareClassicCard::readBlock(uint16_t block, bool allowTrailer)
{
    auto address = checkBlock(block, allowTrailer);
    if (!address)
    {
        return etl::unexpected(address.error());
    }

    return protocol.readBlock(address.value());
}

etl::expected<BlockHexString, error::Error> MifareClassicCard::readBlockHexString(uint16_t block)
{
    auto data = readBlock(block);
    if (!data)
    {
        return etl::unexpected(data.error());
    }

    BlockHexString hex;
    utils::toHex(data.value(), hex);
    return hex;
}

etl::expected<BlockText, error::Error> MifareClassicCard::readBlockString(uint16_t block)
{
    auto data = readBlock(block);
    if (!data)
    {
        return etl::unexpected(data.error());
    }

    BlockText text;
    utils::toText(data.value().data(), data.value().size(), text);
    return text;
}

etl::expected<void, error::Error> MifareClassicCard::writeBlock(
    uint16_t block,
    const etl::ivector<uint8_t>& data,
    bool allowTrailer)
{
    auto address = checkBlock(block, allowTrailer);
    if (!address)
    {
        return etl::unexpected(address.error());
    }

    if (data.size() != BLOCK_SIZE)
    {
        return etl::unexpected(error::Error::fromClassic(
            error::ClassicError::InvalidDataLength, static_cast<int32_t>(data.size())));
    }

    return protocol.writeBlock(address.value(), data);
}

etl::expected<void, error::Error> MifareClassicCard::writeBlockHexString(uint16_t block, etl::string_view hexData)
{
    BlockData data;
    auto decoded = decodeHex(hexData, data);
    if (!decoded)
    {
        return etl::unexpected(decoded.error());
    }

    return writeBlock(block, data);
}

etl::expected<void, error::Error> MifareClassicCard::writeBlockString(uint16_t block, etl::string_view text)
{
    if (text.size() > BLOCK_SIZE)
    {
        return etl::unexpected(error::Error::fromClassic(
            error::ClassicError::InvalidStringLength, static_cast<int32_t>(text.size())));
    }

    BlockData data;
    for (size_t i = 0; i < text.size(); ++i)
    {
        data.push_back(static_cast<uint8_t>(text[i]));
    }
    data.resize(BLOCK_SIZE, 0x00);

    return writeBlock(block, data);
}

etl::expected<void, error::Error> MifareClassicCard::clearBlock(uint16_t block)
{
    BlockData zeros(BLOCK_SIZE, 0x00);
    return writeBlock(block, zeros);
}

// ---------------------------------------------------------------------------
// Value blocks
// ---------------------------------------------------------------------------

etl::expected<int32_t, error::Error> MifareClassicCard::readValueBlock(uint16_t block)
{
    auto data = readBlock(block);
    if (!data)
    {
        return etl::unexpected(data.error());
    }

    return valueblock::decodeValue(data.value());
}

etl::expected<void, error::Error> MifareClassicCard::incrementValueBlock(uint16_t block, int32_t value)
{
    return valueBlockCommand(ValueOperation::Increment, block, value);
}

etl::expected<void, error::Error> MifareClassicCard::decrementValueBlock(uint16_t block, int32_t value)
{
    return valueBlockCommand(ValueOperation::Decrement, block, value);
}

etl::expected<void, error::Error> MifareClassicCard::valueBlockCommand(
    ValueOperation operation,
    uint16_t block,
    int32_t value)
{
    // The direction is the operation, the operand is a magnitude
    if (value < 0)
    {
        return etl::unexpected(error::Error::fromClassic(error::ClassicError::NegativeValue, value));
    }

    auto address = checkBlock(block, false);
    if (!address)
    {
        return etl::unexpected(address.error());
    }

    return protocol.valueBlockCommand(operation, address.value(), value);
}

etl::expected<void, error::Error> MifareClassicCard::formatValueBlock(uint16_t block)
{
    return writeBlock(block, valueblock::encode(0, 0x00));
}

// ---------------------------------------------------------------------------
// Sectors
// ---------------------------------------------------------------------------

etl::expected<SectorData, error::Error> MifareClassicCard::readSector(uint16_t sectorIndex)
{
    auto sector = resolveSector(sectorIndex);
    if (!sector)
    {
        return etl::unexpected(sector.error());
    }

    SectorData data;
    const uint16_t startBlock = sector.value().startBlock;

    for (uint16_t x = 0; x < sector.value().dataBlocks(); ++x)
    {
        auto block = readBlock(static_cast<uint16_t>(startBlock + x));
        if (!block)
        {
            return etl::unexpected(block.error());
        }
        data.insert(data.end(), block.value().begin(), block.value().end());
    }

    return data;
}

etl::expected<SectorHexString, error::Error> MifareClassicCard::readSectorHexString(uint16_t sector)
{
    auto data = readSector(sector);
    if (!data)
    {
        return etl::unexpected(data.error());
    }

    SectorHexString hex;
    utils::toHex(data.value(), hex);
    return hex;
}

etl::expected<SectorText, error::Error> MifareClassicCard::readSectorString(uint16_t sector)
{
    auto data = readSector(sector);
    if (!data)
    {
        return etl::unexpected(data.error());
    }

    SectorText text;
    utils::toText(data.value().data(), data.value().size(), text);
    return text;
}

etl::expected<void, error::Error> MifareClassicCard::writeSector(uint16_t sectorIndex, const etl::ivector<uint8_t>& data)
{
    auto sector = resolveSector(sectorIndex);
    if (!sector)
    {
        return etl::unexpected(sector.error());
    }

    const size_t capacity = static_cast<size_t>(sector.value().dataBlocks()) * BLOCK_SIZE;
    if (data.size() > capacity)
    {
        return etl::unexpected(error::Error::fromClassic(
            error::ClassicError::InvalidDataLength, static_cast<int32_t>(data.size())));
    }

    SectorData sectorBytes(data.begin(), data.end());
    sectorBytes.resize(capacity, 0x00);

    const uint16_t startBlock = sector.value().startBlock;
    for (uint16_t x = 0; x < sector.value().dataBlocks(); ++x)
    {
        const size_t start = static_cast<size_t>(x) * BLOCK_SIZE;
        BlockData chunk(sectorBytes.begin() + start, sectorBytes.begin() + start + BLOCK_SIZE);

        auto written = writeBlock(static_cast<uint16_t>(startBlock + x), chunk);
        if (!written)
        {
            return written;
        }
    }

    return {};
}

etl::expected<void, error::Error> MifareClassicCard::writeSectorHexString(uint16_t sector, etl::string_view hexData)
{
    SectorData data;
    auto decoded = decodeHex(hexData, data);
    if (!decoded)
    {
        return etl::unexpected(decoded.error());
    }

    return writeSector(sector, data);
}

etl::expected<void, error::Error> MifareClassicCard::writeSectorString(uint16_t sector, etl::string_view text)
{
    if (text.size() > SECTOR_DATA_MAX)
    {
        return etl::unexpected(error::Error::fromClassic(
            error::ClassicError::InvalidDataLength, static_cast<int32_t>(text.size())));
    }

    SectorData data;
    for (size_t i = 0; i < text.size(); ++i)
    {
        data.push_back(static_cast<uint8_t>(text[i]));
    }

    return writeSector(sector, data);
}

etl::expected<void, error::Error> MifareClassicCard::clearSector(uint16_t sectorIndex)
{
    auto sector = resolveSector(sectorIndex);
    if (!sector)
    {
        return etl::unexpected(sector.error());
    }

    for (uint16_t x = 0; x < sector.value().dataBlocks(); ++x)
    {
        auto cleared = clearBlock(static_cast<uint16_t>(sector.value().startBlock + x));
        if (!cleared)
        {
            return cleared;
        }
    }

    return {};
}

// ---------------------------------------------------------------------------
// Sector trailers
// ---------------------------------------------------------------------------

etl::expected<BlockData, error::Error> MifareClassicCard::readSectorTrailer(uint16_t sectorIndex)
{
    auto sector = resolveSector(sectorIndex);
    if (!sector)
    {
        return etl::unexpected(sector.error());
    }

    return readBlock(sector.value().trailerBlock(), true);
}

etl::expected<BlockHexString, error::Error> MifareClassicCard::readSectorTrailerHexString(uint16_t sector)
{
    auto data = readSectorTrailer(sector);
    if (!data)
    {
        return etl::unexpected(data.error());
    }

    BlockHexString hex;
    utils::toHex(data.value(), hex);
    return hex;
}

etl::expected<void, error::Error> MifareClassicCard::writeSectorTrailer(
    uint16_t sectorIndex,
    const etl::ivector<uint8_t>& data)
{
    auto sector = resolveSector(sectorIndex);
    if (!sector)
    {
        return etl::unexpected(sector.error());
    }

    LOG_INFO("Writing trailer of sector %u", static_cast<unsigned>(sectorIndex));
    return writeBlock(sector.value().trailerBlock(), data, true);
}

etl::expected<void, error::Error> MifareClassicCard::writeSectorTrailerHexString(
    uint16_t sector,
    etl::string_view hexData)
{
    BlockData data;
    auto decoded = decodeHex(hexData, data);
    if (!decoded)
    {
        return etl::unexpected(decoded.error());
    }

    return writeSectorTrailer(sector, data);
}

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------

std::string MifareClassicCard::readSectorInfo(uint16_t sectorIndex)
{
    std::string report;
    char line[32];

    std::snprintf(line, sizeof(line), "Sector %u:\n", static_cast<unsigned>(sectorIndex));
    report.append(line);

    auto resolved = resolveSector(sectorIndex);
    if (!resolved)
    {
        appendError(report, resolved.error());
        report.append("\n");
        return report;
    }

    const Sector& sector = resolved.value();
    const int digits = decimalDigits(info.blocksNumber);

    for (uint16_t x = 0; x < sector.blocksInSector; ++x)
    {
        const uint16_t block = static_cast<uint16_t>(sector.startBlock + x);

        std::snprintf(line, sizeof(line), "%*u:", digits, static_cast<unsigned>(block));
        report.append(line);

        auto data = readBlock(block, true);
        if (!data)
        {
            appendError(report, data.error());
            report.append("\n");
            continue;
        }

        BlockHexString hex;
        utils::toHex(data.value(), hex);
        report.append(hex.data(), hex.size());

        if (sector.startBlock == 0 && x == 0)
        {
            report.append(" - <UID - Manufacturer Data>");
        }
        else if (block != sector.trailerBlock())
        {
            BlockText text;
            utils::renderPrintable(data.value().data(), data.value().size(), text);
            report.append(" - ");
            report.append(text.data(), text.size());
        }
        else
        {
            report.append(" - <Sector Trailer>");
        }

        report.append("\n");
    }

    return report;
}

std::string MifareClassicCard::readCardInfo(etl::string_view readerName)
{
    std::string report;

    report.append("Reader: ");
    report.append(readerName.data(), readerName.size());
    report.append("\n");

    const auto atr = info.atrHexString();
    report.append("Card ATR: ");
    report.append(atr.data(), atr.size());
    report.append("\n");

    const auto typeName = info.typeName();
    report.append("Card Type: ");
    report.append(typeName.data(), typeName.size());
    report.append("\n");

    report.append("Card UID: ");
    auto uid = getUidHexString();
    if (uid)
    {
        report.append(uid.value().data(), uid.value().size());
    }
    else
    {
        appendError(report, uid.error());
    }
    report.append("\n");

    report.append("Card Data:\n");
    for (uint16_t sector = 0; sector < info.sectorsNumber; ++sector)
    {
        report.append(readSectorInfo(sector));
        report.append("\n");
    }

    return report;
}
