#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include <etl/vector.h>

#include "Mcrw/Apdu/IApduTransceiver.h"
#include "Mcrw/Card/ICardDetector.h"
#include "Mcrw/Classic/Sector.h"
#include "Mcrw/Classic/ValueBlock.h"
#include "Mcrw/BufferSizes.h"

/**
 * @brief In-memory MIFARE Classic card behind a PC/SC reader
 *
 * Answers the FF CA/82/B0/D6/F0 pseudo APDUs. Block access requires the
 * key loaded in one of the reader slots to match the sector key, otherwise
 * the card answers 0x6982 like a failed authentication.
 */
class SimulatedClassicCard : public mcrw::IApduTransceiver, public mcrw::ICardDetector
{
public:
    using Block = std::array<uint8_t, 16>;
    using Key = std::array<uint8_t, 6>;
    using Apdu = std::vector<uint8_t>;

    static constexpr Key DEFAULT_KEY = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};

    explicit SimulatedClassicCard(bool fourK = false)
        : blocks(fourK ? 256 : 64)
        , sectorKeys(fourK ? 40 : 16, DEFAULT_KEY)
        , uid{0x04, 0xA1, 0xB2, 0xC3}
        , atr{0x3B, 0x8F, 0x80, 0x01, 0x80, 0x4F, 0x0C, 0xA0, 0x00, 0x00,
              0x03, 0x06, 0x03, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x6A}
    {
        if (fourK)
        {
            atr[14] = 0x02;
            atr[19] = 0x69;
        }

        Block manufacturer = {};
        for (size_t i = 0; i < uid.size(); ++i)
        {
            manufacturer[i] = uid[i];
        }
        manufacturer[4] = 0x04 ^ 0xA1 ^ 0xB2 ^ 0xC3;
        manufacturer[5] = 0x08;
        blocks[0] = manufacturer;

        const Block trailer = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x07,
                               0x80, 0x69, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
        for (size_t block = 0; block < blocks.size(); ++block)
        {
            if (mcrw::isSectorTrailer(static_cast<uint16_t>(block)))
            {
                blocks[block] = trailer;
            }
        }
    }

    // IApduTransceiver

    etl::expected<mcrw::ApduResponse, error::Error> transceive(const etl::ivector<uint8_t>& apdu) override
    {
        history.emplace_back(apdu.begin(), apdu.end());

        if (failTransport)
        {
            return etl::unexpected(error::Error::fromTransport(error::TransportError::TransmitFailed));
        }

        if (forcedStatus != 0)
        {
            return reply(forcedStatus);
        }

        if (apdu.size() < 4)
        {
            return reply(0x6700);
        }

        if (apdu[0] != 0xFF)
        {
            return reply(0x6E00);
        }

        switch (apdu[1])
        {
            case 0xCA:
                return reply(0x9000, uid.data(), uid.size());

            case 0x82:
                return loadKey(apdu);

            case 0xB0:
                return readBlock(apdu);

            case 0xD6:
                return writeBlock(apdu);

            case 0xF0:
                return valueOperation(apdu);

            default:
                return reply(0x6D00);
        }
    }

    // ICardDetector

    etl::expected<mcrw::CardInfo, error::Error> detectCard() override
    {
        ++detectCount;
        if (!present)
        {
            return etl::unexpected(error::Error::fromCard(error::CardError::NoCardPresent));
        }

        etl::vector<uint8_t, mcrw::buffer::ATR_MAX> bytes(atr.begin(), atr.end());
        return mcrw::CardInfo::fromAtr(bytes);
    }

    bool isCardPresent() override
    {
        return present;
    }

    etl::expected<void, error::Error> releaseCard() override
    {
        ++releaseCount;
        return {};
    }

    // Test controls

    size_t commandCount() const
    {
        return history.size();
    }

    const Apdu& lastCommand() const
    {
        return history.back();
    }

    void setSectorKey(uint16_t sector, const Key& key)
    {
        sectorKeys[sector] = key;
    }

    std::vector<Block> blocks;
    std::vector<Key> sectorKeys;
    std::vector<uint8_t> uid;
    std::vector<uint8_t> atr;
    std::vector<Apdu> history;

    Key loadedKeyA = {};
    Key loadedKeyB = {};
    bool keyALoaded = false;
    bool keyBLoaded = false;

    bool present = true;
    bool failTransport = false;
    uint16_t forcedStatus = 0;
    int detectCount = 0;
    int releaseCount = 0;

private:
    static mcrw::ApduResponse reply(uint16_t status, const uint8_t* data = nullptr, size_t length = 0)
    {
        etl::vector<uint8_t, mcrw::buffer::APDU_DATA_MAX> payload;
        for (size_t i = 0; i < length; ++i)
        {
            payload.push_back(data[i]);
        }
        return mcrw::ApduResponse(payload, static_cast<uint8_t>(status >> 8), static_cast<uint8_t>(status & 0xFF));
    }

    bool authorised(uint16_t block) const
    {
        const Key& key = sectorKeys[mcrw::sectorOfBlock(block)];
        return (keyALoaded && loadedKeyA == key) || (keyBLoaded && loadedKeyB == key);
    }

    mcrw::ApduResponse loadKey(const etl::ivector<uint8_t>& apdu)
    {
        if (apdu.size() != 11 || apdu[4] != 6)
        {
            return reply(0x6700);
        }

        Key key;
        for (size_t i = 0; i < key.size(); ++i)
        {
            key[i] = apdu[5 + i];
        }

        if (apdu[3] == 0x60)
        {
            loadedKeyA = key;
            keyALoaded = true;
        }
        else if (apdu[3] == 0x61)
        {
            loadedKeyB = key;
            keyBLoaded = true;
        }
        else
        {
            return reply(0x6B00);
        }
        return reply(0x9000);
    }

    mcrw::ApduResponse readBlock(const etl::ivector<uint8_t>& apdu)
    {
        const uint16_t block = apdu[3];
        if (block >= blocks.size())
        {
            return reply(0x6A82);
        }
        if (!authorised(block))
        {
            return reply(0x6982);
        }
        return reply(0x9000, blocks[block].data(), blocks[block].size());
    }

    mcrw::ApduResponse writeBlock(const etl::ivector<uint8_t>& apdu)
    {
        const uint16_t block = apdu[3];
        if (apdu.size() != 21 || apdu[4] != 16)
        {
            return reply(0x6700);
        }
        if (block >= blocks.size())
        {
            return reply(0x6A82);
        }
        if (!authorised(block))
        {
            return reply(0x6982);
        }

        for (size_t i = 0; i < 16; ++i)
        {
            blocks[block][i] = apdu[5 + i];
        }
        return reply(0x9000);
    }

    mcrw::ApduResponse valueOperation(const etl::ivector<uint8_t>& apdu)
    {
        const uint16_t block = apdu[3];
        if (apdu.size() != 11 || apdu[4] != 6)
        {
            return reply(0x6700);
        }
        if (block >= blocks.size())
        {
            return reply(0x6A82);
        }
        if (!authorised(block))
        {
            return reply(0x6982);
        }

        const int32_t current = mcrw::valueblock::readLe32(blocks[block].data());
        const int32_t amount = mcrw::valueblock::readLe32(&apdu[7]);
        int32_t updated = 0;

        if (apdu[5] == 0xC1)
        {
            updated = current + amount;
        }
        else if (apdu[5] == 0xC0)
        {
            updated = current - amount;
        }
        else
        {
            return reply(0x6A80);
        }

        const auto encoded = mcrw::valueblock::encode(updated, blocks[block][12]);
        for (size_t i = 0; i < 16; ++i)
        {
            blocks[block][i] = encoded[i];
        }
        return reply(0x9000);
    }
};
