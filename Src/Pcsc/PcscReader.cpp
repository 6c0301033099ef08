/**
 * @file PcscReader.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief PC/SC reader adapter implementation
 * @version 0.1
 * @date 2026-10-15
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Pcsc/PcscReader.h"
#include "Mcrw/BufferSizes.h"
#include "Utils/Logging.h"

#include <vector>

using namespace error;
using namespace mcrw;

namespace
{
    // Status word prefix of a T=0 "response bytes still available"
    constexpr uint8_t SW1_MORE_DATA = 0x61;

    TransportError mapPcscError(LONG result, TransportError fallback)
    {
        switch (result)
        {
            case SCARD_E_NO_SERVICE:
            case SCARD_E_SERVICE_STOPPED:
                return TransportError::ServiceUnavailable;
            case SCARD_E_NO_READERS_AVAILABLE:
                return TransportError::NoReaderAvailable;
            case SCARD_E_UNKNOWN_READER:
            case SCARD_E_READER_UNAVAILABLE:
                return TransportError::ReaderUnavailable;
            case SCARD_E_TIMEOUT:
                return TransportError::Timeout;
            case SCARD_E_NO_SMARTCARD:
            case SCARD_W_REMOVED_CARD:
            case SCARD_W_RESET_CARD:
                return TransportError::CardRemoved;
            case SCARD_E_PROTO_MISMATCH:
                return TransportError::ProtocolNotSupported;
            case SCARD_E_INSUFFICIENT_BUFFER:
                return TransportError::BufferOverflow;
            default:
                return fallback;
        }
    }

    Error pcscError(const char* call, LONG result, TransportError fallback)
    {
        LOG_ERROR("%s failed: %s (0x%08lX)", call, pcsc_stringify_error(result), static_cast<unsigned long>(result));
        return Error::fromTransport(mapPcscError(result, fallback), static_cast<int32_t>(result));
    }
}

namespace pcsc
{

    PcscReader::PcscReader(const PcscReaderOptions& readerOptions)
        : options(readerOptions)
        , context(0)
        , card(0)
        , contextReady(false)
        , connected(false)
        , sendPci()
        , readerName()
    {
    }

    PcscReader::~PcscReader()
    {
        if (connected)
        {
            auto released = releaseCard();
            if (!released)
            {
                LOG_WARN("Card disconnect on shutdown failed");
            }
        }
        releaseContext();
    }

    etl::expected<void, error::Error> PcscReader::init()
    {
        if (contextReady)
        {
            return {};
        }

        LONG result = SCardEstablishContext(SCARD_SCOPE_SYSTEM, nullptr, nullptr, &context);
        if (result != SCARD_S_SUCCESS)
        {
            return etl::unexpected(pcscError("SCardEstablishContext", result, TransportError::ServiceUnavailable));
        }
        contextReady = true;

        // First call sizes the multi-string, second call fills it
        DWORD readersSize = 0;
        result = SCardListReaders(context, nullptr, nullptr, &readersSize);
        if (result != SCARD_S_SUCCESS)
        {
            releaseContext();
            return etl::unexpected(pcscError("SCardListReaders", result, TransportError::NoReaderAvailable));
        }

        std::vector<char> readers(readersSize, '\0');
        result = SCardListReaders(context, nullptr, readers.data(), &readersSize);
        if (result != SCARD_S_SUCCESS)
        {
            releaseContext();
            return etl::unexpected(pcscError("SCardListReaders", result, TransportError::NoReaderAvailable));
        }

        size_t index = 0;
        size_t offset = 0;
        while (offset < readers.size() && readers[offset] != '\0')
        {
            const char* name = &readers[offset];
            const etl::string_view view(name);

            LOG_DEBUG("Reader %u: %s", static_cast<unsigned>(index), name);
            if (index == options.readerIndex)
            {
                readerName.assign(view.begin(), view.end());
                LOG_INFO("Using reader %s", readerName.c_str());
                return {};
            }

            offset += view.size() + 1;
            ++index;
        }

        LOG_ERROR("Reader index %u not available (%u readers)",
                  static_cast<unsigned>(options.readerIndex), static_cast<unsigned>(index));
        releaseContext();
        return etl::unexpected(Error::fromTransport(TransportError::NoReaderAvailable));
    }

    etl::string_view PcscReader::getReaderName() const
    {
        return etl::string_view(readerName.data(), readerName.size());
    }

    etl::expected<void, error::Error> PcscReader::waitForCard()
    {
        SCARD_READERSTATE state = {};
        state.szReader = readerName.c_str();
        state.dwCurrentState = SCARD_STATE_UNAWARE;

        while (true)
        {
            LONG result = SCardGetStatusChange(context, options.waitTimeoutMs, &state, 1);
            if (result != SCARD_S_SUCCESS)
            {
                return etl::unexpected(pcscError("SCardGetStatusChange", result, TransportError::ReaderUnavailable));
            }

            if (state.dwEventState & SCARD_STATE_PRESENT)
            {
                return {};
            }

            // Wait for the next change of the state just observed
            state.dwCurrentState = state.dwEventState & ~static_cast<DWORD>(SCARD_STATE_CHANGED);
            LOG_INFO("Waiting for card on %s", readerName.c_str());
        }
    }

    etl::expected<CardInfo, error::Error> PcscReader::detectCard()
    {
        auto ready = init();
        if (!ready)
        {
            return etl::unexpected(ready.error());
        }

        if (connected)
        {
            auto released = releaseCard();
            if (!released)
            {
                return etl::unexpected(released.error());
            }
        }

        auto present = waitForCard();
        if (!present)
        {
            return etl::unexpected(present.error());
        }

        DWORD activeProtocol = 0;
        LONG result = SCardConnect(context, readerName.c_str(), options.shareMode,
                                   options.preferredProtocols, &card, &activeProtocol);
        if (result != SCARD_S_SUCCESS)
        {
            return etl::unexpected(pcscError("SCardConnect", result, TransportError::ConnectFailed));
        }
        connected = true;

        if (activeProtocol == SCARD_PROTOCOL_T0)
        {
            sendPci = *SCARD_PCI_T0;
        }
        else if (activeProtocol == SCARD_PROTOCOL_T1)
        {
            sendPci = *SCARD_PCI_T1;
        }
        else
        {
            LOG_ERROR("Unsupported active protocol 0x%08lX", static_cast<unsigned long>(activeProtocol));
            auto released = releaseCard();
            if (!released)
            {
                return etl::unexpected(released.error());
            }
            return etl::unexpected(Error::fromTransport(TransportError::ProtocolNotSupported));
        }

        char statusName[MAX_READERNAME];
        DWORD statusNameSize = sizeof(statusName);
        DWORD cardState = 0;
        DWORD protocol = 0;
        BYTE atrBytes[MAX_ATR_SIZE];
        DWORD atrSize = sizeof(atrBytes);

        result = SCardStatus(card, statusName, &statusNameSize, &cardState, &protocol, atrBytes, &atrSize);
        if (result != SCARD_S_SUCCESS)
        {
            return etl::unexpected(pcscError("SCardStatus", result, TransportError::CardRemoved));
        }

        etl::vector<uint8_t, buffer::ATR_MAX> atr;
        for (DWORD i = 0; i < atrSize && !atr.full(); ++i)
        {
            atr.push_back(atrBytes[i]);
        }
        LOG_HEX("ATR", atr.data(), atr.size());

        auto info = CardInfo::fromAtr(atr);
        if (!info)
        {
            LOG_ERROR("Card not recognised: %s", info.error().message().c_str());
            return etl::unexpected(info.error());
        }

        LOG_INFO("%s", info.value().toString().c_str());
        return info.value();
    }

    bool PcscReader::isCardPresent()
    {
        if (!contextReady || readerName.empty())
        {
            return false;
        }

        SCARD_READERSTATE state = {};
        state.szReader = readerName.c_str();
        state.dwCurrentState = SCARD_STATE_UNAWARE;

        LONG result = SCardGetStatusChange(context, 0, &state, 1);
        if (result != SCARD_S_SUCCESS)
        {
            LOG_WARN("SCardGetStatusChange failed: %s", pcsc_stringify_error(result));
            return false;
        }

        return (state.dwEventState & SCARD_STATE_PRESENT) != 0;
    }

    etl::expected<void, error::Error> PcscReader::releaseCard()
    {
        if (!connected)
        {
            return {};
        }

        connected = false;
        LONG result = SCardDisconnect(card, SCARD_LEAVE_CARD);
        card = 0;
        if (result != SCARD_S_SUCCESS)
        {
            return etl::unexpected(pcscError("SCardDisconnect", result, TransportError::Unknown));
        }
        return {};
    }

    etl::expected<void, error::Error> PcscReader::transmit(
        const uint8_t* command,
        size_t length,
        etl::ivector<uint8_t>& response)
    {
        BYTE received[MAX_BUFFER_SIZE];
        DWORD receivedLength = sizeof(received);

        LONG result = SCardTransmit(card, &sendPci, command, static_cast<DWORD>(length),
                                    nullptr, received, &receivedLength);
        if (result != SCARD_S_SUCCESS)
        {
            return etl::unexpected(pcscError("SCardTransmit", result, TransportError::TransmitFailed));
        }

        response.clear();
        for (DWORD i = 0; i < receivedLength; ++i)
        {
            if (response.full())
            {
                return etl::unexpected(Error::fromTransport(TransportError::BufferOverflow));
            }
            response.push_back(received[i]);
        }
        return {};
    }

    etl::expected<ApduResponse, error::Error> PcscReader::transceive(const etl::ivector<uint8_t>& apdu)
    {
        if (!connected)
        {
            LOG_ERROR("No card connected");
            return etl::unexpected(Error::fromTransport(TransportError::NotConnected));
        }

        etl::vector<uint8_t, MAX_BUFFER_SIZE> chunk;
        auto sent = transmit(apdu.data(), apdu.size(), chunk);
        if (!sent)
        {
            return etl::unexpected(sent.error());
        }

        etl::vector<uint8_t, buffer::APDU_RESPONSE_MAX> collected;

        // T=0 cards announce remaining bytes with 61XX, fetch them with GET RESPONSE
        while (chunk.size() >= 2 && chunk[chunk.size() - 2] == SW1_MORE_DATA)
        {
            const size_t dataLength = chunk.size() - 2;
            if (collected.size() + dataLength > collected.capacity())
            {
                return etl::unexpected(Error::fromTransport(TransportError::BufferOverflow));
            }
            collected.insert(collected.end(), chunk.begin(), chunk.begin() + dataLength);

            const uint8_t getResponse[] = {0x00, 0xC0, 0x00, 0x00, chunk[chunk.size() - 1]};
            sent = transmit(getResponse, sizeof(getResponse), chunk);
            if (!sent)
            {
                return etl::unexpected(sent.error());
            }
        }

        if (collected.size() + chunk.size() > collected.capacity())
        {
            return etl::unexpected(Error::fromTransport(TransportError::BufferOverflow));
        }
        collected.insert(collected.end(), chunk.begin(), chunk.end());

        return ApduResponse::fromRaw(collected);
    }

    void PcscReader::releaseContext()
    {
        if (!contextReady)
        {
            return;
        }

        LONG result = SCardReleaseContext(context);
        if (result != SCARD_S_SUCCESS)
        {
            LOG_WARN("SCardReleaseContext failed: %s", pcsc_stringify_error(result));
        }
        context = 0;
        contextReady = false;
        readerName.clear();
    }

} // namespace pcsc
