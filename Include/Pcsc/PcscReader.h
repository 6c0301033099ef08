/**
 * @file PcscReader.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief PC/SC reader adapter
 * @version 0.1
 * @date 2026-10-15
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <pcsclite.h>
#include <winscard.h>

#include <etl/expected.h>
#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/vector.h>

#include "Mcrw/Apdu/IApduTransceiver.h"
#include "Mcrw/Apdu/ApduResponse.h"
#include "Mcrw/Card/ICardDetector.h"
#include "Mcrw/Card/CardInfo.h"
#include "Error/Error.h"

namespace pcsc
{
    /**
     * @brief Connection settings for PcscReader
     */
    struct PcscReaderOptions
    {
        size_t readerIndex = 0;                                           // Index into the reader list
        DWORD shareMode = SCARD_SHARE_SHARED;
        DWORD preferredProtocols = SCARD_PROTOCOL_T0 | SCARD_PROTOCOL_T1;
        DWORD waitTimeoutMs = INFINITE;                                   // Card presence wait
    };

    /**
     * @brief PC/SC (pcsc-lite) implementation of the reader interfaces
     *
     * Owns the PC/SC context and the card handle. detectCard() blocks until
     * a card is present on the selected reader, connects to it and derives
     * the card profile from its ATR.
     */
    class PcscReader : public mcrw::IApduTransceiver, public mcrw::ICardDetector
    {
    public:
        explicit PcscReader(const PcscReaderOptions& options = PcscReaderOptions());

        ~PcscReader() override;

        PcscReader(const PcscReader&) = delete;
        PcscReader& operator=(const PcscReader&) = delete;

        /**
         * @brief Establish the PC/SC context and select the configured reader
         *
         * @return etl::expected<void, error::Error> Success or transport error
         */
        etl::expected<void, error::Error> init();

        /**
         * @brief Name of the selected reader, empty before init()
         */
        etl::string_view getReaderName() const;

        // IApduTransceiver interface implementation

        etl::expected<mcrw::ApduResponse, error::Error> transceive(const etl::ivector<uint8_t>& apdu) override;

        // ICardDetector interface implementation

        etl::expected<mcrw::CardInfo, error::Error> detectCard() override;

        bool isCardPresent() override;

        etl::expected<void, error::Error> releaseCard() override;

    private:
        etl::expected<void, error::Error> waitForCard();

        etl::expected<void, error::Error> transmit(
            const uint8_t* command,
            size_t length,
            etl::ivector<uint8_t>& response);

        void releaseContext();

        PcscReaderOptions options;
        SCARDCONTEXT context;
        SCARDHANDLE card;
        bool contextReady;
        bool connected;
        SCARD_IO_REQUEST sendPci;
        etl::string<MAX_READERNAME> readerName;
    };

} // namespace pcsc
