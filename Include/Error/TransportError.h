/**
 * @file TransportError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines transport error codes for the reader connection
 * @version 0.1
 * @date 2026-10-12
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    /**
     * @brief Reader transport error codes
     * 
     * Raised by IApduTransceiver / ICardDetector implementations when the
     * exchange with the reader itself fails (as opposed to the card answering
     * with a non-success status word).
     */
    enum class TransportError : uint8_t {
        Ok = 0,
        ServiceUnavailable,
        NoReaderAvailable,
        ReaderUnavailable,
        NotConnected,
        ConnectFailed,
        ProtocolNotSupported,
        Timeout,
        TransmitFailed,
        CardRemoved,
        BufferOverflow,
        Unknown
    };

} // namespace error
