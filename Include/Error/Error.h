/**
 * @file Error.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief
 * @version 0.2
 * @date 2026-10-12
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "TransportError.h"
#include "CardError.h"
#include "ApduError.h"
#include "ClassicError.h"

#include <etl/variant.h>
#include <etl/string_view.h>
#include <etl/string.h>

#include <cstdio>
#include <type_traits>

namespace error {

    enum class ErrorLayer : uint8_t {
        Transport,
        Card,
        Apdu,
        Classic
    };


    class Error {
        public:

            using ErrorVariant = etl::variant<
                TransportError,
                CardError,
                ApduError,
                ClassicError
            >;

            Error(ErrorLayer layer, ErrorVariant errorCode, uint16_t statusWord = 0, int32_t detail = 0)
                : layer(layer), errorCode(errorCode), sw(statusWord), detailValue(detail) {}

            /**
             * @brief Reader/transport failure
             *
             * @param err Transport error code
             * @param nativeCode Native driver return code (e.g. PC/SC LONG), kept as detail
             */
            static Error fromTransport(TransportError err, int32_t nativeCode = 0) {
                return Error{ErrorLayer::Transport, err, 0, nativeCode};
            }

            static Error fromCard(CardError err, int32_t detail = 0) {
                return Error{ErrorLayer::Card, err, 0, detail};
            }

            /**
             * @brief APDU failure
             *
             * @param err APDU error code
             * @param statusWord Raw SW1SW2 returned by the card, 0 if none
             */
            static Error fromApdu(ApduError err, uint16_t statusWord = 0) {
                return Error{ErrorLayer::Apdu, err, statusWord, 0};
            }

            static Error fromClassic(ClassicError err, int32_t detail = 0) {
                return Error{ErrorLayer::Classic, err, 0, detail};
            }

            template<typename T>
            bool is() const {
                return etl::holds_alternative<T>(errorCode);
            }

            template<typename T>
            T get() const {
                return etl::get<T>(errorCode);
            }

            ErrorLayer getLayer() const {
                return layer;
            }

            uint16_t statusWord() const {
                return sw;
            }

            int32_t detail() const {
                return detailValue;
            }

            etl::string_view layerName(ErrorLayer layer) const {
                switch (layer) {
                    case ErrorLayer::Transport:
                        return "Transport";
                    case ErrorLayer::Card:
                        return "Card";
                    case ErrorLayer::Apdu:
                        return "APDU";
                    case ErrorLayer::Classic:
                        return "MifareClassic";
                    default:
                        return "Unknown";
                }
            }

            etl::string_view nameOf(TransportError err) const {
                switch (err) {
                    case TransportError::Ok:
                        return "Ok";
                    case TransportError::ServiceUnavailable:
                        return "ServiceUnavailable";
                    case TransportError::NoReaderAvailable:
                        return "NoReaderAvailable";
                    case TransportError::ReaderUnavailable:
                        return "ReaderUnavailable";
                    case TransportError::NotConnected:
                        return "NotConnected";
                    case TransportError::ConnectFailed:
                        return "ConnectFailed";
                    case TransportError::ProtocolNotSupported:
                        return "ProtocolNotSupported";
                    case TransportError::Timeout:
                        return "Timeout";
                    case TransportError::TransmitFailed:
                        return "TransmitFailed";
                    case TransportError::CardRemoved:
                        return "CardRemoved";
                    case TransportError::BufferOverflow:
                        return "BufferOverflow";
                    case TransportError::Unknown:
                        return "UnknownError";
                    default:
                        return "UndefinedTransportError";
                }
            }

            etl::string_view nameOf(CardError err) const {
                switch (err) {
                    case CardError::Ok:
                        return "Ok";
                    case CardError::NoCardPresent:
                        return "NoCardPresent";
                    case CardError::UnknownCardType:
                        return "UnknownCardType";
                    case CardError::UnsupportedCardType:
                        return "UnsupportedCardType";
                    default:
                        return "UndefinedCardError";
                }
            }

            etl::string_view nameOf(ApduError err) const {
                switch (err) {
                    case ApduError::Ok:
                        return "Ok";
                    case ApduError::WrongLength:
                        return "WrongLength";
                    case ApduError::SecurityStatusNotSatisfied:
                        return "SecurityStatusNotSatisfied";
                    case ApduError::UnexpectedStatus:
                        return "UnexpectedStatus";
                    case ApduError::CommandTooLong:
                        return "CommandTooLong";
                    default:
                        return "UndefinedApduError";
                }
            }

            etl::string_view nameOf(ClassicError err) const {
                switch (err) {
                    case ClassicError::Ok:
                        return "Ok";
                    case ClassicError::TrailerAccessDenied:
                        return "TrailerAccessDenied";
                    case ClassicError::InvalidDataLength:
                        return "InvalidDataLength";
                    case ClassicError::InvalidStringLength:
                        return "InvalidStringLength";
                    case ClassicError::InvalidKeyLength:
                        return "InvalidKeyLength";
                    case ClassicError::InvalidKeyType:
                        return "InvalidKeyType";
                    case ClassicError::InvalidHexString:
                        return "InvalidHexString";
                    case ClassicError::BlockOutOfRange:
                        return "BlockOutOfRange";
                    case ClassicError::SectorOutOfRange:
                        return "SectorOutOfRange";
                    case ClassicError::NegativeValue:
                        return "NegativeValue";
                    default:
                        return "UndefinedClassicError";
                }
            }

            etl::string<160> toString() const {
                etl::string<160> result;
                auto layer_name = layerName(layer);
                result.assign(layer_name.begin(), layer_name.end());
                result.append(" Error: ");

                auto error_name = etl::visit([this](auto&& arg) {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, TransportError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, CardError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, ApduError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, ClassicError>) {
                            return nameOf(arg);
                        } else {
                            return etl::string_view("Unknown Error Type");
                        }
                    }, errorCode);

                result.append(error_name.begin(), error_name.end());
                return result;
            }

            /**
             * @brief Human readable reason, as shown to operators
             *
             * Status word failures render the code in hex ("0x6300"); 0x6982 gets
             * its ISO 7816-4 meaning.
             *
             * @return etl::string<160> Message
             */
            etl::string<160> message() const {
                char buffer[160] = {0};

                if (is<ApduError>()) {
                    switch (get<ApduError>()) {
                        case ApduError::SecurityStatusNotSatisfied:
                            std::snprintf(buffer, sizeof(buffer), "0x%04X - Security status not satisfied.", sw);
                            break;
                        case ApduError::UnexpectedStatus:
                            std::snprintf(buffer, sizeof(buffer), "0x%04X", sw);
                            break;
                        case ApduError::WrongLength:
                            std::snprintf(buffer, sizeof(buffer), "Invalid Response Length.");
                            break;
                        case ApduError::CommandTooLong:
                            std::snprintf(buffer, sizeof(buffer), "Command Too Long.");
                            break;
                        default:
                            break;
                    }
                } else if (is<CardError>()) {
                    switch (get<CardError>()) {
                        case CardError::NoCardPresent:
                            std::snprintf(buffer, sizeof(buffer), "No Card Present.");
                            break;
                        case CardError::UnknownCardType:
                            std::snprintf(buffer, sizeof(buffer), "Unknown Card Type.");
                            break;
                        case CardError::UnsupportedCardType:
                            std::snprintf(buffer, sizeof(buffer), "Unsupported Card Type: %04X",
                                          static_cast<unsigned int>(detailValue) & 0xFFFFU);
                            break;
                        default:
                            break;
                    }
                } else if (is<ClassicError>()) {
                    switch (get<ClassicError>()) {
                        case ClassicError::TrailerAccessDenied:
                            std::snprintf(buffer, sizeof(buffer),
                                          "Sector trailer must be accessed with the"
                                          " \"read-sector-trailer\" or \"write-sector-trailer\" action.");
                            break;
                        case ClassicError::InvalidDataLength:
                            std::snprintf(buffer, sizeof(buffer), "Invalid Data Length: %ld", static_cast<long>(detailValue));
                            break;
                        case ClassicError::InvalidStringLength:
                            std::snprintf(buffer, sizeof(buffer), "Invalid String Length: %ld", static_cast<long>(detailValue));
                            break;
                        case ClassicError::InvalidKeyLength:
                            std::snprintf(buffer, sizeof(buffer), "Invalid Key Length: %ld", static_cast<long>(detailValue));
                            break;
                        case ClassicError::InvalidKeyType:
                            std::snprintf(buffer, sizeof(buffer), "Invalid Key.");
                            break;
                        case ClassicError::InvalidHexString:
                            std::snprintf(buffer, sizeof(buffer), "Invalid Hex String.");
                            break;
                        case ClassicError::BlockOutOfRange:
                            std::snprintf(buffer, sizeof(buffer), "Block Out Of Range: %ld", static_cast<long>(detailValue));
                            break;
                        case ClassicError::SectorOutOfRange:
                            std::snprintf(buffer, sizeof(buffer), "Sector Out Of Range: %ld", static_cast<long>(detailValue));
                            break;
                        case ClassicError::NegativeValue:
                            std::snprintf(buffer, sizeof(buffer), "Invalid Value: %ld", static_cast<long>(detailValue));
                            break;
                        default:
                            break;
                    }
                } else if (is<TransportError>() && detailValue != 0) {
                    auto name = nameOf(get<TransportError>());
                    std::snprintf(buffer, sizeof(buffer), "Reader %.*s (0x%08lX)",
                                  static_cast<int>(name.size()), name.data(),
                                  static_cast<unsigned long>(static_cast<uint32_t>(detailValue)));
                }

                if (buffer[0] == '\0') {
                    return toString();
                }

                return etl::string<160>(buffer);
            }

        private:
            ErrorLayer   layer;
            ErrorVariant errorCode;
            uint16_t     sw;
            int32_t      detailValue;

    };

} // namespace error
