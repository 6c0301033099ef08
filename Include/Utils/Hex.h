/**
 * @file Hex.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Hexadecimal codec and byte buffer helpers
 * @version 0.1
 * @date 2026-10-12
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/string.h>
#include <etl/string_view.h>

#include <cstddef>
#include <cstdint>

namespace utils
{
    /**
     * @brief Append the uppercase hex encoding of a byte range to a string
     *
     * @param data Bytes to encode
     * @param length Number of bytes
     * @param out Destination string (appended to)
     * @return true Encoded completely
     * @return false Destination capacity exceeded, out left unchanged
     */
    bool toHex(const uint8_t* data, size_t length, etl::istring& out);

    bool toHex(const etl::ivector<uint8_t>& data, etl::istring& out);

    /**
     * @brief Decode a hex string (either case, no separators) into bytes
     *
     * @param text Hex text, must have an even number of digits
     * @param out Destination vector (cleared first)
     * @return true Decoded
     * @return false Odd length, non-hex character or capacity exceeded
     */
    bool fromHex(etl::string_view text, etl::ivector<uint8_t>& out);

    /**
     * @brief Concatenate two byte buffers into out
     *
     * @return false Destination capacity exceeded
     */
    bool concat(const etl::ivector<uint8_t>& first, const etl::ivector<uint8_t>& second, etl::ivector<uint8_t>& out);

} // namespace utils
