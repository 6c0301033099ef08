/**
 * @file Text.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Byte to text helpers for block dumps
 * @version 0.1
 * @date 2026-10-12
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string.h>

#include <cstddef>
#include <cstdint>

namespace utils
{
    /**
     * @brief Render bytes as UTF-8 text for display
     *
     * Well formed, printable UTF-8 sequences are copied unchanged. Control
     * characters (C0, DEL, C1) and every malformed sequence become a single
     * space each.
     *
     * @param data Raw bytes
     * @param length Number of bytes
     * @param out Destination string (appended to, truncated at capacity)
     */
    void renderPrintable(const uint8_t* data, size_t length, etl::istring& out);

    /**
     * @brief Copy bytes into a string, dropping trailing zero padding
     *
     * @return false Destination capacity exceeded
     */
    bool toText(const uint8_t* data, size_t length, etl::istring& out);

} // namespace utils
