/**
 * @file Text.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Byte to text helpers for block dumps
 * @version 0.1
 * @date 2026-10-12
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Utils/Text.h"

namespace
{
    /**
     * @brief Length of the well formed UTF-8 sequence starting at data[0]
     *
     * @return size_t Sequence length (1-4), 0 if malformed or truncated
     */
    size_t sequenceLength(const uint8_t* data, size_t available, uint32_t& codePoint)
    {
        const uint8_t lead = data[0];
        size_t length = 0;

        if (lead < 0x80U)
        {
            codePoint = lead;
            return 1;
        }
        else if (lead >= 0xC2U && lead <= 0xDFU)
        {
            length = 2;
            codePoint = lead & 0x1FU;
        }
        else if (lead >= 0xE0U && lead <= 0xEFU)
        {
            length = 3;
            codePoint = lead & 0x0FU;
        }
        else if (lead >= 0xF0U && lead <= 0xF4U)
        {
            length = 4;
            codePoint = lead & 0x07U;
        }
        else
        {
            return 0;
        }

        if (length > available)
        {
            return 0;
        }

        for (size_t i = 1; i < length; ++i)
        {
            if ((data[i] & 0xC0U) != 0x80U)
            {
                return 0;
            }
            codePoint = (codePoint << 6) | (data[i] & 0x3FU);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if ((length == 3 && codePoint < 0x800U) ||
            (length == 4 && (codePoint < 0x10000U || codePoint > 0x10FFFFU)) ||
            (codePoint >= 0xD800U && codePoint <= 0xDFFFU))
        {
            return 0;
        }

        return length;
    }

    bool isPrintable(uint32_t codePoint)
    {
        return !(codePoint < 0x20U || (codePoint >= 0x7FU && codePoint <= 0x9FU) || codePoint == 0xFFFDU);
    }
}

namespace utils
{
    void renderPrintable(const uint8_t* data, size_t length, etl::istring& out)
    {
        size_t offset = 0;
        while (offset < length && !out.full())
        {
            uint32_t codePoint = 0;
            const size_t sequence = sequenceLength(data + offset, length - offset, codePoint);

            if (sequence == 0)
            {
                out.push_back(' ');
                ++offset;
                continue;
            }

            if (!isPrintable(codePoint))
            {
                out.push_back(' ');
            }
            else if (out.available() >= sequence)
            {
                for (size_t i = 0; i < sequence; ++i)
                {
                    out.push_back(static_cast<char>(data[offset + i]));
                }
            }
            else
            {
                break;
            }

            offset += sequence;
        }
    }

    bool toText(const uint8_t* data, size_t length, etl::istring& out)
    {
        while (length > 0 && data[length - 1] == 0x00)
        {
            --length;
        }

        if (out.available() < length)
        {
            return false;
        }

        for (size_t i = 0; i < length; ++i)
        {
            out.push_back(static_cast<char>(data[i]));
        }
        return true;
    }

} // namespace utils
