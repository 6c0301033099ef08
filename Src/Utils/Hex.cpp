/**
 * @file Hex.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Hexadecimal codec and byte buffer helpers
 * @version 0.1
 * @date 2026-10-12
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Utils/Hex.h"

namespace
{
    constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

    int hexValue(char c)
    {
        if (c >= '0' && c <= '9')
        {
            return c - '0';
        }
        if (c >= 'A' && c <= 'F')
        {
            return 10 + (c - 'A');
        }
        if (c >= 'a' && c <= 'f')
        {
            return 10 + (c - 'a');
        }
        return -1;
    }
}

namespace utils
{
    bool toHex(const uint8_t* data, size_t length, etl::istring& out)
    {
        if (out.available() < length * 2U)
        {
            return false;
        }

        for (size_t i = 0; i < length; ++i)
        {
            out.push_back(HEX_DIGITS[(data[i] >> 4) & 0x0F]);
            out.push_back(HEX_DIGITS[data[i] & 0x0F]);
        }
        return true;
    }

    bool toHex(const etl::ivector<uint8_t>& data, etl::istring& out)
    {
        return toHex(data.data(), data.size(), out);
    }

    bool fromHex(etl::string_view text, etl::ivector<uint8_t>& out)
    {
        out.clear();

        if ((text.size() % 2U) != 0U || (text.size() / 2U) > out.capacity())
        {
            return false;
        }

        for (size_t i = 0; i < text.size(); i += 2U)
        {
            const int high = hexValue(text[i]);
            const int low = hexValue(text[i + 1U]);
            if (high < 0 || low < 0)
            {
                out.clear();
                return false;
            }
            out.push_back(static_cast<uint8_t>((high << 4) | low));
        }
        return true;
    }

    bool concat(const etl::ivector<uint8_t>& first, const etl::ivector<uint8_t>& second, etl::ivector<uint8_t>& out)
    {
        if (first.size() + second.size() > out.capacity())
        {
            return false;
        }

        out.clear();
        out.insert(out.end(), first.begin(), first.end());
        out.insert(out.end(), second.begin(), second.end());
        return true;
    }

} // namespace utils
