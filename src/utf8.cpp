// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/utf8.hpp>

namespace acp::utf8
{

namespace
{

bool is_continuation(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

} // namespace

size_t sequence_length(std::string_view input, size_t pos)
{
    if (pos >= input.size())
        return 0;

    auto byte = [&](size_t i) { return static_cast<unsigned char>(input[pos + i]); };
    const unsigned char lead = byte(0);
    const size_t remaining = input.size() - pos;

    if (lead < 0x80)
        return 1;

    if (lead >= 0xC2 && lead <= 0xDF)
        return remaining >= 2 && is_continuation(byte(1)) ? 2 : 0;

    if (lead >= 0xE0 && lead <= 0xEF)
    {
        if (remaining < 3 || !is_continuation(byte(1)) || !is_continuation(byte(2)))
            return 0;
        if (lead == 0xE0 && byte(1) < 0xA0) // overlong
            return 0;
        if (lead == 0xED && byte(1) > 0x9F) // surrogate
            return 0;
        return 3;
    }

    if (lead >= 0xF0 && lead <= 0xF4)
    {
        if (remaining < 4 || !is_continuation(byte(1)) || !is_continuation(byte(2)) ||
            !is_continuation(byte(3)))
            return 0;
        if (lead == 0xF0 && byte(1) < 0x90) // overlong
            return 0;
        if (lead == 0xF4 && byte(1) > 0x8F) // above U+10FFFF
            return 0;
        return 4;
    }

    return 0;
}

std::string sanitize(std::string_view input)
{
    std::string out;
    out.reserve(input.size());

    size_t pos = 0;
    while (pos < input.size())
    {
        size_t len = sequence_length(input, pos);
        if (len == 0)
        {
            ++pos;
            continue;
        }
        out.append(input.data() + pos, len);
        pos += len;
    }
    return out;
}

size_t length(std::string_view input)
{
    size_t count = 0;
    size_t pos = 0;
    while (pos < input.size())
    {
        pos = advance(input, pos, 1);
        ++count;
    }
    return count;
}

size_t advance(std::string_view input, size_t pos, size_t count)
{
    while (count > 0 && pos < input.size())
    {
        size_t len = sequence_length(input, pos);
        pos += len == 0 ? 1 : len;
        --count;
    }
    return pos;
}

} // namespace acp::utf8
