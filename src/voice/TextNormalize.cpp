#include "voice/TextNormalize.h"

#include <cstdint>

namespace text
{

namespace
{

// Decodes one code point starting at pos. Malformed bytes decode as themselves.
std::uint32_t decode(const std::string &input, std::size_t &pos)
{
    const auto lead = static_cast<unsigned char>(input[pos]);
    std::size_t length = 1;
    std::uint32_t code = lead;
    if ((lead & 0xE0u) == 0xC0u)
    {
        length = 2;
        code = lead & 0x1Fu;
    }
    else if ((lead & 0xF0u) == 0xE0u)
    {
        length = 3;
        code = lead & 0x0Fu;
    }
    else if ((lead & 0xF8u) == 0xF0u)
    {
        length = 4;
        code = lead & 0x07u;
    }
    if (length == 1 || pos + length > input.size())
    {
        ++pos;
        return lead;
    }
    for (std::size_t i = 1; i < length; ++i)
    {
        const auto next = static_cast<unsigned char>(input[pos + i]);
        if ((next & 0xC0u) != 0x80u)
        {
            ++pos;
            return lead;
        }
        code = (code << 6) | (next & 0x3Fu);
    }
    pos += length;
    return code;
}

void encode(std::string &out, std::uint32_t code)
{
    if (code < 0x80)
    {
        out.push_back(static_cast<char>(code));
    }
    else if (code < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (code >> 6)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
    else if (code < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (code >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (code >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

std::uint32_t lower(std::uint32_t code)
{
    if (code >= 'A' && code <= 'Z')
    {
        return code + 0x20;
    }
    if (code >= 0x0410 && code <= 0x042F)
    {
        return code + 0x20;
    }
    if (code == 0x0401 || code == 0x0451)
    {
        return 0x0435;
    }
    return code;
}

bool isWordCharacter(std::uint32_t code)
{
    if ((code >= 'a' && code <= 'z') || (code >= '0' && code <= '9') || code == '%')
    {
        return true;
    }
    return code >= 0x0430 && code <= 0x044F;
}

} // namespace

std::string toLowerUtf8(const std::string &input)
{
    std::string out;
    out.reserve(input.size());
    std::size_t pos = 0;
    while (pos < input.size())
    {
        encode(out, lower(decode(input, pos)));
    }
    return out;
}

std::vector<std::string> tokenize(const std::string &input)
{
    std::vector<std::string> tokens;
    std::string current;
    std::size_t pos = 0;
    while (pos < input.size())
    {
        const std::uint32_t code = lower(decode(input, pos));
        if (isWordCharacter(code))
        {
            encode(current, code);
            continue;
        }
        if (!current.empty())
        {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
    {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

bool startsWith(const std::string &value, const std::string &prefix)
{
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace text
