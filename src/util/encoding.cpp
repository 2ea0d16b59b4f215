#include "mcpcommons/util/encoding.hpp"

#include <cstdint>

namespace mcpcommons::util::encoding
{

namespace
{
constexpr const char* kBase64Chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_value(unsigned char c)
{
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}
} // namespace

std::string base64_encode(const std::string& input)
{
    std::string result;
    result.reserve((input.size() + 2) / 3 * 4);
    for (size_t i = 0; i < input.size(); i += 3)
    {
        uint32_t n = static_cast<uint8_t>(input[i]) << 16;
        if (i + 1 < input.size())
            n |= static_cast<uint8_t>(input[i + 1]) << 8;
        if (i + 2 < input.size())
            n |= static_cast<uint8_t>(input[i + 2]);
        result.push_back(kBase64Chars[(n >> 18) & 0x3F]);
        result.push_back(kBase64Chars[(n >> 12) & 0x3F]);
        result.push_back((i + 1 < input.size()) ? kBase64Chars[(n >> 6) & 0x3F] : '=');
        result.push_back((i + 2 < input.size()) ? kBase64Chars[n & 0x3F] : '=');
    }
    return result;
}

std::optional<std::string> base64_decode(const std::string& input)
{
    if (input.size() % 4 != 0)
        return std::nullopt;

    std::string result;
    result.reserve(input.size() * 3 / 4);
    for (size_t i = 0; i < input.size(); i += 4)
    {
        const bool last = i + 4 == input.size();
        const bool pad2 = input[i + 2] == '=';
        const bool pad3 = input[i + 3] == '=';
        // Padding only at the very end, and "x=y" is never valid
        if ((pad2 || pad3) && !last)
            return std::nullopt;
        if (pad2 && !pad3)
            return std::nullopt;

        int a = base64_value(static_cast<unsigned char>(input[i]));
        int b = base64_value(static_cast<unsigned char>(input[i + 1]));
        int c = pad2 ? 0 : base64_value(static_cast<unsigned char>(input[i + 2]));
        int d = pad3 ? 0 : base64_value(static_cast<unsigned char>(input[i + 3]));
        if (a < 0 || b < 0 || c < 0 || d < 0)
            return std::nullopt;

        uint32_t n = (static_cast<uint32_t>(a) << 18) | (static_cast<uint32_t>(b) << 12) |
                     (static_cast<uint32_t>(c) << 6) | static_cast<uint32_t>(d);
        result.push_back(static_cast<char>((n >> 16) & 0xFF));
        if (!pad2)
            result.push_back(static_cast<char>((n >> 8) & 0xFF));
        if (!pad3)
            result.push_back(static_cast<char>(n & 0xFF));
    }
    return result;
}

std::optional<std::string> base64url_decode(const std::string& input)
{
    std::string standard = input;
    for (auto& c : standard)
    {
        if (c == '-')
            c = '+';
        else if (c == '_')
            c = '/';
        else if (c == '+' || c == '/')
            return std::nullopt;
    }
    if (standard.size() % 4 == 1)
        return std::nullopt;
    while (standard.size() % 4 != 0)
        standard.push_back('=');
    return base64_decode(standard);
}

std::string url_encode_component(const std::string& value)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value)
    {
        const bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                                c == '~';
        if (unreserved)
        {
            out.push_back(static_cast<char>(c));
            continue;
        }
        out.push_back('%');
        out.push_back(kHex[(c >> 4) & 0x0F]);
        out.push_back(kHex[c & 0x0F]);
    }
    return out;
}

bool is_valid_utf8(const std::string& bytes)
{
    size_t i = 0;
    while (i < bytes.size())
    {
        const auto c = static_cast<unsigned char>(bytes[i]);
        size_t extra;
        uint32_t cp;
        if (c < 0x80)
        {
            ++i;
            continue;
        }
        if ((c & 0xE0) == 0xC0)
        {
            extra = 1;
            cp = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            extra = 2;
            cp = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            extra = 3;
            cp = c & 0x07;
        }
        else
        {
            return false;
        }

        if (i + extra >= bytes.size())
            return false;
        for (size_t k = 1; k <= extra; ++k)
        {
            const auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        static const uint32_t kMin[] = {0, 0x80, 0x800, 0x10000};
        if (cp < kMin[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += extra + 1;
    }
    return true;
}

std::optional<std::string> utf8_to_latin1(const std::string& utf8)
{
    if (!is_valid_utf8(utf8))
        return std::nullopt;

    std::string out;
    out.reserve(utf8.size());
    for (size_t i = 0; i < utf8.size(); ++i)
    {
        const auto c = static_cast<unsigned char>(utf8[i]);
        if (c < 0x80)
        {
            out.push_back(static_cast<char>(c));
        }
        else if (c == 0xC2 || c == 0xC3)
        {
            const auto next = static_cast<unsigned char>(utf8[i + 1]);
            out.push_back(static_cast<char>(((c & 0x03) << 6) | (next & 0x3F)));
            ++i;
        }
        else
        {
            return std::nullopt;
        }
    }
    return out;
}

std::string latin1_to_utf8(const std::string& latin1)
{
    std::string out;
    out.reserve(latin1.size() * 2);
    for (unsigned char c : latin1)
    {
        if (c < 0x80)
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

bool is_ascii(const std::string& bytes)
{
    for (unsigned char c : bytes)
    {
        if (c >= 0x80)
            return false;
    }
    return true;
}

} // namespace mcpcommons::util::encoding
