#include "pfverify/util/quote.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iterator>

namespace pfverify::util
{
namespace
{
struct CodePointRange
{
    std::uint32_t first;
    std::uint32_t last;
};

// Non-printable code points above U+009F: format (Cf), space separators (Zs),
// line/paragraph separators (Zl, Zp), private use (Co). Sorted, non-overlapping.
constexpr CodePointRange kNonPrintable[] = {
    {0x00A0, 0x00A0},   {0x00AD, 0x00AD},   {0x0600, 0x0605},   {0x061C, 0x061C},
    {0x06DD, 0x06DD},   {0x070F, 0x070F},   {0x0890, 0x0891},   {0x08E2, 0x08E2},
    {0x1680, 0x1680},   {0x180E, 0x180E},   {0x2000, 0x200F},   {0x2028, 0x202F},
    {0x205F, 0x2064},   {0x2066, 0x206F},   {0x3000, 0x3000},   {0xE000, 0xF8FF},
    {0xFEFF, 0xFEFF},   {0xFFF9, 0xFFFB},   {0x110BD, 0x110BD}, {0x110CD, 0x110CD},
    {0x13430, 0x1343F}, {0x1BCA0, 0x1BCA3}, {0x1D173, 0x1D17A}, {0xE0001, 0xE0001},
    {0xE0020, 0xE007F}, {0xF0000, 0xFFFFD}, {0x100000, 0x10FFFD},
};

bool is_printable(std::uint32_t cp)
{
    if (cp < 0x20 || (cp >= 0x7F && cp <= 0x9F))
        return false;
    auto it = std::upper_bound(std::begin(kNonPrintable), std::end(kNonPrintable), cp,
                               [](std::uint32_t v, const CodePointRange& r) { return v < r.first; });
    if (it == std::begin(kNonPrintable))
        return true;
    --it;
    return cp > it->last;
}

// Decodes one UTF-8 sequence at `pos`; returns its length, or 0 when the
// bytes there are not well-formed.
size_t decode_utf8(const std::string& s, size_t pos, std::uint32_t& cp)
{
    const auto b0 = static_cast<unsigned char>(s[pos]);
    size_t len = 0;
    std::uint32_t min = 0;
    if (b0 < 0x80)
    {
        cp = b0;
        return 1;
    }
    if ((b0 & 0xE0) == 0xC0)
    {
        len = 2;
        cp = b0 & 0x1F;
        min = 0x80;
    }
    else if ((b0 & 0xF0) == 0xE0)
    {
        len = 3;
        cp = b0 & 0x0F;
        min = 0x800;
    }
    else if ((b0 & 0xF8) == 0xF0)
    {
        len = 4;
        cp = b0 & 0x07;
        min = 0x10000;
    }
    else
        return 0;

    if (pos + len > s.size())
        return 0;
    for (size_t i = 1; i < len; ++i)
    {
        const auto b = static_cast<unsigned char>(s[pos + i]);
        if ((b & 0xC0) != 0x80)
            return 0;
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return 0;
    return len;
}

void append_escape(std::string& out, std::uint32_t cp)
{
    char buf[11];
    if (cp < 0x100)
        std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(cp));
    else if (cp < 0x10000)
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(cp));
    else
        std::snprintf(buf, sizeof(buf), "\\U%08x", static_cast<unsigned>(cp));
    out += buf;
}
} // namespace

std::string quote(const std::string& value)
{
    const bool has_single = value.find('\'') != std::string::npos;
    const bool has_double = value.find('"') != std::string::npos;
    const char q = (has_single && !has_double) ? '"' : '\'';

    std::string out;
    out.reserve(value.size() + 2);
    out.push_back(q);
    size_t pos = 0;
    while (pos < value.size())
    {
        const char ch = value[pos];
        if (ch == q || ch == '\\')
        {
            out.push_back('\\');
            out.push_back(ch);
            ++pos;
            continue;
        }
        if (ch == '\n' || ch == '\r' || ch == '\t')
        {
            out += ch == '\n' ? "\\n" : ch == '\r' ? "\\r" : "\\t";
            ++pos;
            continue;
        }

        std::uint32_t cp = 0;
        const size_t len = decode_utf8(value, pos, cp);
        if (len == 0)
        {
            // Stray byte: show it rather than emit broken UTF-8.
            append_escape(out, static_cast<unsigned char>(ch));
            ++pos;
            continue;
        }
        if (is_printable(cp))
            out.append(value, pos, len);
        else
            append_escape(out, cp);
        pos += len;
    }
    out.push_back(q);
    return out;
}

} // namespace pfverify::util
