#include "openpvl/label_quoting.h"

#include <array>

namespace openpvl {
namespace {

    static constexpr std::string_view kReservedChars = "&<>'\"{}[](),=!#%+;~|";

    static constexpr std::array<std::string_view, 10> kReservedWords = {
        "BEGIN_GROUP", "BEGIN_OBJECT", "END",  "END_GROUP", "END_OBJECT",
        "GROUP",       "OBJECT",       "NULL", "TRUE",      "FALSE",
    };


    static bool is_reserved_word(std::string_view s) noexcept
    {
        for (size_t w = 0; w < kReservedWords.size(); ++w) {
            const std::string_view word = kReservedWords[w];
            if (word.size() != s.size()) {
                continue;
            }
            bool same = true;
            for (size_t i = 0; i < s.size() && same; ++i) {
                char c = s[i];
                if (c >= 'a' && c <= 'z') {
                    c = static_cast<char>(c - 'a' + 'A');
                }
                same = (c == word[i]);
            }
            if (same) {
                return true;
            }
        }
        return false;
    }


    static bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }


    static bool starts_like_number(std::string_view s) noexcept
    {
        size_t i = 0;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
            i += 1;
        }
        if (i < s.size() && is_digit(s[i])) {
            return true;
        }
        return i + 1 < s.size() && s[i] == '.' && is_digit(s[i + 1]);
    }

}  // namespace

bool
is_valid_utf8(std::string_view s) noexcept
{
    size_t i = 0;
    while (i < s.size()) {
        const uint8_t c = static_cast<uint8_t>(s[i]);
        if (c < 0x80U) {
            i += 1;
            continue;
        }

        uint32_t cp  = 0;
        size_t len   = 0;
        uint32_t min = 0;
        if ((c & 0xE0U) == 0xC0U) {
            cp  = c & 0x1FU;
            len = 2;
            min = 0x80U;
        } else if ((c & 0xF0U) == 0xE0U) {
            cp  = c & 0x0FU;
            len = 3;
            min = 0x800U;
        } else if ((c & 0xF8U) == 0xF0U) {
            cp  = c & 0x07U;
            len = 4;
            min = 0x10000U;
        } else {
            return false;
        }
        if (i + len > s.size()) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            const uint8_t cc = static_cast<uint8_t>(s[i + k]);
            if ((cc & 0xC0U) != 0x80U) {
                return false;
            }
            cp = (cp << 6U) | (cc & 0x3FU);
        }
        if (cp < min || cp > 0x10FFFFU) {
            return false;
        }
        if (cp >= 0xD800U && cp <= 0xDFFFU) {
            return false;
        }
        i += len;
    }
    return true;
}


uint32_t
utf8_width(std::string_view s) noexcept
{
    uint32_t n = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<uint8_t>(s[i]) & 0xC0U) != 0x80U) {
            n += 1U;
        }
    }
    return n;
}


bool
PvlQuoter::needs_quotes(std::string_view text) const noexcept
{
    if (text.empty() || !is_valid_utf8(text)) {
        return true;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        const uint8_t c = static_cast<uint8_t>(text[i]);
        if (c <= 0x20U || c == 0x7FU) {
            return true;
        }
        if (kReservedChars.find(static_cast<char>(c))
            != std::string_view::npos) {
            return true;
        }
    }
    if (text.find("/*") != std::string_view::npos) {
        return true;
    }
    return is_reserved_word(text) || starts_like_number(text);
}


QuoteStatus
PvlQuoter::quote(std::string_view text, std::string* out) const noexcept
{
    if (!out || !is_valid_utf8(text)) {
        return QuoteStatus::Rejected;
    }

    bool has_double = false;
    bool has_single = false;
    for (size_t i = 0; i < text.size(); ++i) {
        const uint8_t c = static_cast<uint8_t>(text[i]);
        if (c == static_cast<uint8_t>('"')) {
            has_double = true;
            continue;
        }
        if (c == static_cast<uint8_t>('\'')) {
            has_single = true;
            continue;
        }
        if (c == '\t' || c == '\r' || c == '\n') {
            continue;
        }
        if (c < 0x20U || c == 0x7FU) {
            return QuoteStatus::Rejected;
        }
    }
    if (has_double && has_single) {
        return QuoteStatus::Rejected;
    }

    const char q = has_double ? '\'' : '"';
    out->reserve(out->size() + text.size() + 2U);
    out->push_back(q);
    out->append(text.data(), text.size());
    out->push_back(q);
    return QuoteStatus::Ok;
}


const LabelQuoter&
default_quoter() noexcept
{
    static const PvlQuoter kQuoter;
    return kQuoter;
}

}  // namespace openpvl
