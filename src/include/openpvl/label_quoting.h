#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file label_quoting.h
 * \brief Text quoting policy consulted by the encoder for Text values.
 */

namespace openpvl {

enum class QuoteStatus : uint8_t {
    Ok,
    /// The text cannot be represented as a quoted string.
    Rejected,
};

/**
 * \brief Decides whether text needs quoting and produces the quoted form.
 *
 * Implementations must be stateless or otherwise safe to share between
 * concurrent encode calls.
 */
class LabelQuoter {
public:
    virtual ~LabelQuoter() = default;

    /// True if \p text cannot be written as a bare word.
    virtual bool needs_quotes(std::string_view text) const noexcept = 0;

    /// Appends the quoted form of \p text to \p out, or nothing on rejection.
    virtual QuoteStatus quote(std::string_view text,
                              std::string* out) const noexcept
        = 0;
};

/**
 * \brief PVL quoting rules.
 *
 * Quoting is required for empty text, whitespace or control bytes,
 * reserved characters, comment openers, reserved words (case-insensitive)
 * and text that starts like a number. Quoted text uses `"` unless it contains a
 * `"` and no `'`. Text holding both quote characters, control bytes other
 * than TAB/CR/LF, or invalid UTF-8 is rejected.
 */
class PvlQuoter final : public LabelQuoter {
public:
    bool needs_quotes(std::string_view text) const noexcept override;
    QuoteStatus quote(std::string_view text,
                      std::string* out) const noexcept override;
};

/// Returns a shared \ref PvlQuoter.
const LabelQuoter&
default_quoter() noexcept;

/// True if \p s is well-formed UTF-8 (no overlongs, surrogates or > U+10FFFF).
bool
is_valid_utf8(std::string_view s) noexcept;

/// Number of code points in \p s, counting each non-continuation byte.
uint32_t
utf8_width(std::string_view s) noexcept;

}  // namespace openpvl
