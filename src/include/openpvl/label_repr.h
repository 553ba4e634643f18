#pragma once

#include "openpvl/label_document.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace openpvl {

// Appends a terminal-safe, ASCII-only representation of node `id` into `out`.
//
// Behavior:
// - Scalars render in label form (`NULL`, `TRUE`, `42`, `2.5`)
// - Text renders double-quoted; `\` and `"` are backslash-escaped, `\n`,
//   `\r`, `\t` use C escapes, other control and non-ASCII bytes use `\xNN`
// - Bytes render as `bytes[N]:HEX` (at most 32 bytes of hex)
// - Units render as `<inner> <unit>`; containers as `sequence[N]`,
//   `set[N]`, `object[N]` or `group[N]`
// - Truncates to `max_bytes` bytes (0 = unlimited) and appends "..."
//
// Returns true when the representation was truncated.
bool
append_label_value_repr(const LabelDocument& doc, NodeId id,
                        uint32_t max_bytes, std::string* out) noexcept;

// Appends `s` with the same escaping as a Text repr, without quotes.
void
append_repr_escaped(std::string_view s, std::string* out) noexcept;

// Stable lowercase name of `kind` (e.g. "integer", "group").
const char*
label_value_kind_name(LabelValueKind kind) noexcept;

}  // namespace openpvl
