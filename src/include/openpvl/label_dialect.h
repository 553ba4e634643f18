#pragma once

#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file label_dialect.h
 * \brief Structural token tables and line formatting per label dialect.
 */

namespace openpvl {

/// How a group/object close line is written.
enum class EndLineStyle : uint8_t {
    /// `<end_token> = <name>`
    RepeatName,
    /// `<end_token>` alone, no assignment and no name.
    Bare,
};

/**
 * \brief Immutable dialect configuration consumed by \ref encode_label.
 *
 * Dialects are plain values: the encoder looks tokens up here instead of
 * specializing its traversal, so one dialect value can be shared by any
 * number of concurrent encode calls.
 *
 * \note The PDS3 dialect writes `END` for both end_group and end_object.
 * Such output can only be re-read by a decoder that pairs closes with the
 * open GROUP/OBJECT on its own stack; the encoder does not disambiguate.
 */
struct LabelDialect final {
    std::string_view name;

    std::string_view begin_group;
    std::string_view end_group;
    std::string_view begin_object;
    std::string_view end_object;
    /// Written once after the root block, with no trailing newline.
    std::string_view terminal;

    EndLineStyle end_line_style = EndLineStyle::RepeatName;
    /// Pad every key to one document-wide column (PDS3).
    bool align_assignments = false;

    /// One nesting level of indentation.
    std::string_view indent     = "  ";
    std::string_view assignment = " = ";
    std::string_view newline    = "\n";
};

/// PVL: `BEGIN_GROUP = X` ... `END_GROUP = X`, terminated by `END`.
const LabelDialect&
default_dialect() noexcept;

/// ISIS cube labels: `Group = X` ... `End_Group`, terminated by `End`.
const LabelDialect&
cube_dialect() noexcept;

/// PDS3 labels: `GROUP = X` ... `END = X`, aligned, terminated by `END`.
const LabelDialect&
pds3_dialect() noexcept;

/// Returns the built-in dialects (Default, Cube, PDS3).
std::span<const LabelDialect* const>
builtin_dialects() noexcept;

/**
 * \brief Looks up a built-in dialect by name (ASCII case-insensitive).
 *
 * Accepts `default`/`pvl`, `cube`/`isis` and `pds3`/`pds`. Returns
 * nullptr for unknown names.
 */
const LabelDialect*
find_dialect(std::string_view name) noexcept;

}  // namespace openpvl
