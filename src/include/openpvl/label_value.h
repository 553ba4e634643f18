#pragma once

#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file label_value.h
 * \brief Typed label value representation (scalar/text/units/containers).
 */

namespace openpvl {

class LabelDocument;

using NodeId = uint32_t;

static constexpr NodeId kInvalidNodeId = 0xffffffffU;

/// A span (offset,size) into a \ref LabelDocument text arena.
struct TextSpan final {
    uint32_t offset = 0;
    uint32_t size   = 0;
};

/// Closed set of value kinds a label tree can hold.
enum class LabelValueKind : uint8_t {
    Null,
    Boolean,
    Integer,
    Real,
    /// UTF-8 text in a \ref TextSpan.
    Text,
    /// Raw uninterpreted bytes in a \ref TextSpan. Has no label text form.
    Bytes,
    /// A scalar node (\ref LabelValue::data inner) with a unit label.
    Units,
    /// Ordered sequence of values, written as `(a, b, c)`.
    Sequence,
    /// Unordered set of distinct values, written as `{a, b, c}`.
    Set,
    /// Ordered mapping written with OBJECT-family tokens.
    Object,
    /// Ordered mapping written with GROUP-family tokens.
    Group,
};

/**
 * \brief A typed label value.
 *
 * Storage rules:
 * - Boolean/Integer/Real values are stored inline in `LabelValue::data`.
 * - Text/Bytes values store their payload in `LabelValue::data.span`.
 * - Units values reference their scalar node in `LabelValue::data.inner`
 *   and keep the unit label in \ref LabelValue::units.
 * - Containers carry no payload; their children live in the owning
 *   \ref LabelDocument.
 */
struct LabelValue final {
    LabelValueKind kind = LabelValueKind::Null;
    TextSpan units;

    union Data {
        bool boolean;
        int64_t i64;
        double f64;
        TextSpan span;
        NodeId inner;

        Data() noexcept
            : i64(0)
        {
        }
    } data;
};

/// True for Null, Boolean, Integer, Real and Text.
constexpr bool
is_scalar_kind(LabelValueKind kind) noexcept
{
    return kind == LabelValueKind::Null || kind == LabelValueKind::Boolean
           || kind == LabelValueKind::Integer || kind == LabelValueKind::Real
           || kind == LabelValueKind::Text;
}

/// True for Object and Group.
constexpr bool
is_mapping_kind(LabelValueKind kind) noexcept
{
    return kind == LabelValueKind::Object || kind == LabelValueKind::Group;
}

/// True for Sequence and Set.
constexpr bool
is_collection_kind(LabelValueKind kind) noexcept
{
    return kind == LabelValueKind::Sequence || kind == LabelValueKind::Set;
}

/** \name Scalar constructors
 *  @{
 */
LabelValue
make_null() noexcept;
LabelValue
make_bool(bool value) noexcept;
LabelValue
make_integer(int64_t value) noexcept;
LabelValue
make_real(double value) noexcept;
/** @} */

/** \name Arena-backed constructors
 *  @{
 */
LabelValue
make_text(LabelDocument& doc, std::string_view text);
LabelValue
make_bytes(LabelDocument& doc, std::span<const std::byte> bytes);
/// Wraps the scalar node \p inner; attach it with \ref LabelDocument::add_node.
LabelValue
make_units(LabelDocument& doc, NodeId inner, std::string_view unit);
/** @} */

/** \name Container constructors
 *  @{
 */
LabelValue
make_sequence() noexcept;
LabelValue
make_set() noexcept;
LabelValue
make_object() noexcept;
LabelValue
make_group() noexcept;
/** @} */

}  // namespace openpvl
