#pragma once

#include "openpvl/label_dialect.h"
#include "openpvl/label_document.h"
#include "openpvl/label_quoting.h"
#include "openpvl/label_sink.h"

#include <cstdint>
#include <string>

/**
 * \file label_encode.h
 * \brief Encodes a \ref LabelDocument tree as dialect-specific label text.
 */

namespace openpvl {

/// Label encode result status.
enum class LabelEncodeStatus : uint8_t {
    Ok,
    /// A value has no label text form (raw bytes, a mapping used as a
    /// sequence element, ...). \ref LabelEncodeResult::detail holds its repr.
    UnsupportedValue,
    /// The quoter refused a text value, or a key is not valid UTF-8.
    EncodingRejected,
    /// Nesting exceeded \ref LabelEncodeLimits::max_depth.
    LimitExceeded,
    /// The root is not an Object/Group, or a node id is out of range.
    Malformed,
};

/// Default \ref LabelEncodeLimits::max_depth.
inline constexpr uint32_t kDefaultLabelMaxDepth = 64;

/// Resource limits applied while encoding.
struct LabelEncodeLimits final {
    /// Refuse blocks or collections nested deeper than this (0 = unlimited).
    uint32_t max_depth = kDefaultLabelMaxDepth;
};

/// Encode options for \ref encode_label.
struct LabelEncodeOptions final {
    LabelEncodeLimits limits;
    /// Text quoting policy; nullptr selects \ref default_quoter.
    const LabelQuoter* quoter = nullptr;
    /// Cap on \ref LabelEncodeResult::detail (0 = unlimited).
    uint32_t max_repr_bytes = 256;
};

/// Encode result (size stats plus failure location).
struct LabelEncodeResult final {
    LabelEncodeStatus status = LabelEncodeStatus::Ok;
    /// Bytes appended to the sink, including those written before a failure.
    uint64_t written = 0;
    /// Assignment statements written (begin/end lines excluded).
    uint32_t statements = 0;

    NodeId failed_node = kInvalidNodeId;
    /// Escaped key of the entry that failed, if any.
    std::string failed_key;
    /// Escaped representation of the failing value or key.
    std::string detail;
};

/**
 * \brief Writes the mapping \p root as label text into \p sink.
 *
 * Runs the column pre-pass when \ref LabelDialect::align_assignments is
 * set, writes the block recursively, then writes \ref LabelDialect::terminal
 * with no trailing newline. Callers wanting a final line break append it.
 *
 * Failures stop the traversal immediately. Bytes written before the failing
 * entry stay in the sink; the failing entry itself writes nothing. Use
 * \ref dump_label for all-or-nothing output.
 *
 * Safe to call concurrently with shared dialects, quoters and documents.
 */
LabelEncodeResult
encode_label(const LabelDocument& doc, NodeId root, const LabelDialect& dialect,
             LabelSink& sink, const LabelEncodeOptions& options) noexcept;

/// Encodes `doc.root()` with default options.
LabelEncodeResult
encode_label(const LabelDocument& doc, const LabelDialect& dialect,
             LabelSink& sink) noexcept;

/**
 * \brief Encodes the document root into a private buffer and appends it to
 * \p out only on success. \p out is untouched on failure.
 */
LabelEncodeResult
dump_label(const LabelDocument& doc, const LabelDialect& dialect,
           const LabelEncodeOptions& options, std::string* out) noexcept;

/**
 * \brief Appends the text form of a single value (scalar, units, sequence
 * or set) to \p out.
 *
 * On failure \p out may hold a partial value; \ref encode_label never
 * forwards such partial text to a sink.
 */
LabelEncodeResult
encode_label_value(const LabelDocument& doc, NodeId id,
                   const LabelEncodeOptions& options,
                   std::string* out) noexcept;

/**
 * \brief Returns the shared assignment column of the tree under \p root.
 *
 * The column is the largest `depth * width(indent) + width(key)` over every
 * key of every nested Object/Group, in UTF-8 code points. A long key deep in
 * the tree widens the column for every line. Returns 0 for an empty tree.
 *
 * Blocks nested deeper than \p max_depth are not visited (0 = unlimited);
 * \ref encode_label stops with \ref LabelEncodeStatus::LimitExceeded
 * before writing them.
 */
uint32_t
compute_assignment_column(const LabelDocument& doc, NodeId root,
                          const LabelDialect& dialect,
                          uint32_t max_depth = kDefaultLabelMaxDepth) noexcept;

/// Appends the decimal form of \p value.
void
append_label_integer(int64_t value, std::string* out) noexcept;

/**
 * \brief Appends the shortest round-trip form of \p value.
 *
 * Decimal exponents in [-4, 16) use positional notation (`100000.0`,
 * `0.0001`), others scientific (`1e+16`, `1e-05`). Positional integral
 * values get `.0`.
 */
void
append_label_real(double value, std::string* out) noexcept;

const char*
label_encode_status_name(LabelEncodeStatus status) noexcept;

}  // namespace openpvl
