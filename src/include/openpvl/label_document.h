#pragma once

#include "openpvl/label_value.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file label_document.h
 * \brief Owning storage for a label tree (nodes, children and text).
 */

namespace openpvl {

/// One child of a container node. \ref key is empty for sequence/set elements.
struct LabelChild final {
    TextSpan key;
    NodeId value = kInvalidNodeId;
};

struct LabelNode final {
    LabelValue value;
    NodeId parent = kInvalidNodeId;
    std::vector<LabelChild> children;
};

/**
 * \brief A label tree plus the text arena backing its keys and payloads.
 *
 * The tree shape is enforced while building: every node has at most one
 * parent, the root is never attached, and a node is never attached below
 * itself. Rejected build calls leave the nodes unchanged. Text stored by
 * \ref make_text, \ref make_bytes or \ref make_units stays in the arena
 * even if \ref add_node then rejects the value; check \ref can_wrap_units
 * first to avoid that for units.
 *
 * \note \ref text and \ref bytes views may be invalidated by later build
 * calls (arena growth). Do not retain them across mutations.
 */
class LabelDocument final {
public:
    /// Creates a document holding an empty root Object.
    LabelDocument();

    NodeId root() const noexcept;

    // Build phase (not thread-safe).

    /**
     * \brief Adds an unattached node for \p value.
     *
     * Units values take ownership of their inner node, which must be an
     * unattached scalar. Returns \ref kInvalidNodeId on rejection.
     */
    NodeId add_node(const LabelValue& value);

    /// Appends `key = value` to an Object/Group node.
    bool append_entry(NodeId mapping, std::string_view key, NodeId value);
    /**
     * \brief Appends an element to a Sequence/Set node.
     *
     * Sets reject a member deep-equal to an existing one, and a member
     * whose comparison would nest deeper than 64 levels.
     */
    bool append_element(NodeId collection, NodeId value);

    /// True if \p inner is an unattached scalar a Units value may wrap.
    bool can_wrap_units(NodeId inner) const noexcept;

    /// Copies \p text into the arena and returns its span.
    TextSpan store_text(std::string_view text);
    TextSpan store_bytes(std::span<const std::byte> bytes);

    // Read access.

    uint32_t node_count() const noexcept;
    bool is_valid(NodeId id) const noexcept;
    /// Returns the node for \p id. \p id must be valid.
    const LabelNode& node(NodeId id) const noexcept;
    /// Returns the children of \p id, or an empty span for invalid ids.
    std::span<const LabelChild> children(NodeId id) const noexcept;

    std::string_view text(TextSpan span) const noexcept;
    std::span<const std::byte> bytes(TextSpan span) const noexcept;
    std::string_view key(const LabelChild& child) const noexcept;

private:
    bool can_attach(NodeId parent, NodeId value) const noexcept;

    std::string arena_;
    std::vector<LabelNode> nodes_;
};

/**
 * \brief Deep structural equality of two values (possibly in different
 * documents).
 *
 * Mappings compare entries in order, including keys. Sets compare
 * order-insensitively. Reals compare with `==`. Values nested deeper than
 * 64 levels compare unequal.
 */
bool
label_values_equal(const LabelDocument& a_doc, NodeId a,
                   const LabelDocument& b_doc, NodeId b) noexcept;

inline bool
label_values_equal(const LabelDocument& doc, NodeId a, NodeId b) noexcept
{
    return label_values_equal(doc, a, doc, b);
}

}  // namespace openpvl
