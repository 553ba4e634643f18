#include "openpvl/label_document.h"

namespace openpvl {
namespace {

    // Values nested deeper than this are never compared.
    static constexpr uint32_t kMaxCompareDepth = 64;

    enum class CompareResult : uint8_t {
        Equal,
        Different,
        TooDeep,
    };

    static CompareResult compare_values(const LabelDocument& a_doc, NodeId a,
                                        const LabelDocument& b_doc, NodeId b,
                                        uint32_t depth) noexcept;


    static CompareResult compare_in_order(const LabelDocument& a_doc,
                                          std::span<const LabelChild> a,
                                          const LabelDocument& b_doc,
                                          std::span<const LabelChild> b,
                                          bool compare_keys,
                                          uint32_t depth) noexcept
    {
        if (a.size() != b.size()) {
            return CompareResult::Different;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (compare_keys && a_doc.key(a[i]) != b_doc.key(b[i])) {
                return CompareResult::Different;
            }
            const CompareResult r = compare_values(a_doc, a[i].value, b_doc,
                                                   b[i].value, depth);
            if (r != CompareResult::Equal) {
                return r;
            }
        }
        return CompareResult::Equal;
    }


    static CompareResult compare_any_order(const LabelDocument& a_doc,
                                           std::span<const LabelChild> a,
                                           const LabelDocument& b_doc,
                                           std::span<const LabelChild> b,
                                           uint32_t depth) noexcept
    {
        if (a.size() != b.size()) {
            return CompareResult::Different;
        }
        // Set members are distinct, so containment plus equal size suffices.
        for (size_t i = 0; i < a.size(); ++i) {
            bool found = false;
            for (size_t j = 0; j < b.size() && !found; ++j) {
                const CompareResult r = compare_values(a_doc, a[i].value,
                                                       b_doc, b[j].value,
                                                       depth);
                if (r == CompareResult::TooDeep) {
                    return r;
                }
                found = (r == CompareResult::Equal);
            }
            if (!found) {
                return CompareResult::Different;
            }
        }
        return CompareResult::Equal;
    }


    static CompareResult compare_values(const LabelDocument& a_doc, NodeId a,
                                        const LabelDocument& b_doc, NodeId b,
                                        uint32_t depth) noexcept
    {
        if (!a_doc.is_valid(a) || !b_doc.is_valid(b)) {
            return CompareResult::Different;
        }
        if (depth > kMaxCompareDepth) {
            return CompareResult::TooDeep;
        }
        const LabelValue& va = a_doc.node(a).value;
        const LabelValue& vb = b_doc.node(b).value;
        if (va.kind != vb.kind) {
            return CompareResult::Different;
        }

        bool same = false;
        switch (va.kind) {
        case LabelValueKind::Null: same = true; break;
        case LabelValueKind::Boolean:
            same = va.data.boolean == vb.data.boolean;
            break;
        case LabelValueKind::Integer: same = va.data.i64 == vb.data.i64; break;
        case LabelValueKind::Real: same = va.data.f64 == vb.data.f64; break;
        case LabelValueKind::Text:
        case LabelValueKind::Bytes:
            same = a_doc.text(va.data.span) == b_doc.text(vb.data.span);
            break;
        case LabelValueKind::Units:
            if (a_doc.text(va.units) != b_doc.text(vb.units)) {
                return CompareResult::Different;
            }
            return compare_values(a_doc, va.data.inner, b_doc, vb.data.inner,
                                  depth + 1U);
        case LabelValueKind::Sequence:
            return compare_in_order(a_doc, a_doc.children(a), b_doc,
                                    b_doc.children(b), false, depth + 1U);
        case LabelValueKind::Set:
            return compare_any_order(a_doc, a_doc.children(a), b_doc,
                                     b_doc.children(b), depth + 1U);
        case LabelValueKind::Object:
        case LabelValueKind::Group:
            return compare_in_order(a_doc, a_doc.children(a), b_doc,
                                    b_doc.children(b), true, depth + 1U);
        }
        return same ? CompareResult::Equal : CompareResult::Different;
    }

}  // namespace


LabelDocument::LabelDocument()
{
    LabelNode root;
    root.value = make_object();
    nodes_.push_back(root);
}


NodeId
LabelDocument::root() const noexcept
{
    return 0U;
}


TextSpan
LabelDocument::store_text(std::string_view text)
{
    const uint32_t offset = static_cast<uint32_t>(arena_.size());
    arena_.append(text.data(), text.size());
    return TextSpan { offset, static_cast<uint32_t>(text.size()) };
}


TextSpan
LabelDocument::store_bytes(std::span<const std::byte> bytes)
{
    return store_text(
        std::string_view(reinterpret_cast<const char*>(bytes.data()),
                         bytes.size()));
}


NodeId
LabelDocument::add_node(const LabelValue& value)
{
    const NodeId id = static_cast<NodeId>(nodes_.size());
    if (value.kind == LabelValueKind::Units
        && !can_wrap_units(value.data.inner)) {
        return kInvalidNodeId;
    }

    LabelNode n;
    n.value = value;
    nodes_.push_back(n);
    if (value.kind == LabelValueKind::Units) {
        nodes_[value.data.inner].parent = id;
    }
    return id;
}


bool
LabelDocument::can_wrap_units(NodeId inner) const noexcept
{
    if (!is_valid(inner) || inner == root()) {
        return false;
    }
    const LabelNode& n = nodes_[inner];
    return is_scalar_kind(n.value.kind) && n.parent == kInvalidNodeId;
}


bool
LabelDocument::can_attach(NodeId parent, NodeId value) const noexcept
{
    if (!is_valid(parent) || !is_valid(value)) {
        return false;
    }
    if (value == root() || value == parent) {
        return false;
    }
    if (nodes_[value].parent != kInvalidNodeId) {
        return false;
    }
    // `value` is the top of its own subtree; reject if `parent` lives in it.
    NodeId cur = nodes_[parent].parent;
    while (cur != kInvalidNodeId) {
        if (cur == value) {
            return false;
        }
        cur = nodes_[cur].parent;
    }
    return true;
}


bool
LabelDocument::append_entry(NodeId mapping, std::string_view key, NodeId value)
{
    if (!can_attach(mapping, value)) {
        return false;
    }
    if (!is_mapping_kind(nodes_[mapping].value.kind)) {
        return false;
    }

    LabelChild child;
    child.key   = store_text(key);
    child.value = value;
    nodes_[mapping].children.push_back(child);
    nodes_[value].parent = mapping;
    return true;
}


bool
LabelDocument::append_element(NodeId collection, NodeId value)
{
    if (!can_attach(collection, value)) {
        return false;
    }
    const LabelNode& c = nodes_[collection];
    if (!is_collection_kind(c.value.kind)) {
        return false;
    }
    if (c.value.kind == LabelValueKind::Set) {
        for (size_t i = 0; i < c.children.size(); ++i) {
            if (compare_values(*this, c.children[i].value, *this, value, 0U)
                != CompareResult::Different) {
                return false;
            }
        }
    }

    LabelChild child;
    child.value = value;
    nodes_[collection].children.push_back(child);
    nodes_[value].parent = collection;
    return true;
}


uint32_t
LabelDocument::node_count() const noexcept
{
    return static_cast<uint32_t>(nodes_.size());
}


bool
LabelDocument::is_valid(NodeId id) const noexcept
{
    return id < nodes_.size();
}


const LabelNode&
LabelDocument::node(NodeId id) const noexcept
{
    return nodes_[id];
}


std::span<const LabelChild>
LabelDocument::children(NodeId id) const noexcept
{
    if (!is_valid(id)) {
        return std::span<const LabelChild>();
    }
    const std::vector<LabelChild>& c = nodes_[id].children;
    return std::span<const LabelChild>(c.data(), c.size());
}


std::string_view
LabelDocument::text(TextSpan span) const noexcept
{
    if (span.offset > arena_.size()) {
        return std::string_view();
    }
    const size_t end = static_cast<size_t>(span.offset) + span.size;
    if (end > arena_.size()) {
        return std::string_view();
    }
    return std::string_view(arena_.data() + span.offset, span.size);
}


std::span<const std::byte>
LabelDocument::bytes(TextSpan span) const noexcept
{
    const std::string_view s = text(span);
    return std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(s.data()), s.size());
}


std::string_view
LabelDocument::key(const LabelChild& child) const noexcept
{
    return text(child.key);
}


bool
label_values_equal(const LabelDocument& a_doc, NodeId a,
                   const LabelDocument& b_doc, NodeId b) noexcept
{
    return compare_values(a_doc, a, b_doc, b, 0U) == CompareResult::Equal;
}

}  // namespace openpvl
