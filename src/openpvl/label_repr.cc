#include "openpvl/label_repr.h"

#include "openpvl/label_encode.h"

#include <cstdio>

namespace openpvl {
namespace {

    static constexpr uint32_t kMaxReprHexBytes = 32U;


    static void append_count(const char* name, size_t n, std::string* out)
    {
        char buf[48];
        std::snprintf(buf, sizeof(buf), "%s[%llu]", name,
                      static_cast<unsigned long long>(n));
        out->append(buf);
    }


    static void append_hex(std::span<const std::byte> bytes, std::string* out)
    {
        static constexpr char hex[] = "0123456789ABCDEF";
        const size_t n = (bytes.size() < kMaxReprHexBytes) ? bytes.size()
                                                            : kMaxReprHexBytes;
        for (size_t i = 0; i < n; ++i) {
            const uint8_t v = static_cast<uint8_t>(bytes[i]);
            out->push_back(hex[(v >> 4) & 0x0F]);
            out->push_back(hex[v & 0x0F]);
        }
        if (n < bytes.size()) {
            out->append("...");
        }
    }


    static void append_repr(const LabelDocument& doc, NodeId id,
                            std::string* out)
    {
        if (!doc.is_valid(id)) {
            out->append("<invalid>");
            return;
        }

        const LabelValue& v = doc.node(id).value;
        switch (v.kind) {
        case LabelValueKind::Null: out->append("NULL"); return;
        case LabelValueKind::Boolean:
            out->append(v.data.boolean ? "TRUE" : "FALSE");
            return;
        case LabelValueKind::Integer:
            append_label_integer(v.data.i64, out);
            return;
        case LabelValueKind::Real: append_label_real(v.data.f64, out); return;
        case LabelValueKind::Text:
            out->push_back('"');
            append_repr_escaped(doc.text(v.data.span), out);
            out->push_back('"');
            return;
        case LabelValueKind::Bytes: {
            const std::span<const std::byte> b = doc.bytes(v.data.span);
            append_count("bytes", b.size(), out);
            out->push_back(':');
            append_hex(b, out);
            return;
        }
        case LabelValueKind::Units:
            append_repr(doc, v.data.inner, out);
            out->append(" <");
            append_repr_escaped(doc.text(v.units), out);
            out->push_back('>');
            return;
        case LabelValueKind::Sequence:
        case LabelValueKind::Set:
        case LabelValueKind::Object:
        case LabelValueKind::Group:
            append_count(label_value_kind_name(v.kind), doc.children(id).size(),
                         out);
            return;
        }
        out->append("<unknown>");
    }

}  // namespace

void
append_repr_escaped(std::string_view s, std::string* out) noexcept
{
    if (!out) {
        return;
    }
    out->reserve(out->size() + s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '\\' || c == '"') {
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        }
        if (c == '\n') {
            out->append("\\n");
            continue;
        }
        if (c == '\r') {
            out->append("\\r");
            continue;
        }
        if (c == '\t') {
            out->append("\\t");
            continue;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
}


bool
append_label_value_repr(const LabelDocument& doc, NodeId id,
                        uint32_t max_bytes, std::string* out) noexcept
{
    if (!out) {
        return false;
    }
    std::string repr;
    append_repr(doc, id, &repr);
    if (max_bytes == 0U || repr.size() <= max_bytes) {
        out->append(repr);
        return false;
    }
    out->append(repr.data(), max_bytes);
    out->append("...");
    return true;
}


const char*
label_value_kind_name(LabelValueKind kind) noexcept
{
    switch (kind) {
    case LabelValueKind::Null: return "null";
    case LabelValueKind::Boolean: return "boolean";
    case LabelValueKind::Integer: return "integer";
    case LabelValueKind::Real: return "real";
    case LabelValueKind::Text: return "text";
    case LabelValueKind::Bytes: return "bytes";
    case LabelValueKind::Units: return "units";
    case LabelValueKind::Sequence: return "sequence";
    case LabelValueKind::Set: return "set";
    case LabelValueKind::Object: return "object";
    case LabelValueKind::Group: return "group";
    }
    return "unknown";
}

}  // namespace openpvl
