#include "openpvl/label_encode.h"

#include "openpvl/label_repr.h"

#include <charconv>
#include <cmath>
#include <string_view>
#include <system_error>

namespace openpvl {
namespace {

    static constexpr std::string_view kNull  = "NULL";
    static constexpr std::string_view kTrue  = "TRUE";
    static constexpr std::string_view kFalse = "FALSE";

    static constexpr std::string_view kSequenceOpen  = "(";
    static constexpr std::string_view kSequenceClose = ")";
    static constexpr std::string_view kSetOpen       = "{";
    static constexpr std::string_view kSetClose      = "}";
    static constexpr std::string_view kElementSep    = ", ";
    static constexpr std::string_view kUnitsOpen     = " <";
    static constexpr std::string_view kUnitsClose    = ">";


    struct ValueContext final {
        const LabelDocument* doc  = nullptr;
        const LabelQuoter* quoter = nullptr;
        uint32_t max_depth        = 0;
        uint32_t max_repr_bytes   = 0;
        LabelEncodeResult* result = nullptr;
    };

    // Per-call state. The column is computed once per call and lives here,
    // never on the dialect.
    struct BlockContext final {
        ValueContext value;
        const LabelDialect* dialect = nullptr;
        LabelSink* sink             = nullptr;
        uint32_t assignment_col     = 0;
        uint32_t indent_width       = 0;
        std::string line;
    };


    static bool fail_value(const ValueContext& c, NodeId id,
                           LabelEncodeStatus status)
    {
        LabelEncodeResult* r = c.result;
        r->status            = status;
        r->failed_node       = id;
        r->detail.clear();
        (void)append_label_value_repr(*c.doc, id, c.max_repr_bytes,
                                      &r->detail);
        return false;
    }


    static bool depth_exceeded(uint32_t max_depth, uint32_t depth) noexcept
    {
        return max_depth != 0U && depth > max_depth;
    }


    static bool append_value(const ValueContext& c, NodeId id, uint32_t depth,
                             std::string* out);


    static bool append_elements(const ValueContext& c, NodeId id,
                                uint32_t depth, std::string_view open,
                                std::string_view close, std::string* out)
    {
        if (depth_exceeded(c.max_depth, depth)) {
            return fail_value(c, id, LabelEncodeStatus::LimitExceeded);
        }
        const std::span<const LabelChild> elements = c.doc->children(id);
        out->append(open);
        for (size_t i = 0; i < elements.size(); ++i) {
            if (i != 0U) {
                out->append(kElementSep);
            }
            if (!append_value(c, elements[i].value, depth + 1U, out)) {
                return false;
            }
        }
        out->append(close);
        return true;
    }


    static bool append_text(const ValueContext& c, NodeId id,
                            std::string_view text, std::string* out)
    {
        if (!c.quoter->needs_quotes(text)) {
            out->append(text);
            return true;
        }
        if (c.quoter->quote(text, out) != QuoteStatus::Ok) {
            return fail_value(c, id, LabelEncodeStatus::EncodingRejected);
        }
        return true;
    }


    static bool append_value(const ValueContext& c, NodeId id, uint32_t depth,
                             std::string* out)
    {
        const LabelDocument& doc = *c.doc;
        if (!doc.is_valid(id)) {
            return fail_value(c, id, LabelEncodeStatus::Malformed);
        }

        const LabelValue& v = doc.node(id).value;
        switch (v.kind) {
        case LabelValueKind::Units: {
            const NodeId inner = v.data.inner;
            if (!doc.is_valid(inner)
                || !is_scalar_kind(doc.node(inner).value.kind)) {
                return fail_value(c, id, LabelEncodeStatus::UnsupportedValue);
            }
            if (!append_value(c, inner, depth, out)) {
                return false;
            }
            out->append(kUnitsOpen);
            out->append(doc.text(v.units));
            out->append(kUnitsClose);
            return true;
        }
        case LabelValueKind::Text:
            return append_text(c, id, doc.text(v.data.span), out);
        case LabelValueKind::Boolean:
            out->append(v.data.boolean ? kTrue : kFalse);
            return true;
        case LabelValueKind::Integer:
            append_label_integer(v.data.i64, out);
            return true;
        case LabelValueKind::Real:
            append_label_real(v.data.f64, out);
            return true;
        case LabelValueKind::Null: out->append(kNull); return true;
        case LabelValueKind::Sequence:
            return append_elements(c, id, depth, kSequenceOpen, kSequenceClose,
                                   out);
        case LabelValueKind::Set:
            return append_elements(c, id, depth, kSetOpen, kSetClose, out);
        case LabelValueKind::Bytes:
        case LabelValueKind::Object:
        case LabelValueKind::Group: break;
        }
        return fail_value(c, id, LabelEncodeStatus::UnsupportedValue);
    }


    static void emit(BlockContext* c, std::string_view bytes)
    {
        if (bytes.empty()) {
            return;
        }
        c->sink->write(bytes);
        c->value.result->written += static_cast<uint64_t>(bytes.size());
    }


    static void append_indent(const LabelDialect& dialect, uint32_t level,
                              std::string* out)
    {
        for (uint32_t i = 0; i < level; ++i) {
            out->append(dialect.indent);
        }
    }


    static void write_assignment(BlockContext* c, uint32_t level,
                                 std::string_view key, std::string_view value)
    {
        const LabelDialect& d = *c->dialect;
        std::string& line     = c->line;
        line.clear();
        append_indent(d, level, &line);
        line.append(key);
        if (d.align_assignments) {
            uint32_t width = level * c->indent_width + utf8_width(key);
            while (width < c->assignment_col) {
                line.push_back(' ');
                width += 1U;
            }
        }
        line.append(d.assignment);
        line.append(value);
        line.append(d.newline);
        emit(c, line);
    }


    static void write_block_end(BlockContext* c, uint32_t level,
                                std::string_view token, std::string_view name)
    {
        const LabelDialect& d = *c->dialect;
        if (d.end_line_style == EndLineStyle::RepeatName) {
            write_assignment(c, level, token, name);
            return;
        }
        std::string& line = c->line;
        line.clear();
        append_indent(d, level, &line);
        line.append(token);
        line.append(d.newline);
        emit(c, line);
    }


    static bool fail_key(BlockContext* c, NodeId id, std::string_view key,
                         LabelEncodeStatus status)
    {
        LabelEncodeResult* r = c->value.result;
        r->status            = status;
        r->failed_node       = id;
        r->failed_key.clear();
        append_repr_escaped(key, &r->failed_key);
        r->detail = r->failed_key;
        return false;
    }


    static bool encode_block(BlockContext* c, NodeId mapping, uint32_t level)
    {
        const LabelDocument& doc  = *c->value.doc;
        const LabelDialect& d     = *c->dialect;
        LabelEncodeResult* result = c->value.result;

        const std::span<const LabelChild> entries = doc.children(mapping);
        for (size_t i = 0; i < entries.size(); ++i) {
            const LabelChild& entry    = entries[i];
            const std::string_view key = doc.key(entry);
            if (!is_valid_utf8(key)) {
                return fail_key(c, entry.value, key,
                                LabelEncodeStatus::EncodingRejected);
            }
            if (!doc.is_valid(entry.value)) {
                return fail_key(c, entry.value, key,
                                LabelEncodeStatus::Malformed);
            }

            const LabelValueKind kind = doc.node(entry.value).value.kind;
            if (is_mapping_kind(kind)) {
                const bool group = (kind == LabelValueKind::Group);
                if (depth_exceeded(c->value.max_depth, level + 1U)) {
                    return fail_key(c, entry.value, key,
                                    LabelEncodeStatus::LimitExceeded);
                }
                write_assignment(c, level, group ? d.begin_group
                                                 : d.begin_object,
                                 key);
                if (!encode_block(c, entry.value, level + 1U)) {
                    return false;
                }
                write_block_end(c, level, group ? d.end_group : d.end_object,
                                key);
                continue;
            }

            std::string value_text;
            if (!append_value(c->value, entry.value, level, &value_text)) {
                result->failed_key.clear();
                append_repr_escaped(key, &result->failed_key);
                return false;
            }
            write_assignment(c, level, key, value_text);
            result->statements += 1U;
        }
        return true;
    }


    static uint32_t column_of_block(const LabelDocument& doc, NodeId mapping,
                                    uint32_t level, uint32_t indent_width,
                                    uint32_t max_depth)
    {
        uint32_t col = 0;
        const std::span<const LabelChild> entries = doc.children(mapping);
        for (size_t i = 0; i < entries.size(); ++i) {
            const uint32_t len = level * indent_width
                                 + utf8_width(doc.key(entries[i]));
            if (len > col) {
                col = len;
            }
            const NodeId value = entries[i].value;
            if (!doc.is_valid(value)
                || !is_mapping_kind(doc.node(value).value.kind)
                || depth_exceeded(max_depth, level + 1U)) {
                continue;
            }
            const uint32_t nested = column_of_block(doc, value, level + 1U,
                                                    indent_width, max_depth);
            if (nested > col) {
                col = nested;
            }
        }
        return col;
    }


    // Decimal exponent of a `to_chars` scientific string (`1.5e+07` -> 7).
    static int scientific_exponent(std::string_view s) noexcept
    {
        const size_t e = s.find('e');
        if (e == std::string_view::npos) {
            return 0;
        }
        const char* first = s.data() + e + 1U;
        const char* last  = s.data() + s.size();
        if (first < last && *first == '+') {
            ++first;
        }
        int exponent                   = 0;
        const std::from_chars_result r = std::from_chars(first, last,
                                                         exponent);
        return r.ec == std::errc() ? exponent : 0;
    }


    static ValueContext make_value_context(const LabelDocument& doc,
                                           const LabelEncodeOptions& options,
                                           LabelEncodeResult* result) noexcept
    {
        ValueContext c;
        c.doc            = &doc;
        c.quoter         = options.quoter ? options.quoter : &default_quoter();
        c.max_depth      = options.limits.max_depth;
        c.max_repr_bytes = options.max_repr_bytes;
        c.result         = result;
        return c;
    }

}  // namespace

uint32_t
compute_assignment_column(const LabelDocument& doc, NodeId root,
                          const LabelDialect& dialect,
                          uint32_t max_depth) noexcept
{
    if (!doc.is_valid(root)) {
        return 0U;
    }
    return column_of_block(doc, root, 0U, utf8_width(dialect.indent),
                           max_depth);
}


LabelEncodeResult
encode_label(const LabelDocument& doc, NodeId root, const LabelDialect& dialect,
             LabelSink& sink, const LabelEncodeOptions& options) noexcept
{
    LabelEncodeResult result;
    if (!doc.is_valid(root) || !is_mapping_kind(doc.node(root).value.kind)) {
        result.status      = LabelEncodeStatus::Malformed;
        result.failed_node = root;
        (void)append_label_value_repr(doc, root, options.max_repr_bytes,
                                      &result.detail);
        return result;
    }

    BlockContext c;
    c.value        = make_value_context(doc, options, &result);
    c.dialect      = &dialect;
    c.sink         = &sink;
    c.indent_width = utf8_width(dialect.indent);
    if (dialect.align_assignments) {
        c.assignment_col = compute_assignment_column(
            doc, root, dialect, options.limits.max_depth);
    }

    if (!encode_block(&c, root, 0U)) {
        return result;
    }
    emit(&c, dialect.terminal);
    return result;
}


LabelEncodeResult
encode_label(const LabelDocument& doc, const LabelDialect& dialect,
             LabelSink& sink) noexcept
{
    return encode_label(doc, doc.root(), dialect, sink, LabelEncodeOptions {});
}


LabelEncodeResult
dump_label(const LabelDocument& doc, const LabelDialect& dialect,
           const LabelEncodeOptions& options, std::string* out) noexcept
{
    std::string buffer;
    StringLabelSink sink(&buffer);
    LabelEncodeResult result = encode_label(doc, doc.root(), dialect, sink,
                                            options);
    if (result.status == LabelEncodeStatus::Ok && out) {
        out->append(buffer);
    }
    return result;
}


LabelEncodeResult
encode_label_value(const LabelDocument& doc, NodeId id,
                   const LabelEncodeOptions& options,
                   std::string* out) noexcept
{
    LabelEncodeResult result;
    if (!out) {
        result.status = LabelEncodeStatus::Malformed;
        return result;
    }
    const ValueContext c = make_value_context(doc, options, &result);
    const size_t before  = out->size();
    if (append_value(c, id, 0U, out)) {
        result.written = static_cast<uint64_t>(out->size() - before);
    }
    return result;
}


void
append_label_integer(int64_t value, std::string* out) noexcept
{
    if (!out) {
        return;
    }
    char buf[32];
    const std::to_chars_result r = std::to_chars(buf, buf + sizeof(buf),
                                                 value);
    out->append(buf, static_cast<size_t>(r.ptr - buf));
}


void
append_label_real(double value, std::string* out) noexcept
{
    if (!out) {
        return;
    }
    char buf[64];
    std::to_chars_result r = std::to_chars(buf, buf + sizeof(buf), value,
                                           std::chars_format::scientific);
    if (r.ec != std::errc()) {
        out->append("nan");
        return;
    }
    std::string_view s(buf, static_cast<size_t>(r.ptr - buf));
    if (!std::isfinite(value)) {
        out->append(s);
        return;
    }
    const int exponent = scientific_exponent(s);
    if (exponent < -4 || exponent >= 16) {
        out->append(s);
        return;
    }

    r = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (r.ec != std::errc()) {
        out->append("nan");
        return;
    }
    s = std::string_view(buf, static_cast<size_t>(r.ptr - buf));
    out->append(s);
    if (s.find('.') == std::string_view::npos) {
        out->append(".0");
    }
}


const char*
label_encode_status_name(LabelEncodeStatus status) noexcept
{
    switch (status) {
    case LabelEncodeStatus::Ok: return "ok";
    case LabelEncodeStatus::UnsupportedValue: return "unsupported_value";
    case LabelEncodeStatus::EncodingRejected: return "encoding_rejected";
    case LabelEncodeStatus::LimitExceeded: return "limit_exceeded";
    case LabelEncodeStatus::Malformed: return "malformed";
    }
    return "unknown";
}

}  // namespace openpvl
