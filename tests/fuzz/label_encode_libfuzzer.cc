#include "openpvl/label_dialect.h"
#include "openpvl/label_document.h"
#include "openpvl/label_encode.h"
#include "openpvl/label_sink.h"
#include "openpvl/label_value.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace openpvl {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static uint16_t
read_u16(std::span<const uint8_t> bytes, size_t offset) noexcept
{
    if (offset + 2U > bytes.size()) {
        return 0;
    }
    uint16_t v = 0;
    v |= static_cast<uint16_t>(bytes[offset + 0U]) << 0U;
    v |= static_cast<uint16_t>(bytes[offset + 1U]) << 8U;
    return v;
}


static std::string_view
take_text(std::span<const uint8_t> bytes, size_t* cursor, size_t len) noexcept
{
    const size_t avail = (*cursor < bytes.size()) ? bytes.size() - *cursor
                                                  : 0U;
    const size_t n     = (len < avail) ? len : avail;
    const std::string_view s(reinterpret_cast<const char*>(bytes.data())
                                 + *cursor,
                             n);
    *cursor += n;
    return s;
}


// Each op is `kind, target lo, target hi, len` followed by `len` payload
// bytes. Nodes land in a random container so every kind reaches every
// position, including the ones the encoder rejects.
static void
build_document(std::span<const uint8_t> bytes, LabelDocument* doc)
{
    std::vector<NodeId> containers;
    containers.push_back(doc->root());

    size_t cursor = 0;
    while (cursor + 4U <= bytes.size() && doc->node_count() < 512U) {
        const uint8_t kind    = bytes[cursor + 0U] % 12U;
        const uint16_t target = read_u16(bytes, cursor + 1U);
        const size_t len      = bytes[cursor + 3U] % 24U;
        cursor += 4U;
        const std::string_view payload = take_text(bytes, &cursor, len);

        LabelValue v;
        switch (kind) {
        case 0: v = make_null(); break;
        case 1: v = make_bool(!payload.empty()); break;
        case 2: v = make_integer(static_cast<int64_t>(target) - 32768); break;
        case 3: v = make_real(static_cast<double>(target) / 7.0); break;
        case 4: v = make_text(*doc, payload); break;
        case 5:
            v = make_bytes(*doc, std::span<const std::byte>(
                                     reinterpret_cast<const std::byte*>(
                                         payload.data()),
                                     payload.size()));
            break;
        case 6: {
            const NodeId inner = doc->add_node(make_integer(target));
            v                  = make_units(*doc, inner, payload);
            break;
        }
        case 7: v = make_sequence(); break;
        case 8: v = make_set(); break;
        case 9: v = make_object(); break;
        default: v = make_group(); break;
        }

        const NodeId id = doc->add_node(v);
        if (id == kInvalidNodeId) {
            continue;
        }
        const NodeId parent = containers[target % containers.size()];
        const bool attached
            = is_mapping_kind(doc->node(parent).value.kind)
                  ? doc->append_entry(parent, payload, id)
                  : doc->append_element(parent, id);
        if (attached
            && (is_mapping_kind(v.kind) || is_collection_kind(v.kind))) {
            containers.push_back(id);
        }
    }
}


static void
check_dialect(const LabelDocument& doc, const LabelDialect& dialect,
              uint32_t max_depth)
{
    LabelEncodeOptions options;
    options.limits.max_depth = max_depth;

    std::string streamed;
    StringLabelSink sink(&streamed);
    const LabelEncodeResult r = encode_label(doc, doc.root(), dialect, sink,
                                             options);
    if (r.written != streamed.size()) {
        fuzz_trap();
    }

    std::string dumped = "x";
    const LabelEncodeResult d = dump_label(doc, dialect, options, &dumped);
    if (d.status != r.status || d.written != r.written) {
        fuzz_trap();
    }
    if (r.status == LabelEncodeStatus::Ok) {
        if (dumped.size() != streamed.size() + 1U
            || std::string_view(dumped).substr(1) != streamed) {
            fuzz_trap();
        }
        if (!streamed.ends_with(dialect.terminal)) {
            fuzz_trap();
        }
    } else if (dumped != "x") {
        fuzz_trap();
    }
}

}  // namespace openpvl

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace openpvl;
    const std::span<const uint8_t> bytes(data, size);
    if (bytes.empty()) {
        return 0;
    }

    LabelDocument doc;
    build_document(bytes.subspan(1), &doc);

    const uint32_t max_depth = bytes[0] % 8U;
    const std::span<const LabelDialect* const> dialects = builtin_dialects();
    for (size_t i = 0; i < dialects.size(); ++i) {
        check_dialect(doc, *dialects[i], max_depth);
    }
    return 0;
}
