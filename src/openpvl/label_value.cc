#include "openpvl/label_value.h"

#include "openpvl/label_document.h"

namespace openpvl {

LabelValue
make_null() noexcept
{
    LabelValue v;
    v.kind = LabelValueKind::Null;
    return v;
}


LabelValue
make_bool(bool value) noexcept
{
    LabelValue v;
    v.kind         = LabelValueKind::Boolean;
    v.data.boolean = value;
    return v;
}


LabelValue
make_integer(int64_t value) noexcept
{
    LabelValue v;
    v.kind     = LabelValueKind::Integer;
    v.data.i64 = value;
    return v;
}


LabelValue
make_real(double value) noexcept
{
    LabelValue v;
    v.kind     = LabelValueKind::Real;
    v.data.f64 = value;
    return v;
}


LabelValue
make_text(LabelDocument& doc, std::string_view text)
{
    LabelValue v;
    v.kind      = LabelValueKind::Text;
    v.data.span = doc.store_text(text);
    return v;
}


LabelValue
make_bytes(LabelDocument& doc, std::span<const std::byte> bytes)
{
    LabelValue v;
    v.kind      = LabelValueKind::Bytes;
    v.data.span = doc.store_bytes(bytes);
    return v;
}


LabelValue
make_units(LabelDocument& doc, NodeId inner, std::string_view unit)
{
    LabelValue v;
    v.kind       = LabelValueKind::Units;
    v.data.inner = inner;
    v.units      = doc.store_text(unit);
    return v;
}


LabelValue
make_sequence() noexcept
{
    LabelValue v;
    v.kind = LabelValueKind::Sequence;
    return v;
}


LabelValue
make_set() noexcept
{
    LabelValue v;
    v.kind = LabelValueKind::Set;
    return v;
}


LabelValue
make_object() noexcept
{
    LabelValue v;
    v.kind = LabelValueKind::Object;
    return v;
}


LabelValue
make_group() noexcept
{
    LabelValue v;
    v.kind = LabelValueKind::Group;
    return v;
}

}  // namespace openpvl
