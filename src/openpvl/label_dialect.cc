#include "openpvl/label_dialect.h"

#include <array>

namespace openpvl {
namespace {

    static constexpr LabelDialect kDefaultDialect = {
        /*name=*/"Default",
        /*begin_group=*/"BEGIN_GROUP",
        /*end_group=*/"END_GROUP",
        /*begin_object=*/"BEGIN_OBJECT",
        /*end_object=*/"END_OBJECT",
        /*terminal=*/"END",
        /*end_line_style=*/EndLineStyle::RepeatName,
        /*align_assignments=*/false,
    };

    static constexpr LabelDialect kCubeDialect = {
        /*name=*/"Cube",
        /*begin_group=*/"Group",
        /*end_group=*/"End_Group",
        /*begin_object=*/"Object",
        /*end_object=*/"End_Object",
        /*terminal=*/"End",
        /*end_line_style=*/EndLineStyle::Bare,
        /*align_assignments=*/false,
    };

    static constexpr LabelDialect kPds3Dialect = {
        /*name=*/"PDS3",
        /*begin_group=*/"GROUP",
        /*end_group=*/"END",
        /*begin_object=*/"OBJECT",
        /*end_object=*/"END",
        /*terminal=*/"END",
        /*end_line_style=*/EndLineStyle::RepeatName,
        /*align_assignments=*/true,
    };

    static constexpr std::array<const LabelDialect*, 3> kBuiltinDialects = {
        &kDefaultDialect,
        &kCubeDialect,
        &kPds3Dialect,
    };


    static bool ascii_iequals(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            char ca = a[i];
            char cb = b[i];
            if (ca >= 'A' && ca <= 'Z') {
                ca = static_cast<char>(ca - 'A' + 'a');
            }
            if (cb >= 'A' && cb <= 'Z') {
                cb = static_cast<char>(cb - 'A' + 'a');
            }
            if (ca != cb) {
                return false;
            }
        }
        return true;
    }

}  // namespace

const LabelDialect&
default_dialect() noexcept
{
    return kDefaultDialect;
}


const LabelDialect&
cube_dialect() noexcept
{
    return kCubeDialect;
}


const LabelDialect&
pds3_dialect() noexcept
{
    return kPds3Dialect;
}


std::span<const LabelDialect* const>
builtin_dialects() noexcept
{
    return std::span<const LabelDialect* const>(kBuiltinDialects.data(),
                                                kBuiltinDialects.size());
}


const LabelDialect*
find_dialect(std::string_view name) noexcept
{
    if (ascii_iequals(name, "default") || ascii_iequals(name, "pvl")) {
        return &kDefaultDialect;
    }
    if (ascii_iequals(name, "cube") || ascii_iequals(name, "isis")) {
        return &kCubeDialect;
    }
    if (ascii_iequals(name, "pds3") || ascii_iequals(name, "pds")) {
        return &kPds3Dialect;
    }
    return nullptr;
}

}  // namespace openpvl
