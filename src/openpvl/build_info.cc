#include "openpvl/build_info.h"

#include "openpvl/build_info_generated.h"
#include "openpvl/label_dialect.h"

namespace openpvl {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/OPENPVL_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/OPENPVL_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/OPENPVL_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/OPENPVL_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/OPENPVL_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/OPENPVL_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/OPENPVL_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/OPENPVL_BUILDINFO_CXX_COMPILER_VERSION,
#if defined(OPENPVL_BUILD_LINKAGE_SHARED) && OPENPVL_BUILD_LINKAGE_SHARED
        /*linkage_static=*/false,
        /*linkage_shared=*/true,
#else
        /*linkage_static=*/true,
        /*linkage_shared=*/false,
#endif
    };


    static const char* linkage_string(const BuildInfo& bi) noexcept
    {
        if (bi.linkage_static) {
            return "static";
        }
        if (bi.linkage_shared) {
            return "shared";
        }
        return "unknown";
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->reserve(96);
        line1->append("OpenPVL v");
        line1->append(bi.version);
        line1->append(" ");
        line1->append(bi.build_type);
        line1->append(" [");
        const std::span<const LabelDialect* const> dialects
            = builtin_dialects();
        for (size_t i = 0; i < dialects.size(); ++i) {
            if (i != 0U) {
                line1->append(",");
            }
            line1->append(dialects[i]->name);
        }
        line1->append("] ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->clear();
        line2->reserve(128);
        line2->append("built with ");
        line2->append(bi.cxx_compiler_id);
        line2->append("-");
        line2->append(bi.cxx_compiler_version);
        line2->append(" for ");
        line2->append(bi.system_name);
        line2->append("/");
        line2->append(bi.system_processor);
        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace openpvl
