#include "openpvl/validate_report.h"

#include "openpvl/label_encode.h"
#include "openpvl/label_sink.h"

#include <algorithm>
#include <vector>

namespace openpvl {
namespace {

    static constexpr std::string_view kCellSep = " | ";

    static constexpr std::string_view kLoads       = "Loads";
    static constexpr std::string_view kNotLoads    = "does NOT load";
    static constexpr std::string_view kEncodes     = "Encodes";
    static constexpr std::string_view kNotEncodes  = "does NOT encode";
    static constexpr std::string_view kTableLoad   = "L";
    static constexpr std::string_view kTableNoLoad = "No L";
    static constexpr std::string_view kTableEnc    = "E";
    static constexpr std::string_view kTableNoEnc  = "No E";
    static constexpr std::string_view kFileHeader  = "File";


    static void append_padded(std::string_view s, size_t width, bool center,
                              std::string* out)
    {
        const size_t pad   = (s.size() < width) ? (width - s.size()) : 0U;
        const size_t left  = center ? (pad / 2U) : 0U;
        const size_t right = pad - left;
        out->append(left, ' ');
        out->append(s);
        out->append(right, ' ');
    }


    // First cell left-aligned, the rest centered, joined by " | ".
    static void append_row(std::span<const std::string_view> cells,
                           std::span<const size_t> widths, std::string* out)
    {
        for (size_t i = 0; i < cells.size(); ++i) {
            if (i != 0U) {
                out->append(kCellSep);
            }
            append_padded(cells[i], widths[i], i != 0U, out);
        }
    }


    static std::string_view detail_load_text(const ProfileOutcome& o) noexcept
    {
        return o.loaded ? kLoads : kNotLoads;
    }


    static std::string_view detail_encode_text(const ProfileOutcome& o) noexcept
    {
        switch (o.encoded) {
        case EncodeOutcome::NotAttempted: return std::string_view();
        case EncodeOutcome::Encoded: return kEncodes;
        case EncodeOutcome::Failed: return kNotEncodes;
        }
        return std::string_view();
    }


    static std::string_view table_encode_text(const ProfileOutcome& o) noexcept
    {
        switch (o.encoded) {
        case EncodeOutcome::NotAttempted: return std::string_view();
        case EncodeOutcome::Encoded: return kTableEnc;
        case EncodeOutcome::Failed: return kTableNoEnc;
        }
        return std::string_view();
    }


    static void format_single(const FileReport& report, std::string* out)
    {
        const std::span<const LabelProfileInfo> profiles
            = validation_profiles();

        size_t name_w = 0;
        for (size_t i = 0; i < profiles.size(); ++i) {
            name_w = std::max(name_w, profiles[i].name.size());
        }
        const std::array<size_t, 3> widths = {
            name_w,
            std::max(kLoads.size(), kNotLoads.size()),
            std::max(kEncodes.size(), kNotEncodes.size()),
        };

        for (size_t i = 0; i < profiles.size(); ++i) {
            const ProfileOutcome& o = report.outcomes[i];
            const std::array<std::string_view, 3> cells = {
                profiles[i].name,
                detail_load_text(o),
                detail_encode_text(o),
            };
            if (i != 0U) {
                out->push_back('\n');
            }
            append_row(cells, widths, out);
        }
    }


    static void format_table(std::span<const FileReport> reports,
                             std::string* out)
    {
        const std::span<const LabelProfileInfo> profiles
            = validation_profiles();

        const size_t load_w = std::max(kTableLoad.size(), kTableNoLoad.size());
        const size_t enc_w  = std::max(kTableEnc.size(), kTableNoEnc.size());
        const size_t cell_w = load_w + 1U + enc_w;

        size_t file_w = kFileHeader.size();
        for (size_t i = 0; i < reports.size(); ++i) {
            file_w = std::max(file_w, reports[i].path.size());
        }

        std::vector<size_t> widths;
        widths.push_back(file_w);
        widths.insert(widths.end(), profiles.size(), cell_w);

        std::string rule;
        for (size_t i = 0; i < widths.size(); ++i) {
            if (i != 0U) {
                rule.append("-+-");
            }
            rule.append(widths[i], '-');
        }

        std::vector<std::string_view> cells;
        cells.push_back(kFileHeader);
        for (size_t i = 0; i < profiles.size(); ++i) {
            cells.push_back(profiles[i].name);
        }

        out->append(rule);
        out->push_back('\n');
        append_row(cells, widths, out);
        out->push_back('\n');
        out->append(rule);

        std::vector<std::string> pairs(profiles.size());
        for (size_t r = 0; r < reports.size(); ++r) {
            const FileReport& report = reports[r];
            cells.clear();
            cells.push_back(report.path);
            for (size_t i = 0; i < profiles.size(); ++i) {
                const ProfileOutcome& o = report.outcomes[i];
                std::string& pair       = pairs[i];
                pair.clear();
                append_padded(o.loaded ? kTableLoad : kTableNoLoad, load_w,
                              true, &pair);
                pair.push_back(' ');
                append_padded(table_encode_text(o), enc_w, true, &pair);
                cells.push_back(pair);
            }
            out->push_back('\n');
            append_row(cells, widths, out);
        }
    }

}  // namespace

std::span<const LabelProfileInfo>
validation_profiles() noexcept
{
    static const std::array<LabelProfileInfo, kLabelProfileCount> kProfiles = {
        LabelProfileInfo { LabelProfile::Pds3, "PDS3", &pds3_dialect() },
        LabelProfileInfo { LabelProfile::Odl, "ODL", &default_dialect() },
        LabelProfileInfo { LabelProfile::Pvl, "PVL", &default_dialect() },
        LabelProfileInfo { LabelProfile::Isis, "ISIS", &cube_dialect() },
        LabelProfileInfo { LabelProfile::Omni, "Omni", &default_dialect() },
    };
    return std::span<const LabelProfileInfo>(kProfiles.data(),
                                             kProfiles.size());
}


const LabelProfileInfo&
profile_info(LabelProfile profile) noexcept
{
    return validation_profiles()[static_cast<size_t>(profile)];
}


bool
check_profile_encodes(const LabelDocument& doc, LabelProfile profile,
                      std::string* error) noexcept
{
    CountingLabelSink sink;
    const LabelEncodeResult r = encode_label(doc, doc.root(),
                                             *profile_info(profile).dialect,
                                             sink, LabelEncodeOptions {});
    if (r.status == LabelEncodeStatus::Ok) {
        return true;
    }
    if (error) {
        error->assign(label_encode_status_name(r.status));
        if (!r.failed_key.empty()) {
            error->append(" at ");
            error->append(r.failed_key);
        }
        error->append(": ");
        error->append(r.detail);
    }
    return false;
}


ProfileOutcome
validate_label(LabelLoader& loader, std::string_view text, LabelProfile profile,
               std::string* error)
{
    ProfileOutcome outcome;
    LabelDocument doc;
    std::string message;
    if (!loader.load(text, profile, &doc, &message)) {
        if (error) {
            *error = message;
        }
        return outcome;
    }
    outcome.loaded  = true;
    outcome.encoded = check_profile_encodes(doc, profile, error)
                          ? EncodeOutcome::Encoded
                          : EncodeOutcome::Failed;
    return outcome;
}


void
format_validate_report(std::span<const FileReport> reports, std::string* out)
{
    if (!out || reports.empty()) {
        return;
    }
    if (reports.size() == 1U) {
        format_single(reports[0], out);
        return;
    }
    format_table(reports, out);
}

}  // namespace openpvl
