#pragma once

#include "openpvl/label_dialect.h"
#include "openpvl/label_document.h"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file validate_report.h
 * \brief Per-profile load/encode outcomes and their text report.
 */

namespace openpvl {

/// Label profiles checked by a validation run, in report column order.
enum class LabelProfile : uint8_t {
    Pds3,
    Odl,
    Pvl,
    Isis,
    Omni,
};

inline constexpr uint32_t kLabelProfileCount = 5U;

struct LabelProfileInfo final {
    LabelProfile profile;
    std::string_view name;
    /// Encoder dialect paired with this profile.
    const LabelDialect* dialect = nullptr;
};

/// Returns the five profiles in report order (PDS3, ODL, PVL, ISIS, Omni).
std::span<const LabelProfileInfo>
validation_profiles() noexcept;

const LabelProfileInfo&
profile_info(LabelProfile profile) noexcept;

enum class EncodeOutcome : uint8_t {
    /// Not tried because the text did not load.
    NotAttempted,
    Encoded,
    Failed,
};

struct ProfileOutcome final {
    bool loaded           = false;
    EncodeOutcome encoded = EncodeOutcome::NotAttempted;
};

/// Outcomes of one input across every profile, indexed by \ref LabelProfile.
struct FileReport final {
    std::string path;
    std::array<ProfileOutcome, kLabelProfileCount> outcomes {};
};

/**
 * \brief Decoder seam used by \ref validate_label.
 *
 * Implementations parse \p text under \p profile's grammar into \p doc and
 * return false (with a message in \p error) when the text does not load.
 */
class LabelLoader {
public:
    virtual ~LabelLoader() = default;
    virtual bool load(std::string_view text, LabelProfile profile,
                      LabelDocument* doc, std::string* error)
        = 0;
};

/**
 * \brief Encodes \p doc with \p profile's dialect, discarding the output.
 *
 * Returns true on success. On failure \p error (if non-null) receives
 * `<status> at <key>: <detail>`.
 */
bool
check_profile_encodes(const LabelDocument& doc, LabelProfile profile,
                      std::string* error) noexcept;

/// Loads \p text with \p loader, then encodes it if it loaded.
ProfileOutcome
validate_label(LabelLoader& loader, std::string_view text, LabelProfile profile,
               std::string* error);

/**
 * \brief Formats a report for \p reports into \p out.
 *
 * One report renders the per-profile detail form:
 * `PDS3 | Loads | Encodes`. Several render a table with one row per file
 * and `L`/`No L`, `E`/`No E` cells. Lines are separated by `\n` with no
 * trailing newline.
 */
void
format_validate_report(std::span<const FileReport> reports, std::string* out);

}  // namespace openpvl
