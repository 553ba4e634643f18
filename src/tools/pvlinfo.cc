#include "openpvl/build_info.h"
#include "openpvl/label_dialect.h"
#include "openpvl/label_document.h"
#include "openpvl/label_encode.h"
#include "openpvl/label_sink.h"
#include "openpvl/validate_report.h"

#include <array>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>

namespace openpvl {
namespace {

    static bool parse_u32_arg(const char* s, uint32_t* out) noexcept
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end                  = nullptr;
        const unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0' || v > 0xffffffffULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options]\n", argv0);
        std::printf("options:\n");
        std::printf("  --version            print build info and exit\n");
        std::printf("  --no-build-info      hide build info header\n");
        std::printf("  --dialect NAME       default|pvl, cube|isis, pds3|pds "
                    "(default: pds3)\n");
        std::printf("  --sample             print the sample label in the "
                    "selected dialect\n");
        std::printf("  --report             print the encode report of the "
                    "sample for every profile\n");
        std::printf("  --bad-value          add a raw bytes entry the "
                    "encoder cannot write\n");
        std::printf("  --max-depth N        refuse nesting deeper than N "
                    "(default: %u, 0=unlimited)\n",
                    static_cast<unsigned>(kDefaultLabelMaxDepth));
        std::printf("  -v                   report encode errors on "
                    "stderr\n");
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n", line1.c_str());
        std::printf("%s\n", line2.c_str());
    }


    static const char* end_line_style_name(EndLineStyle style) noexcept
    {
        switch (style) {
        case EndLineStyle::RepeatName: return "repeat_name";
        case EndLineStyle::Bare: return "bare";
        }
        return "unknown";
    }


    static void print_dialects()
    {
        const std::span<const LabelDialect* const> dialects
            = builtin_dialects();
        for (size_t i = 0; i < dialects.size(); ++i) {
            const LabelDialect& d = *dialects[i];
            std::printf("dialect=%.*s group=%.*s/%.*s object=%.*s/%.*s "
                        "terminal=%.*s end_line=%s aligned=%s\n",
                        static_cast<int>(d.name.size()), d.name.data(),
                        static_cast<int>(d.begin_group.size()),
                        d.begin_group.data(),
                        static_cast<int>(d.end_group.size()),
                        d.end_group.data(),
                        static_cast<int>(d.begin_object.size()),
                        d.begin_object.data(),
                        static_cast<int>(d.end_object.size()),
                        d.end_object.data(),
                        static_cast<int>(d.terminal.size()), d.terminal.data(),
                        end_line_style_name(d.end_line_style),
                        d.align_assignments ? "yes" : "no");
        }
    }


    static bool attach_entry(LabelDocument* doc, NodeId parent,
                             std::string_view key, NodeId id)
    {
        if (id == kInvalidNodeId || !doc->append_entry(parent, key, id)) {
            std::fprintf(stderr, "pvlinfo: failed to add sample entry `%.*s`\n",
                         static_cast<int>(key.size()), key.data());
            return false;
        }
        return true;
    }


    static bool add_entry(LabelDocument* doc, NodeId parent,
                          std::string_view key, const LabelValue& value)
    {
        return attach_entry(doc, parent, key, doc->add_node(value));
    }


    static bool add_element(LabelDocument* doc, NodeId collection,
                            const LabelValue& value)
    {
        const NodeId id = doc->add_node(value);
        if (id == kInvalidNodeId || !doc->append_element(collection, id)) {
            std::fprintf(stderr, "pvlinfo: failed to add sample element\n");
            return false;
        }
        return true;
    }


    // A small PDS3-style image label.
    static bool build_sample(LabelDocument* doc, bool bad_value)
    {
        const NodeId root = doc->root();
        bool ok           = true;
        ok = ok
             && add_entry(doc, root, "PDS_VERSION_ID",
                          make_text(*doc, "PDS3"));
        ok = ok
             && add_entry(doc, root, "RECORD_TYPE",
                          make_text(*doc, "FIXED_LENGTH"));
        ok = ok && add_entry(doc, root, "RECORD_BYTES", make_integer(1024));
        ok = ok && add_entry(doc, root, "FILE_RECORDS", make_integer(1025));
        ok = ok && add_entry(doc, root, "^IMAGE", make_integer(2));
        ok = ok
             && add_entry(doc, root, "PRODUCT_ID",
                          make_text(*doc, "EN0108828327M"));
        ok = ok
             && add_entry(doc, root, "SPACECRAFT_NAME",
                          make_text(*doc, "MESSENGER"));
        ok = ok
             && add_entry(doc, root, "START_TIME",
                          make_text(*doc, "2008-01-14T19:12:58.632"));

        const NodeId filters = doc->add_node(make_sequence());
        ok = ok && add_element(doc, filters, make_integer(2));
        ok = ok && add_element(doc, filters, make_integer(7));
        ok = ok && add_element(doc, filters, make_integer(11));
        ok = ok && attach_entry(doc, root, "FILTER_NUMBER", filters);

        const NodeId geometry = doc->add_node(make_group());
        ok = ok && attach_entry(doc, root, "GEOMETRY", geometry);
        const NodeId range = doc->add_node(make_real(27380.2));
        ok = ok
             && add_entry(doc, geometry, "SPACECRAFT_SOLAR_DISTANCE",
                          make_units(*doc, range, "KM"));
        ok = ok && add_entry(doc, geometry, "EMISSION_ANGLE", make_null());

        const NodeId image = doc->add_node(make_object());
        ok = ok && attach_entry(doc, root, "IMAGE", image);
        ok = ok && add_entry(doc, image, "LINES", make_integer(1024));
        ok = ok && add_entry(doc, image, "LINE_SAMPLES", make_integer(1024));
        ok = ok
             && add_entry(doc, image, "SAMPLE_TYPE",
                          make_text(*doc, "MSB_INTEGER"));
        ok = ok && add_entry(doc, image, "SAMPLE_BITS", make_integer(16));
        ok = ok && add_entry(doc, image, "DARK_STRIP_MEAN", make_real(215.5));
        ok = ok && add_entry(doc, image, "CHECKSUM_VALID", make_bool(true));
        ok = ok
             && add_entry(doc, image, "DESCRIPTION",
                          make_text(*doc, "Wide angle camera frame"));

        const NodeId flags = doc->add_node(make_set());
        ok = ok && add_element(doc, flags, make_text(*doc, "SATURATED"));
        ok = ok && add_element(doc, flags, make_text(*doc, "SMEARED"));
        ok = ok && attach_entry(doc, image, "QUALITY_FLAGS", flags);

        if (ok && bad_value) {
            static constexpr std::array<std::byte, 4> kRaw = {
                std::byte { 0xDE }, std::byte { 0xAD }, std::byte { 0xBE },
                std::byte { 0xEF },
            };
            ok = add_entry(doc, image, "RAW_HEADER",
                           make_bytes(*doc, std::span<const std::byte>(kRaw)));
        }
        return ok;
    }

}  // namespace
}  // namespace openpvl

int
main(int argc, char** argv)
{
    using namespace openpvl;

    bool show_build_info = true;
    bool show_sample     = false;
    bool show_report     = false;
    bool bad_value       = false;
    bool verbose         = false;

    const LabelDialect* dialect = &pds3_dialect();
    LabelEncodeOptions options;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            continue;
        }
        if (std::strcmp(arg, "--sample") == 0) {
            show_sample = true;
            continue;
        }
        if (std::strcmp(arg, "--report") == 0) {
            show_report = true;
            continue;
        }
        if (std::strcmp(arg, "--bad-value") == 0) {
            bad_value = true;
            continue;
        }
        if (std::strcmp(arg, "-v") == 0) {
            verbose = true;
            continue;
        }
        if (std::strcmp(arg, "--dialect") == 0 && i + 1 < argc) {
            dialect = find_dialect(argv[i + 1]);
            if (!dialect) {
                std::fprintf(stderr, "pvlinfo: unknown dialect `%s`\n",
                             argv[i + 1]);
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-depth") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-depth value\n");
                return 2;
            }
            options.limits.max_depth = v;
            i += 1;
            continue;
        }
        std::fprintf(stderr, "pvlinfo: unknown option `%s`\n", arg);
        usage(argv[0]);
        return 2;
    }

    if (show_build_info) {
        print_build_info_header();
    }
    if (!show_sample && !show_report) {
        print_dialects();
        return 0;
    }

    LabelDocument doc;
    if (!build_sample(&doc, bad_value)) {
        return 1;
    }

    int exit_code = 0;
    if (show_sample) {
        FileLabelSink sink(stdout);
        const LabelEncodeResult r = encode_label(doc, doc.root(), *dialect,
                                                 sink, options);
        std::printf("\n");
        if (r.status != LabelEncodeStatus::Ok) {
            std::fprintf(stderr, "pvlinfo: %.*s encode failed: %s at %s: %s\n",
                         static_cast<int>(dialect->name.size()),
                         dialect->name.data(),
                         label_encode_status_name(r.status),
                         r.failed_key.c_str(), r.detail.c_str());
            exit_code = 1;
        } else if (sink.failed()) {
            std::fprintf(stderr, "pvlinfo: failed to write stdout\n");
            exit_code = 1;
        }
    }

    if (show_report) {
        FileReport report;
        report.path = "<sample>";
        const std::span<const LabelProfileInfo> profiles
            = validation_profiles();
        for (size_t i = 0; i < profiles.size(); ++i) {
            std::string error;
            ProfileOutcome& o = report.outcomes[i];
            o.loaded          = true;
            if (check_profile_encodes(doc, profiles[i].profile, &error)) {
                o.encoded = EncodeOutcome::Encoded;
                continue;
            }
            o.encoded = EncodeOutcome::Failed;
            if (verbose) {
                std::fprintf(stderr, "ERROR: %.*s encode error %s %s\n",
                             static_cast<int>(profiles[i].name.size()),
                             profiles[i].name.data(), report.path.c_str(),
                             error.c_str());
            }
        }

        std::string text;
        format_validate_report(std::span<const FileReport>(&report, 1), &text);
        std::printf("%s\n", text.c_str());
    }
    return exit_code;
}
