#include "openpvl/build_info.h"
#include "openpvl/build_info_generated.h"
#include "openpvl/label_dialect.h"
#include "openpvl/label_document.h"
#include "openpvl/label_encode.h"
#include "openpvl/label_value.h"
#include "openpvl/validate_report.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace openpvl {
namespace {

    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static const LabelDialect& dialect_from_name(const std::string& name)
    {
        const LabelDialect* d = find_dialect(name);
        if (!d) {
            throw nb::value_error(("unknown dialect: " + name).c_str());
        }
        return *d;
    }


    static std::vector<std::string> dialect_names()
    {
        std::vector<std::string> out;
        const std::span<const LabelDialect* const> dialects
            = builtin_dialects();
        for (size_t i = 0; i < dialects.size(); ++i) {
            out.emplace_back(dialects[i]->name);
        }
        return out;
    }


    static void checked_attach(bool ok)
    {
        if (!ok) {
            throw nb::value_error(
                "node cannot be attached (already attached, cycle, wrong "
                "container kind or duplicate set member)");
        }
    }


    static std::string format_failure(const LabelEncodeResult& r)
    {
        std::string msg = label_encode_status_name(r.status);
        if (!r.failed_key.empty()) {
            msg.append(" at ");
            msg.append(r.failed_key);
        }
        if (!r.detail.empty()) {
            msg.append(": ");
            msg.append(r.detail);
        }
        return msg;
    }


    static std::pair<std::string, LabelEncodeResult>
    encode_with_result(const LabelDocument& doc, const std::string& dialect,
                       uint32_t max_depth)
    {
        const LabelDialect& d = dialect_from_name(dialect);
        LabelEncodeOptions options;
        options.limits.max_depth = max_depth;

        std::string out;
        LabelEncodeResult res;
        {
            nb::gil_scoped_release gil_release;
            res = dump_label(doc, d, options, &out);
        }
        return { std::move(out), std::move(res) };
    }


    static std::string encode_or_throw(const LabelDocument& doc,
                                       const std::string& dialect,
                                       uint32_t max_depth)
    {
        std::pair<std::string, LabelEncodeResult> r
            = encode_with_result(doc, dialect, max_depth);
        if (r.second.status != LabelEncodeStatus::Ok) {
            throw nb::value_error(format_failure(r.second).c_str());
        }
        return std::move(r.first);
    }

}  // namespace
}  // namespace openpvl

NB_MODULE(_openpvl, m)
{
    using namespace openpvl;

    m.doc()               = "OpenPVL label encoder bindings (nanobind).";
    m.attr("__version__") = OPENPVL_VERSION_STRING;

    nb::enum_<LabelValueKind>(m, "LabelValueKind")
        .value("Null", LabelValueKind::Null)
        .value("Boolean", LabelValueKind::Boolean)
        .value("Integer", LabelValueKind::Integer)
        .value("Real", LabelValueKind::Real)
        .value("Text", LabelValueKind::Text)
        .value("Bytes", LabelValueKind::Bytes)
        .value("Units", LabelValueKind::Units)
        .value("Sequence", LabelValueKind::Sequence)
        .value("Set", LabelValueKind::Set)
        .value("Object", LabelValueKind::Object)
        .value("Group", LabelValueKind::Group);

    nb::enum_<LabelEncodeStatus>(m, "LabelEncodeStatus")
        .value("Ok", LabelEncodeStatus::Ok)
        .value("UnsupportedValue", LabelEncodeStatus::UnsupportedValue)
        .value("EncodingRejected", LabelEncodeStatus::EncodingRejected)
        .value("LimitExceeded", LabelEncodeStatus::LimitExceeded)
        .value("Malformed", LabelEncodeStatus::Malformed);

    nb::enum_<EndLineStyle>(m, "EndLineStyle")
        .value("RepeatName", EndLineStyle::RepeatName)
        .value("Bare", EndLineStyle::Bare);

    nb::enum_<LabelProfile>(m, "LabelProfile")
        .value("Pds3", LabelProfile::Pds3)
        .value("Odl", LabelProfile::Odl)
        .value("Pvl", LabelProfile::Pvl)
        .value("Isis", LabelProfile::Isis)
        .value("Omni", LabelProfile::Omni);

    nb::class_<LabelEncodeResult>(m, "LabelEncodeResult")
        .def_ro("status", &LabelEncodeResult::status)
        .def_ro("written", &LabelEncodeResult::written)
        .def_ro("statements", &LabelEncodeResult::statements)
        .def_ro("failed_node", &LabelEncodeResult::failed_node)
        .def_ro("failed_key", &LabelEncodeResult::failed_key)
        .def_ro("detail", &LabelEncodeResult::detail);

    nb::class_<LabelDocument>(m, "LabelDocument")
        .def(nb::init<>())
        .def("root", &LabelDocument::root)
        .def("node_count", &LabelDocument::node_count)
        .def("kind",
             [](const LabelDocument& doc, NodeId id) {
                 if (!doc.is_valid(id)) {
                     throw nb::index_error("invalid node id");
                 }
                 return doc.node(id).value.kind;
             })
        .def("add_null",
             [](LabelDocument& doc) { return doc.add_node(make_null()); })
        .def("add_bool",
             [](LabelDocument& doc, bool v) {
                 return doc.add_node(make_bool(v));
             })
        .def("add_integer",
             [](LabelDocument& doc, int64_t v) {
                 return doc.add_node(make_integer(v));
             })
        .def("add_real",
             [](LabelDocument& doc, double v) {
                 return doc.add_node(make_real(v));
             })
        .def("add_text",
             [](LabelDocument& doc, const std::string& v) {
                 return doc.add_node(make_text(doc, v));
             })
        .def("add_bytes",
             [](LabelDocument& doc, nb::bytes v) {
                 const std::span<const std::byte> s(
                     reinterpret_cast<const std::byte*>(v.data()), v.size());
                 return doc.add_node(make_bytes(doc, s));
             })
        .def(
            "add_units",
            [](LabelDocument& doc, NodeId inner, const std::string& unit) {
                if (!doc.can_wrap_units(inner)) {
                    throw nb::value_error(
                        "units must wrap an unattached scalar");
                }
                return doc.add_node(make_units(doc, inner, unit));
            },
            "inner"_a, "unit"_a)
        .def("add_sequence",
             [](LabelDocument& doc) { return doc.add_node(make_sequence()); })
        .def("add_set",
             [](LabelDocument& doc) { return doc.add_node(make_set()); })
        .def("add_object",
             [](LabelDocument& doc) { return doc.add_node(make_object()); })
        .def("add_group",
             [](LabelDocument& doc) { return doc.add_node(make_group()); })
        .def(
            "append_entry",
            [](LabelDocument& doc, NodeId mapping, const std::string& key,
               NodeId value) {
                checked_attach(doc.append_entry(mapping, key, value));
            },
            "mapping"_a, "key"_a, "value"_a)
        .def(
            "append_element",
            [](LabelDocument& doc, NodeId collection, NodeId value) {
                checked_attach(doc.append_element(collection, value));
            },
            "collection"_a, "value"_a);

    m.def("encode", &encode_or_throw, "doc"_a, "dialect"_a = "pds3",
          "max_depth"_a = kDefaultLabelMaxDepth,
          "Encodes `doc` as label text. Raises ValueError on failure.");
    m.def("encode_result", &encode_with_result, "doc"_a, "dialect"_a = "pds3",
          "max_depth"_a = kDefaultLabelMaxDepth,
          "Returns (text, LabelEncodeResult); text is empty on failure.");
    m.def(
        "assignment_column",
        [](const LabelDocument& doc, const std::string& dialect) {
            return compute_assignment_column(doc, doc.root(),
                                             dialect_from_name(dialect));
        },
        "doc"_a, "dialect"_a = "pds3");
    m.def(
        "check_profile",
        [](const LabelDocument& doc, LabelProfile profile) {
            std::string error;
            const bool ok = check_profile_encodes(doc, profile, &error);
            return std::make_pair(ok, std::move(error));
        },
        "doc"_a, "profile"_a);
    m.def("dialect_names", &dialect_names);
    m.def("info_lines", &info_lines);
}
