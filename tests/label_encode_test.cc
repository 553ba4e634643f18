#include "openpvl/label_dialect.h"
#include "openpvl/label_document.h"
#include "openpvl/label_encode.h"
#include "openpvl/label_sink.h"
#include "openpvl/label_value.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace openpvl {
namespace {

    static void add_entry(LabelDocument* doc, NodeId parent,
                          std::string_view key, const LabelValue& value)
    {
        const NodeId id = doc->add_node(value);
        ASSERT_NE(id, kInvalidNodeId);
        ASSERT_TRUE(doc->append_entry(parent, key, id));
    }


    static NodeId add_block(LabelDocument* doc, NodeId parent,
                            std::string_view key, bool group)
    {
        const NodeId id = doc->add_node(group ? make_group() : make_object());
        EXPECT_TRUE(doc->append_entry(parent, key, id));
        return id;
    }


    // {A: 1, X: Group{B: 2}}
    static void build_simple_group(LabelDocument* doc)
    {
        add_entry(doc, doc->root(), "A", make_integer(1));
        const NodeId x = add_block(doc, doc->root(), "X", true);
        add_entry(doc, x, "B", make_integer(2));
    }


    static std::string encode_to_string(const LabelDocument& doc,
                                        const LabelDialect& dialect,
                                        LabelEncodeResult* result = nullptr)
    {
        std::string out;
        StringLabelSink sink(&out);
        const LabelEncodeResult r = encode_label(doc, dialect, sink);
        if (result) {
            *result = r;
        }
        return out;
    }


    static std::string spaces(size_t n) { return std::string(n, ' '); }

}  // namespace

TEST(LabelEncode, DefaultDialectGroup)
{
    LabelDocument doc;
    build_simple_group(&doc);

    LabelEncodeResult r;
    const std::string out = encode_to_string(doc, default_dialect(), &r);
    ASSERT_EQ(r.status, LabelEncodeStatus::Ok);
    EXPECT_EQ(out, "A = 1\nBEGIN_GROUP = X\n  B = 2\nEND_GROUP = X\nEND");
    EXPECT_EQ(r.written, out.size());
    EXPECT_EQ(r.statements, 2U);
}


TEST(LabelEncode, CubeDialectWritesBareEndLine)
{
    LabelDocument doc;
    build_simple_group(&doc);

    const std::string out = encode_to_string(doc, cube_dialect());
    EXPECT_EQ(out, "A = 1\nGroup = X\n  B = 2\nEnd_Group\nEnd");
}


TEST(LabelEncode, ObjectUsesObjectTokens)
{
    LabelDocument doc;
    const NodeId o = add_block(&doc, doc.root(), "IMAGE", false);
    add_entry(&doc, o, "LINES", make_integer(10));

    EXPECT_EQ(encode_to_string(doc, default_dialect()),
              "BEGIN_OBJECT = IMAGE\n  LINES = 10\nEND_OBJECT = IMAGE\nEND");
    EXPECT_EQ(encode_to_string(doc, cube_dialect()),
              "Object = IMAGE\n  LINES = 10\nEnd_Object\nEnd");
}


TEST(LabelEncode, EmptyRootWritesTerminalOnly)
{
    LabelDocument doc;
    LabelEncodeResult r;
    EXPECT_EQ(encode_to_string(doc, default_dialect(), &r), "END");
    EXPECT_EQ(r.status, LabelEncodeStatus::Ok);
    EXPECT_EQ(r.written, 3U);
    EXPECT_EQ(r.statements, 0U);
}


TEST(LabelEncode, EmptyNestedBlock)
{
    LabelDocument doc;
    (void)add_block(&doc, doc.root(), "EMPTY", true);
    EXPECT_EQ(encode_to_string(doc, default_dialect()),
              "BEGIN_GROUP = EMPTY\nEND_GROUP = EMPTY\nEND");
}


TEST(LabelEncode, Pds3AlignsToLongestKey)
{
    LabelDocument doc;
    add_entry(&doc, doc.root(), "A", make_integer(1));
    add_entry(&doc, doc.root(), "LONGKEY", make_integer(2));

    const std::string out = encode_to_string(doc, pds3_dialect());
    EXPECT_EQ(out, "A       = 1\nLONGKEY = 2\nEND");
    // Both assignment tokens start one past the longest key.
    EXPECT_EQ(out.find('='), 8U);
    EXPECT_EQ(out.find('=', out.find('\n')) - out.find('\n') - 1U, 8U);
}


TEST(LabelEncode, Pds3DeepKeyWidensEveryLine)
{
    LabelDocument doc;
    add_entry(&doc, doc.root(), "A", make_integer(1));
    const NodeId g = add_block(&doc, doc.root(), "G", true);
    add_entry(&doc, g, "DEEPKEY", make_integer(2));

    EXPECT_EQ(compute_assignment_column(doc, doc.root(), pds3_dialect()), 9U);

    const std::string expected = "A" + spaces(8) + " = 1\n" + "GROUP"
                                 + spaces(4) + " = G\n" + "  DEEPKEY = 2\n"
                                 + "END" + spaces(6) + " = G\n" + "END";
    EXPECT_EQ(encode_to_string(doc, pds3_dialect()), expected);
}


TEST(LabelEncode, Pds3ObjectClosesWithEnd)
{
    LabelDocument doc;
    const NodeId o = add_block(&doc, doc.root(), "IMAGE", false);
    add_entry(&doc, o, "LINES", make_integer(10));

    // Column is max(5, 2 + 5) = 7.
    const std::string expected = "OBJECT  = IMAGE\n"
                                 "  LINES = 10\n"
                                 "END     = IMAGE\n"
                                 "END";
    EXPECT_EQ(encode_to_string(doc, pds3_dialect()), expected);
}


TEST(LabelEncode, Pds3PadsByCodePoints)
{
    LabelDocument doc;
    add_entry(&doc, doc.root(), "\xC3\x85R", make_integer(1));  // "ÅR"
    add_entry(&doc, doc.root(), "ABC", make_integer(2));

    EXPECT_EQ(encode_to_string(doc, pds3_dialect()),
              "\xC3\x85R  = 1\nABC = 2\nEND");
}


TEST(LabelEncode, AssignmentColumnIgnoresCollections)
{
    LabelDocument doc;
    const NodeId seq = doc.add_node(make_sequence());
    ASSERT_TRUE(doc.append_element(seq, doc.add_node(make_integer(1))));
    ASSERT_TRUE(doc.append_entry(doc.root(), "S", seq));

    EXPECT_EQ(compute_assignment_column(doc, doc.root(), pds3_dialect()), 1U);

    LabelDocument empty;
    EXPECT_EQ(compute_assignment_column(empty, empty.root(), pds3_dialect()),
              0U);
}


TEST(LabelEncode, AssignmentColumnUsesIndentWidth)
{
    LabelDocument doc;
    const NodeId a = add_block(&doc, doc.root(), "A", true);
    const NodeId b = add_block(&doc, a, "B", true);
    add_entry(&doc, b, "K", make_integer(1));

    LabelDialect wide = pds3_dialect();
    wide.indent       = "    ";
    EXPECT_EQ(compute_assignment_column(doc, doc.root(), pds3_dialect()), 5U);
    EXPECT_EQ(compute_assignment_column(doc, doc.root(), wide), 9U);
}


TEST(LabelEncode, ScalarValuesInBlocks)
{
    LabelDocument doc;
    add_entry(&doc, doc.root(), "N", make_null());
    add_entry(&doc, doc.root(), "T", make_bool(true));
    add_entry(&doc, doc.root(), "R", make_real(2.0));
    add_entry(&doc, doc.root(), "S", make_text(doc, "hello world"));
    add_entry(&doc, doc.root(), "W", make_text(doc, "PLAIN"));

    LabelEncodeResult r;
    const std::string out = encode_to_string(doc, default_dialect(), &r);
    ASSERT_EQ(r.status, LabelEncodeStatus::Ok);
    EXPECT_EQ(out, "N = NULL\nT = TRUE\nR = 2.0\nS = \"hello world\"\n"
                   "W = PLAIN\nEND");
    EXPECT_EQ(r.statements, 5U);
}


TEST(LabelEncode, FailureKeepsEarlierLines)
{
    LabelDocument doc;
    static constexpr std::array<std::byte, 2> kRaw = {
        std::byte { 0xDE },
        std::byte { 0xAD },
    };
    add_entry(&doc, doc.root(), "A", make_integer(1));
    add_entry(&doc, doc.root(), "B",
              make_bytes(doc, std::span<const std::byte>(kRaw)));
    add_entry(&doc, doc.root(), "C", make_integer(2));

    LabelEncodeResult r;
    const std::string out = encode_to_string(doc, default_dialect(), &r);
    EXPECT_EQ(r.status, LabelEncodeStatus::UnsupportedValue);
    EXPECT_EQ(out, "A = 1\n");
    EXPECT_EQ(r.written, out.size());
    EXPECT_EQ(r.statements, 1U);
    EXPECT_EQ(r.failed_key, "B");
    EXPECT_EQ(r.detail, "bytes[2]:DEAD");
    EXPECT_EQ(r.failed_node, doc.children(doc.root())[1].value);
}


TEST(LabelEncode, FailureInsideBlockOmitsEndLine)
{
    LabelDocument doc;
    add_entry(&doc, doc.root(), "A", make_integer(1));
    const NodeId g = add_block(&doc, doc.root(), "G", true);
    add_entry(&doc, g, "OK", make_integer(2));
    const NodeId bad_seq = doc.add_node(make_sequence());
    ASSERT_TRUE(doc.append_element(bad_seq, doc.add_node(make_object())));
    ASSERT_TRUE(doc.append_entry(g, "BAD", bad_seq));
    add_entry(&doc, doc.root(), "AFTER", make_integer(3));

    LabelEncodeResult r;
    const std::string out = encode_to_string(doc, default_dialect(), &r);
    EXPECT_EQ(r.status, LabelEncodeStatus::UnsupportedValue);
    EXPECT_EQ(out, "A = 1\nBEGIN_GROUP = G\n  OK = 2\n");
    EXPECT_EQ(r.failed_key, "BAD");
    EXPECT_EQ(r.detail, "object[0]");
}


TEST(LabelEncode, RejectedTextReportsKey)
{
    LabelDocument doc;
    add_entry(&doc, doc.root(), "Q", make_text(doc, "it's \"both\""));

    LabelEncodeResult r;
    const std::string out = encode_to_string(doc, default_dialect(), &r);
    EXPECT_EQ(r.status, LabelEncodeStatus::EncodingRejected);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(r.failed_key, "Q");
    EXPECT_EQ(r.detail, "\"it's \\\"both\\\"\"");
}


TEST(LabelEncode, InvalidUtf8KeyIsRejected)
{
    LabelDocument doc;
    add_entry(&doc, doc.root(), "OK", make_integer(1));
    add_entry(&doc, doc.root(), "B\xFF", make_integer(2));

    LabelEncodeResult r;
    const std::string out = encode_to_string(doc, default_dialect(), &r);
    EXPECT_EQ(r.status, LabelEncodeStatus::EncodingRejected);
    EXPECT_EQ(out, "OK = 1\n");
    EXPECT_EQ(r.failed_key, "B\\xFF");
}


TEST(LabelEncode, NonMappingRootIsMalformed)
{
    LabelDocument doc;
    const NodeId v = doc.add_node(make_integer(42));

    std::string out;
    StringLabelSink sink(&out);
    const LabelEncodeResult r = encode_label(doc, v, default_dialect(), sink,
                                             LabelEncodeOptions {});
    EXPECT_EQ(r.status, LabelEncodeStatus::Malformed);
    EXPECT_EQ(r.failed_node, v);
    EXPECT_EQ(r.detail, "42");
    EXPECT_TRUE(out.empty());

    const LabelEncodeResult r2 = encode_label(doc, 1000U, default_dialect(),
                                              sink, LabelEncodeOptions {});
    EXPECT_EQ(r2.status, LabelEncodeStatus::Malformed);
    EXPECT_EQ(r2.detail, "<invalid>");
}


TEST(LabelEncode, EncodesNestedMappingAsRoot)
{
    LabelDocument doc;
    add_entry(&doc, doc.root(), "A", make_integer(1));
    const NodeId g = add_block(&doc, doc.root(), "G", true);
    add_entry(&doc, g, "B", make_integer(2));

    std::string out;
    StringLabelSink sink(&out);
    const LabelEncodeResult r = encode_label(doc, g, default_dialect(), sink,
                                             LabelEncodeOptions {});
    ASSERT_EQ(r.status, LabelEncodeStatus::Ok);
    EXPECT_EQ(out, "B = 2\nEND");
}


TEST(LabelEncode, MaxDepthLimitsBlocks)
{
    LabelDocument doc;
    const NodeId g = add_block(&doc, doc.root(), "G", true);
    const NodeId h = add_block(&doc, g, "H", true);
    add_entry(&doc, h, "K", make_integer(1));

    LabelEncodeOptions options;
    options.limits.max_depth = 1;

    std::string out;
    StringLabelSink sink(&out);
    const LabelEncodeResult r = encode_label(doc, doc.root(),
                                             default_dialect(), sink, options);
    EXPECT_EQ(r.status, LabelEncodeStatus::LimitExceeded);
    EXPECT_EQ(r.failed_key, "H");
    EXPECT_EQ(out, "BEGIN_GROUP = G\n");

    options.limits.max_depth = 2;
    out.clear();
    const LabelEncodeResult r2 = encode_label(doc, doc.root(),
                                              default_dialect(), sink, options);
    EXPECT_EQ(r2.status, LabelEncodeStatus::Ok);
}


TEST(LabelEncode, MaxDepthLimitsSequences)
{
    LabelDocument doc;
    const NodeId outer = doc.add_node(make_sequence());
    const NodeId mid   = doc.add_node(make_sequence());
    const NodeId inner = doc.add_node(make_sequence());
    ASSERT_TRUE(doc.append_element(inner, doc.add_node(make_integer(1))));
    ASSERT_TRUE(doc.append_element(mid, inner));
    ASSERT_TRUE(doc.append_element(outer, mid));
    ASSERT_TRUE(doc.append_entry(doc.root(), "S", outer));

    LabelEncodeOptions options;
    options.limits.max_depth = 2;
    std::string out;
    LabelEncodeResult r = dump_label(doc, default_dialect(), options, &out);
    ASSERT_EQ(r.status, LabelEncodeStatus::Ok);
    EXPECT_EQ(out, "S = (((1)))\nEND");

    options.limits.max_depth = 1;
    out.clear();
    r = dump_label(doc, default_dialect(), options, &out);
    EXPECT_EQ(r.status, LabelEncodeStatus::LimitExceeded);
    EXPECT_EQ(r.failed_key, "S");
    EXPECT_TRUE(out.empty());
}


TEST(LabelEncode, DeepChainStopsAtDepthLimit)
{
    // G = Group{G = Group{...}}, built bottom-up.
    static constexpr uint32_t kChain = 100000;
    LabelDocument doc;
    NodeId child = doc.add_node(make_group());
    for (uint32_t i = 1; i < kChain; ++i) {
        const NodeId parent = doc.add_node(make_group());
        ASSERT_TRUE(doc.append_entry(parent, "G", child));
        child = parent;
    }
    ASSERT_TRUE(doc.append_entry(doc.root(), "G", child));

    EXPECT_EQ(compute_assignment_column(doc, doc.root(), pds3_dialect(), 8U),
              17U);

    LabelEncodeOptions options;
    options.limits.max_depth = 8;
    const std::span<const LabelDialect* const> dialects = builtin_dialects();
    for (size_t i = 0; i < dialects.size(); ++i) {
        std::string out;
        StringLabelSink sink(&out);
        const LabelEncodeResult r = encode_label(doc, doc.root(),
                                                 *dialects[i], sink, options);
        EXPECT_EQ(r.status, LabelEncodeStatus::LimitExceeded)
            << dialects[i]->name;
        EXPECT_EQ(r.failed_key, "G");
        EXPECT_EQ(std::count(out.begin(), out.end(), '\n'), 8);
    }

    std::string out;
    const LabelEncodeResult r = dump_label(doc, pds3_dialect(),
                                           LabelEncodeOptions {}, &out);
    EXPECT_EQ(r.status, LabelEncodeStatus::LimitExceeded);
    EXPECT_TRUE(out.empty());
}


TEST(LabelEncode, DumpLabelIsAllOrNothing)
{
    LabelDocument doc;
    add_entry(&doc, doc.root(), "A", make_integer(1));

    std::string out = "prefix:";
    LabelEncodeResult r = dump_label(doc, default_dialect(),
                                     LabelEncodeOptions {}, &out);
    ASSERT_EQ(r.status, LabelEncodeStatus::Ok);
    EXPECT_EQ(out, "prefix:A = 1\nEND");

    static constexpr std::array<std::byte, 1> kRaw = { std::byte { 0x01 } };
    add_entry(&doc, doc.root(), "B",
              make_bytes(doc, std::span<const std::byte>(kRaw)));
    out = "prefix:";
    r   = dump_label(doc, default_dialect(), LabelEncodeOptions {}, &out);
    EXPECT_EQ(r.status, LabelEncodeStatus::UnsupportedValue);
    EXPECT_EQ(out, "prefix:");
    EXPECT_GT(r.written, 0U);
}


TEST(LabelEncode, CustomDialect)
{
    LabelDocument doc;
    build_simple_group(&doc);

    LabelDialect d;
    d.name           = "Custom";
    d.begin_group    = "GRP";
    d.end_group      = "ENDGRP";
    d.begin_object   = "OBJ";
    d.end_object     = "ENDOBJ";
    d.terminal       = "STOP";
    d.end_line_style = EndLineStyle::Bare;
    d.indent         = "\t";
    d.assignment     = "=";
    d.newline        = "\r\n";

    EXPECT_EQ(encode_to_string(doc, d),
              "A=1\r\nGRP=X\r\n\tB=2\r\nENDGRP\r\nSTOP");
}


TEST(LabelEncode, SharedDialectAcrossCalls)
{
    LabelDocument wide;
    add_entry(&wide, wide.root(), "VERY_LONG_KEY", make_integer(1));
    LabelDocument narrow;
    add_entry(&narrow, narrow.root(), "K", make_integer(1));

    // The column of one call never leaks into the next.
    EXPECT_EQ(encode_to_string(wide, pds3_dialect()),
              "VERY_LONG_KEY = 1\nEND");
    EXPECT_EQ(encode_to_string(narrow, pds3_dialect()), "K = 1\nEND");
}


TEST(LabelEncode, CountingAndByteSinks)
{
    LabelDocument doc;
    build_simple_group(&doc);

    CountingLabelSink counter;
    const LabelEncodeResult r1 = encode_label(doc, default_dialect(), counter);
    ASSERT_EQ(r1.status, LabelEncodeStatus::Ok);
    EXPECT_EQ(counter.count(), r1.written);

    std::vector<std::byte> bytes;
    ByteVectorLabelSink sink(&bytes);
    const LabelEncodeResult r2 = encode_label(doc, default_dialect(), sink);
    ASSERT_EQ(r2.status, LabelEncodeStatus::Ok);
    ASSERT_EQ(bytes.size(), r2.written);
    const std::string_view s(reinterpret_cast<const char*>(bytes.data()),
                             bytes.size());
    EXPECT_EQ(s, encode_to_string(doc, default_dialect()));
}


TEST(LabelEncode, StatusNames)
{
    EXPECT_STREQ(label_encode_status_name(LabelEncodeStatus::Ok), "ok");
    EXPECT_STREQ(label_encode_status_name(LabelEncodeStatus::UnsupportedValue),
                 "unsupported_value");
    EXPECT_STREQ(label_encode_status_name(LabelEncodeStatus::EncodingRejected),
                 "encoding_rejected");
    EXPECT_STREQ(label_encode_status_name(LabelEncodeStatus::LimitExceeded),
                 "limit_exceeded");
    EXPECT_STREQ(label_encode_status_name(LabelEncodeStatus::Malformed),
                 "malformed");
}

}  // namespace openpvl
