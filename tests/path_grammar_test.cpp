#include <jsondiff-cpp/path_grammar.hpp>
#include <jsondiff-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace jsondiff_cpp;

namespace {

auto kind_of(std::string_view text) -> ErrorKind {
    try {
        parse_path(text);
    } catch (const PathError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected PathError for " << text;
    return ErrorKind::invalid_value;
}

}  // namespace

// -- Viewer -------------------------------------------------------------------

TEST(Viewer, to_string_view_and_parse) {
    EXPECT_EQ(to_string_view(Viewer::left), "left");
    EXPECT_EQ(to_string_view(Viewer::right), "right");
    EXPECT_EQ(parse_viewer("left"), Viewer::left);
    EXPECT_EQ(parse_viewer("right"), Viewer::right);
    EXPECT_FALSE(parse_viewer("middle").has_value());
}

// -- parse_path ---------------------------------------------------------------

TEST(ParsePath, property_index_identity_and_pattern_segments) {
    auto p = parse_path("root.accounts[2].contributions[id=a].amount");

    EXPECT_FALSE(p.viewer.has_value());
    EXPECT_TRUE(p.has_root);
    ASSERT_EQ(p.segments.size(), 5u);
    EXPECT_EQ(p.segments[0], Segment{PropertySegment{"accounts"}});
    EXPECT_EQ(p.segments[1], Segment{IndexSegment{2}});
    EXPECT_EQ(p.segments[2], Segment{PropertySegment{"contributions"}});
    EXPECT_EQ(p.segments[3], (Segment{IdentitySegment{{KeyValue{"id", "a"}}}}));
    EXPECT_EQ(p.segments[4], Segment{PropertySegment{"amount"}});
}

TEST(ParsePath, composite_identity_segment) {
    auto p = parse_path("items[accountId=7|type=roth]");
    ASSERT_EQ(p.segments.size(), 2u);
    const auto& id = std::get<IdentitySegment>(p.segments[1]);
    ASSERT_EQ(id.keys.size(), 2u);
    EXPECT_EQ(id.keys[0], (KeyValue{"accountId", "7"}));
    EXPECT_EQ(id.keys[1], (KeyValue{"type", "roth"}));
}

TEST(ParsePath, viewer_prefix_and_root_marker) {
    auto p = parse_path("left_root.items[0]");
    EXPECT_EQ(p.viewer, Viewer::left);
    EXPECT_TRUE(p.has_root);
    EXPECT_EQ(p.segments.size(), 2u);

    auto q = parse_path("right_items");
    EXPECT_EQ(q.viewer, Viewer::right);
    EXPECT_FALSE(q.has_root);
    EXPECT_EQ(q.segments.size(), 1u);
}

TEST(ParsePath, root_alone_and_empty_text_are_the_root) {
    auto p = parse_path("root");
    EXPECT_TRUE(p.has_root);
    EXPECT_TRUE(p.segments.empty());

    auto q = parse_path("");
    EXPECT_FALSE(q.has_root);
    EXPECT_TRUE(q.segments.empty());
}

TEST(ParsePath, root_followed_by_bracket) {
    auto p = parse_path("root[3].name");
    EXPECT_TRUE(p.has_root);
    ASSERT_EQ(p.segments.size(), 2u);
    EXPECT_EQ(p.segments[0], Segment{IndexSegment{3}});
}

TEST(ParsePath, root_prefix_of_a_longer_name_is_a_property) {
    auto p = parse_path("rooted.x");
    EXPECT_FALSE(p.has_root);
    EXPECT_EQ(p.segments[0], Segment{PropertySegment{"rooted"}});
}

TEST(ParsePath, pattern_segments) {
    auto p = parse_path("a[].b[][]");
    ASSERT_EQ(p.segments.size(), 5u);
    EXPECT_EQ(p.segments[1], Segment{PatternSegment{}});
    EXPECT_EQ(p.segments[3], Segment{PatternSegment{}});
    EXPECT_EQ(p.segments[4], Segment{PatternSegment{}});
}

TEST(ParsePath, identity_value_may_contain_dots_and_equals) {
    auto p = parse_path("users[email=a.b@c.io].name");
    ASSERT_EQ(p.segments.size(), 3u);
    const auto& id = std::get<IdentitySegment>(p.segments[1]);
    EXPECT_EQ(id.keys[0].value, "a.b@c.io");

    auto q = parse_path("q[expr=x=1]");
    EXPECT_EQ(std::get<IdentitySegment>(q.segments[1]).keys[0].value, "x=1");
}

TEST(ParsePath, pipe_not_followed_by_a_pair_stays_in_the_value) {
    auto p = parse_path("t[label=a|b]");
    const auto& id = std::get<IdentitySegment>(p.segments[1]);
    ASSERT_EQ(id.keys.size(), 1u);
    EXPECT_EQ(id.keys[0].value, "a|b");
}

TEST(ParsePath, lenient_property_names) {
    auto p = parse_path("root.content-type.$ref.@id");
    ASSERT_EQ(p.segments.size(), 3u);
    EXPECT_EQ(p.segments[0], Segment{PropertySegment{"content-type"}});
    EXPECT_EQ(p.segments[1], Segment{PropertySegment{"$ref"}});
}

TEST(ParsePath, malformed_inputs_raise_malformed_path) {
    for (auto bad : {"a[", "a]", "a[0", "a..b", ".a", "a.", "a[x]", "a[0]b", "a[=1]",
                     "a[-1]", "root..a", "a[1.5]"}) {
        EXPECT_EQ(kind_of(bad), ErrorKind::malformed_path) << bad;
    }
}

// -- Serialization ------------------------------------------------------------

TEST(JoinSegments, dots_only_before_properties) {
    auto segs = std::vector<Segment>{
        PropertySegment{"a"}, IndexSegment{0}, PropertySegment{"b"},
        IdentitySegment{{KeyValue{"id", "x"}}}, PatternSegment{},
    };
    EXPECT_EQ(join_segments(segs), "a[0].b[id=x][]");
}

TEST(ToString, parse_then_serialize_is_identity) {
    for (auto text : {"root", "root.a", "root[0]", "left_root.a[1].b", "right_a.b",
                      "a[id=x|k=y].c", "a[].b[]", "", "[0][1]", "root.x[name=A B]"}) {
        EXPECT_EQ(to_string(parse_path(text)), text);
    }
}

TEST(ToString, awkward_property_names_are_quoted) {
    auto quoted = [](const char* name) {
        return join_segments(std::vector<Segment>{PropertySegment{"a"}, PropertySegment{name}});
    };
    EXPECT_EQ(quoted("b.c"), "a[\"b.c\"]");
    EXPECT_EQ(quoted("k]"), "a[\"k]\"]");
    EXPECT_EQ(quoted("[x"), "a[\"[x\"]");
    EXPECT_EQ(quoted(""), "a[\"\"]");
    EXPECT_EQ(quoted("say \"hi\""), "a[\"say \\\"hi\\\"\"]");
    EXPECT_EQ(quoted("a|b=c"), "a.a|b=c");
    EXPECT_EQ(quoted("root"), "a.root");
}

TEST(ToString, leading_names_that_look_like_prefixes_are_quoted) {
    auto first = [](const char* name) {
        return join_segments(std::vector<Segment>{PropertySegment{name}, IndexSegment{0}});
    };
    EXPECT_EQ(first("root"), "[\"root\"][0]");
    EXPECT_EQ(first("left_side"), "[\"left_side\"][0]");
    EXPECT_EQ(first("right_"), "[\"right_\"][0]");
    EXPECT_EQ(first("rooted"), "rooted[0]");

    auto p = ParsedPath{};
    p.has_root = true;
    p.segments = {PropertySegment{"root"}};
    EXPECT_EQ(to_string(p), "root[\"root\"]");
    EXPECT_EQ(parse_path(to_string(p)), p);
}

TEST(ToString, identity_keys_and_values_are_escaped) {
    auto seg = Segment{IdentitySegment{{KeyValue{"k=1", "a]"}, KeyValue{"t", "x|y\\z"}}}};
    EXPECT_EQ(to_string(seg), "[k\\=1=a\\]|t=x\\|y\\\\z]");
}

TEST(ParsePath, quoted_properties_and_escaped_identities_round_trip) {
    auto odd = std::vector<std::string>{
        "a.b", "k]", "[k", "", "|", "=", "x|y", "q\"uote", "back\\slash", "root",
        "left_x", "a=b]|c",
    };
    for (const auto& name : odd) {
        auto p = ParsedPath{};
        p.has_root = true;
        p.segments = {
            PropertySegment{name},
            IdentitySegment{{KeyValue{"id", name + "v"}, KeyValue{name + "k", "1"}}},
            PropertySegment{name},
            PatternSegment{},
        };
        auto text = to_string(p);
        EXPECT_EQ(parse_path(text), p) << text;

        p.viewer = Viewer::right;
        EXPECT_EQ(parse_path(to_string(p)), p) << to_string(p);
    }
}

TEST(ParsePath, quoted_property_segments) {
    auto p = parse_path("root[\"a.b\"].c[\"\"][0]");
    ASSERT_EQ(p.segments.size(), 4u);
    EXPECT_EQ(p.segments[0], Segment{PropertySegment{"a.b"}});
    EXPECT_EQ(p.segments[1], Segment{PropertySegment{"c"}});
    EXPECT_EQ(p.segments[2], Segment{PropertySegment{""}});
    EXPECT_EQ(p.segments[3], Segment{IndexSegment{0}});
}

TEST(ParsePath, escaped_bracket_inside_identity_value) {
    auto p = parse_path("items[id=a\\]].sub");
    ASSERT_EQ(p.segments.size(), 3u);
    EXPECT_EQ(std::get<IdentitySegment>(p.segments[1]).keys[0].value, "a]");

    auto q = parse_path("t[label=a\\|b=c]");
    const auto& id = std::get<IdentitySegment>(q.segments[1]);
    ASSERT_EQ(id.keys.size(), 1u);
    EXPECT_EQ(id.keys[0].value, "a|b=c");
}

TEST(ParsePath, unterminated_quotes_are_malformed) {
    for (auto bad : {"a[\"b]", "a[\"b\"", "a[\"b\"x]", "a[id=x\\]"}) {
        EXPECT_EQ(kind_of(bad), ErrorKind::malformed_path) << bad;
    }
}

// -- Helpers ------------------------------------------------------------------

TEST(StripPrefixes, removes_viewer_and_root_independently) {
    EXPECT_EQ(strip_prefixes("left_root.a[0]"), "a[0]");
    EXPECT_EQ(strip_prefixes("right_a.b"), "a.b");
    EXPECT_EQ(strip_prefixes("root.a"), "a");
    EXPECT_EQ(strip_prefixes("root[2]"), "[2]");
    EXPECT_EQ(strip_prefixes("root"), "");
    EXPECT_EQ(strip_prefixes("a.b"), "a.b");
}

TEST(SegmentCount, counts_dots_and_brackets) {
    EXPECT_EQ(segment_count(""), 0u);
    EXPECT_EQ(segment_count("a"), 1u);
    EXPECT_EQ(segment_count("a.b"), 2u);
    EXPECT_EQ(segment_count("a[0].b"), 3u);
    EXPECT_EQ(segment_count("[0]"), 1u);
}

TEST(SegmentCount, ignores_separators_inside_brackets) {
    EXPECT_EQ(segment_count("users[email=a.b@c.io]"), 2u);
    EXPECT_EQ(segment_count("m[k=[x]"), 2u);
    EXPECT_EQ(segment_count("a[\"b.c]\"].d"), 3u);
    EXPECT_EQ(segment_count("a[id=x\\].y]"), 2u);
}

TEST(IsStrictAncestor, requires_a_separator_after_the_prefix) {
    EXPECT_TRUE(is_strict_ancestor("contributions", "contributions[id=a].amt"));
    EXPECT_TRUE(is_strict_ancestor("contributions", "contributions.length"));
    EXPECT_FALSE(is_strict_ancestor("contribution", "contributionType"));
    EXPECT_FALSE(is_strict_ancestor("contributions", "contributionType"));
}

TEST(IsStrictAncestor, equal_paths_are_not_ancestors) {
    EXPECT_FALSE(is_strict_ancestor("a.b", "a.b"));
    EXPECT_FALSE(is_strict_ancestor("a.b.c", "a.b"));
}

TEST(IsStrictAncestor, root_is_ancestor_of_everything_else) {
    EXPECT_TRUE(is_strict_ancestor("", "a"));
    EXPECT_TRUE(is_strict_ancestor("", "[0]"));
    EXPECT_FALSE(is_strict_ancestor("", ""));
}
