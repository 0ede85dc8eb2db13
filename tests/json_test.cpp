// json_test.cpp: nlohmann/json interoperability

#include <jsondiff-cpp/json.hpp>
#include <jsondiff-cpp/jsondiff.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace jd = jsondiff_cpp;
using json = nlohmann::ordered_json;

// =============================================================================
// parse_value
// =============================================================================

TEST(ParseValue, scalars) {
    EXPECT_EQ(jd::parse_value("null"), jd::Value{jd::Null{}});
    EXPECT_EQ(jd::parse_value("true"), jd::Value{true});
    EXPECT_EQ(jd::parse_value("-12"), jd::Value{-12});
    EXPECT_EQ(jd::parse_value("2.5"), jd::Value{2.5});
    EXPECT_EQ(jd::parse_value("\"text\""), jd::Value{"text"});
}

TEST(ParseValue, small_unsigned_becomes_int64) {
    auto v = jd::parse_value("42");
    EXPECT_TRUE(std::holds_alternative<std::int64_t>(v.data));
}

TEST(ParseValue, large_unsigned_stays_uint64) {
    auto v = jd::parse_value("18446744073709551615");
    ASSERT_TRUE(std::holds_alternative<std::uint64_t>(v.data));
    EXPECT_EQ(std::get<std::uint64_t>(v.data), std::numeric_limits<std::uint64_t>::max());
}

TEST(ParseValue, objects_keep_document_order) {
    auto v = jd::parse_value(R"({"zeta": 1, "alpha": [1, {"k": null}], "mid": {}})");
    const auto* obj = jd::as_object(v);
    ASSERT_NE(obj, nullptr);
    ASSERT_EQ(obj->size(), 3u);

    auto it = obj->begin();
    EXPECT_EQ(it->first, "zeta");
    EXPECT_EQ((++it)->first, "alpha");
    EXPECT_EQ((++it)->first, "mid");

    const auto* alpha = jd::as_array(*obj->find("alpha"));
    ASSERT_NE(alpha, nullptr);
    EXPECT_EQ(alpha->size(), 2u);
}

TEST(ParseValue, invalid_text_throws_value_error) {
    EXPECT_THROW(jd::parse_value("{"), jd::ValueError);
    EXPECT_THROW(jd::parse_value(""), jd::ValueError);
    EXPECT_THROW(jd::parse_value("[1,]"), jd::ValueError);

    try {
        jd::parse_value("nope");
        FAIL() << "expected ValueError";
    } catch (const jd::ValueError& e) {
        EXPECT_EQ(e.kind(), jd::ErrorKind::invalid_value);
    }
}

// =============================================================================
// Value <-> json
// =============================================================================

TEST(ValueJson, to_json_mirrors_structure) {
    auto v = jd::Value{jd::Object{
        {"name", "Alice"},
        {"tags", jd::Array{1, 2.5, true, jd::Null{}}},
    }};
    json j = v;

    EXPECT_EQ(j.dump(), R"({"name":"Alice","tags":[1,2.5,true,null]})");
}

TEST(ValueJson, json_document_survives_conversion) {
    auto original = json::parse(R"({"b":[{"id":1},{"id":2}],"a":{"x":-3,"y":"s"}})");
    auto v = original.get<jd::Value>();
    json back = v;
    EXPECT_EQ(back, original);
}

TEST(ValueJson, binary_is_rejected) {
    auto j = json::binary({0x01, 0x02});
    EXPECT_THROW(j.get<jd::Value>(), jd::ValueError);
}

// =============================================================================
// Results
// =============================================================================

TEST(ResultJson, diff_record_omits_absent_fields) {
    json added = jd::DiffRecord::added(jd::IdentityPath::parse("root.items[id=7]"),
                                       jd::Value{jd::Object{{"id", 7}}}, "id");
    EXPECT_EQ(added["path"], "root.items[id=7]");
    EXPECT_EQ(added["kind"], "added");
    EXPECT_FALSE(added.contains("before"));
    EXPECT_EQ(added["after"]["id"], 7);
    EXPECT_EQ(added["identity_key_used"], "id");

    json changed = jd::DiffRecord::changed(jd::IdentityPath::parse("root.a"), 1, "one");
    EXPECT_EQ(changed["before"], 1);
    EXPECT_EQ(changed["after"], "one");
    EXPECT_FALSE(changed.contains("identity_key_used"));
}

TEST(ResultJson, compare_result_lists_diffs_and_keys) {
    auto left = jd::parse_value(R"({"contributions":[{"id":"a","amt":7000},{"id":"b","amt":1000}]})");
    auto right = jd::parse_value(R"({"contributions":[{"id":"b","amt":1000},{"id":"a","amt":3500}]})");

    json j = jd::compare(left, right);

    auto expected = json::parse(R"({
        "diffs": [
            {"path": "root.contributions[id=a].amt", "kind": "changed",
             "before": 7000, "after": 3500}
        ],
        "identity_keys": [
            {"array_pattern": "contributions[]", "identity_key": "id",
             "is_composite": false, "size_left": 2, "size_right": 2}
        ]
    })");
    EXPECT_EQ(j, expected);
}

TEST(ResultJson, paths_serialize_as_strings) {
    EXPECT_EQ(json(jd::IndexPath::parse("root.a[0]")), "root.a[0]");
    EXPECT_EQ(json(jd::ArrayPatternPath::parse("a[].b[]")), "a[].b[]");
    EXPECT_EQ(json(jd::ViewerPath::parse("left_root.a[1]")), "left_root.a[1]");
}

TEST(ResultJson, classification_kind_is_optional) {
    json exact = jd::Classification{jd::Relation::exact, jd::DiffKind::removed};
    EXPECT_EQ(exact, json::parse(R"({"relation":"exact","kind":"removed"})"));

    json none = jd::Classification{};
    EXPECT_EQ(none, json::parse(R"({"relation":"none"})"));
}
