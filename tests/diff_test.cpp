// diff_test.cpp - Structural diff between Value trees

#include <jsontree-cpp/diff.hpp>
#include <jsontree-cpp/json.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace jt = jsontree_cpp;

namespace {

auto paths(const std::vector<jt::DiffRecord>& records) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    for (const auto& r : records) result.push_back(r.path);
    return result;
}

auto kinds(const std::vector<jt::DiffRecord>& records) -> std::vector<jt::DiffKind> {
    auto result = std::vector<jt::DiffKind>{};
    for (const auto& r : records) result.push_back(r.kind);
    return result;
}

}  // anonymous namespace

TEST(DiffKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(jt::to_string_view(jt::DiffKind::added),        "added");
    EXPECT_EQ(jt::to_string_view(jt::DiffKind::removed),      "removed");
    EXPECT_EQ(jt::to_string_view(jt::DiffKind::modified),     "modified");
    EXPECT_EQ(jt::to_string_view(jt::DiffKind::same),         "same");
    EXPECT_EQ(jt::to_string_view(jt::DiffKind::type_changed), "type_changed");
}

// -- Basic scenarios ----------------------------------------------------------

TEST(Diff, identical_documents_yield_nothing) {
    const auto doc = jt::parse(R"({"a":[1,{"b":null}],"c":"x","d":true})");
    EXPECT_TRUE(jt::diff(doc, doc).empty());
}

TEST(Diff, modified_and_added_keys) {
    const auto records = jt::diff(jt::parse(R"({"age":30})"),
                                  jt::parse(R"({"age":31,"email":"e"})"));
    ASSERT_EQ(records.size(), 2u);

    EXPECT_EQ(records[0].kind, jt::DiffKind::modified);
    EXPECT_EQ(records[0].path, "$.age");
    EXPECT_EQ(records[0].pointer, "/age");
    EXPECT_EQ(records[0].old_value, jt::Value{30});
    EXPECT_EQ(records[0].new_value, jt::Value{31});

    EXPECT_EQ(records[1].kind, jt::DiffKind::added);
    EXPECT_EQ(records[1].path, "$.email");
    EXPECT_FALSE(records[1].old_value.has_value());
    EXPECT_EQ(records[1].new_value, jt::Value{"e"});
}

TEST(Diff, removed_key_has_no_new_value) {
    const auto records = jt::diff(jt::parse(R"({"a":1,"b":2})"), jt::parse(R"({"a":1})"));
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].kind, jt::DiffKind::removed);
    EXPECT_EQ(records[0].path, "$.b");
    EXPECT_EQ(records[0].old_value, jt::Value{2});
    EXPECT_FALSE(records[0].new_value.has_value());
}

TEST(Diff, keys_are_visited_in_sorted_order) {
    const auto records = jt::diff(jt::parse(R"({"z":1,"b":1})"),
                                  jt::parse(R"({"a":1,"y":1})"));
    EXPECT_EQ(paths(records), (std::vector<std::string>{"$.a", "$.b", "$.y", "$.z"}));
    EXPECT_EQ(kinds(records), (std::vector<jt::DiffKind>{
        jt::DiffKind::added, jt::DiffKind::removed,
        jt::DiffKind::added, jt::DiffKind::removed}));
}

TEST(Diff, non_identifier_keys_use_brackets) {
    const auto records = jt::diff(jt::parse(R"({"first name":"a","it's":1,"_ok1":1})"),
                                  jt::parse(R"({"first name":"b","it's":2,"_ok1":2})"));
    EXPECT_EQ(paths(records), (std::vector<std::string>{
        "$._ok1", "$['first name']", "$['it\\'s']"}));
    EXPECT_EQ(records[1].pointer, "/first name");
}

TEST(Diff, nested_paths_combine_keys_and_indices) {
    const auto records = jt::diff(jt::parse(R"({"a":{"b":[1,{"c":"x"}]}})"),
                                  jt::parse(R"({"a":{"b":[1,{"c":"y"}]}})"));
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].path, "$.a.b[1].c");
    EXPECT_EQ(records[0].pointer, "/a/b/1/c");
}

TEST(Diff, pointer_escapes_special_characters) {
    const auto records = jt::diff(jt::parse(R"({"a/b":{"m~n":1}})"),
                                  jt::parse(R"({"a/b":{"m~n":2}})"));
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].pointer, "/a~1b/m~0n");
}

// -- Null and type handling ---------------------------------------------------

TEST(Diff, null_to_value_is_added) {
    const auto records = jt::diff(jt::parse(R"({"a":null})"), jt::parse(R"({"a":5})"));
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].kind, jt::DiffKind::added);
    ASSERT_TRUE(records[0].old_value.has_value());
    EXPECT_TRUE(records[0].old_value->is_null());
}

TEST(Diff, value_to_null_is_removed) {
    const auto records = jt::diff(jt::parse(R"({"a":5})"), jt::parse(R"({"a":null})"));
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].kind, jt::DiffKind::removed);
    ASSERT_TRUE(records[0].new_value.has_value());
    EXPECT_TRUE(records[0].new_value->is_null());
}

TEST(Diff, type_change_is_not_recursed) {
    const auto records = jt::diff(jt::parse(R"({"a":{"x":1}})"), jt::parse(R"({"a":[1]})"));
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].kind, jt::DiffKind::type_changed);
    EXPECT_EQ(records[0].path, "$.a");
}

TEST(Diff, root_scalars) {
    const auto records = jt::diff(jt::Value{1}, jt::Value{2});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].kind, jt::DiffKind::modified);
    EXPECT_EQ(records[0].path, "$");
    EXPECT_EQ(records[0].pointer, "");
}

// -- Arrays -------------------------------------------------------------------

TEST(Diff, longer_new_array_reports_additions) {
    const auto records = jt::diff(jt::parse("[1,2]"), jt::parse("[1,3,4,5]"));
    EXPECT_EQ(paths(records), (std::vector<std::string>{"$[1]", "$[2]", "$[3]"}));
    EXPECT_EQ(kinds(records), (std::vector<jt::DiffKind>{
        jt::DiffKind::modified, jt::DiffKind::added, jt::DiffKind::added}));
}

TEST(Diff, shorter_new_array_reports_removals) {
    const auto records = jt::diff(jt::parse(R"({"a":[1,2,3]})"), jt::parse(R"({"a":[1]})"));
    EXPECT_EQ(paths(records), (std::vector<std::string>{"$.a[1]", "$.a[2]"}));
    EXPECT_EQ(kinds(records), (std::vector<jt::DiffKind>{
        jt::DiffKind::removed, jt::DiffKind::removed}));
}

TEST(Diff, reordered_array_is_modified_by_default) {
    const auto records = jt::diff(jt::parse("[1,2,3]"), jt::parse("[3,1,2]"));
    EXPECT_EQ(records.size(), 3u);
}

TEST(Diff, ignore_order_matches_elements_as_multiset) {
    auto options = jt::DiffOptions{.ignore_order = true};
    EXPECT_TRUE(jt::diff(jt::parse("[1,2,3]"), jt::parse("[3,1,2]"), options).empty());
    EXPECT_TRUE(jt::diff(jt::parse(R"([{"a":1},"x"])"), jt::parse(R"(["x",{"a":1}])"), options).empty());
}

TEST(Diff, ignore_order_reports_unmatched_elements) {
    auto options = jt::DiffOptions{.ignore_order = true};
    const auto records = jt::diff(jt::parse("[1,2,2,3]"), jt::parse("[2,4,1]"), options);
    EXPECT_EQ(paths(records), (std::vector<std::string>{"$[2]", "$[3]", "$[1]"}));
    EXPECT_EQ(kinds(records), (std::vector<jt::DiffKind>{
        jt::DiffKind::removed, jt::DiffKind::removed, jt::DiffKind::added}));
    EXPECT_EQ(records[0].old_value, jt::Value{2});
    EXPECT_EQ(records[1].old_value, jt::Value{3});
    EXPECT_EQ(records[2].new_value, jt::Value{4});
}

// -- Options ------------------------------------------------------------------

TEST(Diff, ignore_case) {
    const auto a = jt::parse(R"({"s":"Hello"})");
    const auto b = jt::parse(R"({"s":"hELLO"})");
    EXPECT_EQ(jt::diff(a, b).size(), 1u);
    EXPECT_TRUE(jt::diff(a, b, jt::DiffOptions{.ignore_case = true}).empty());
}

TEST(Diff, ignore_case_folds_ascii_letters_only) {
    const auto options = jt::DiffOptions{.ignore_case = true};
    EXPECT_TRUE(jt::diff(jt::parse(R"(["AB"])"), jt::parse(R"(["ab"])"), options).empty());
    EXPECT_EQ(jt::diff(jt::parse(R"(["\u00c4B"])"), jt::parse(R"(["\u00e4b"])"), options).size(), 1u);
}

TEST(Diff, ignore_whitespace_removes_all_whitespace) {
    const auto a = jt::parse(R"({"s":"a b\tc"})");
    const auto b = jt::parse(R"({"s":"abc\n"})");
    EXPECT_EQ(jt::diff(a, b).size(), 1u);
    EXPECT_TRUE(jt::diff(a, b, jt::DiffOptions{.ignore_whitespace = true}).empty());
}

TEST(Diff, include_same_reports_unchanged_leaves) {
    const auto doc = jt::parse(R"({"a":1,"b":[true,null]})");
    const auto records = jt::diff(doc, doc, jt::DiffOptions{.include_same = true});
    EXPECT_EQ(paths(records), (std::vector<std::string>{"$.a", "$.b[0]", "$.b[1]"}));
    for (const auto& r : records) EXPECT_EQ(r.kind, jt::DiffKind::same);
}

TEST(Diff, max_depth_stops_recursion) {
    const auto a = jt::parse(R"({"x":1,"deep":{"y":1,"z":{"w":1}}})");
    const auto b = jt::parse(R"({"x":2,"deep":{"y":2,"z":{"w":2}}})");
    EXPECT_EQ(paths(jt::diff(a, b)), (std::vector<std::string>{
        "$.deep.y", "$.deep.z.w", "$.x"}));
    EXPECT_EQ(paths(jt::diff(a, b, jt::DiffOptions{.max_depth = 1})),
              (std::vector<std::string>{"$.x"}));
    EXPECT_EQ(paths(jt::diff(a, b, jt::DiffOptions{.max_depth = 2})),
              (std::vector<std::string>{"$.deep.y", "$.x"}));
}

TEST(Diff, anti_symmetric_in_kind) {
    const auto a = jt::parse(R"({"a":1,"list":[1]})");
    const auto b = jt::parse(R"({"a":1,"b":2,"list":[1,2]})");
    const auto forward = jt::diff(a, b);
    const auto backward = jt::diff(b, a);
    ASSERT_EQ(forward.size(), backward.size());
    for (std::size_t i = 0; i < forward.size(); ++i) {
        EXPECT_EQ(forward[i].kind, jt::DiffKind::added);
        EXPECT_EQ(backward[i].kind, jt::DiffKind::removed);
        EXPECT_EQ(forward[i].path, backward[i].path);
    }
}

// -- Helpers ------------------------------------------------------------------

TEST(Equivalent, default_options_match_equality) {
    EXPECT_TRUE(jt::equivalent(jt::parse(R"({"a":[1,"x"]})"), jt::parse(R"({"a":[1,"x"]})"), {}));
    EXPECT_FALSE(jt::equivalent(jt::parse(R"({"a":[1,"x"]})"), jt::parse(R"({"a":[1,"X"]})"), {}));
    EXPECT_TRUE(jt::equivalent(jt::parse(R"({"a":[1,"x"]})"), jt::parse(R"({"a":[1,"X"]})"),
                               jt::DiffOptions{.ignore_case = true}));
}

TEST(KeyPathSegment, identifiers_and_brackets) {
    EXPECT_EQ(jt::key_path_segment("name"), ".name");
    EXPECT_EQ(jt::key_path_segment("_x9"), "._x9");
    EXPECT_EQ(jt::key_path_segment("9x"), "['9x']");
    EXPECT_EQ(jt::key_path_segment(""), "['']");
    EXPECT_EQ(jt::key_path_segment("a\\b"), "['a\\\\b']");
}

TEST(DiffRecord, to_string_describes_the_change) {
    const auto records = jt::diff(jt::parse(R"({"age":30,"tags":[],"gone":"x"})"),
                                  jt::parse(R"({"age":31,"tags":{},"new":[1]})"));
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(jt::to_string(records[0]), "modified: $.age = 30 -> 31");
    EXPECT_EQ(jt::to_string(records[1]), R"(removed: $.gone = "x")");
    EXPECT_EQ(jt::to_string(records[2]), "added: $.new = [1]");
    EXPECT_EQ(jt::to_string(records[3]), "type_changed: $.tags = array -> object");
}

TEST(DiffRecord, to_string_tolerates_absent_sides) {
    const auto record = jt::DiffRecord{.kind = jt::DiffKind::type_changed, .path = "$.a",
                                       .pointer = "/a", .old_value = jt::Value{1}};
    EXPECT_EQ(jt::to_string(record), "type_changed: $.a = number -> (absent)");
    EXPECT_EQ(jt::to_string(jt::DiffRecord{.kind = jt::DiffKind::type_changed, .path = "$"}),
              "type_changed: $ = (absent) -> (absent)");
}
