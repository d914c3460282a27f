// patch_generator_test.cpp - Deriving edit operations from diff records

#include <jsontree-cpp/diff.hpp>
#include <jsontree-cpp/json.hpp>
#include <jsontree-cpp/patch.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace jt = jsontree_cpp;

namespace {

auto generated(std::string_view before, std::string_view after) -> std::string {
    return jt::dump(jt::to_value(jt::generate_patch(jt::diff(jt::parse(before), jt::parse(after)))));
}

}  // anonymous namespace

TEST(GeneratePatch, empty_diff_gives_empty_patch) {
    EXPECT_TRUE(jt::generate_patch({}).empty());
    EXPECT_EQ(generated(R"({"a":1})", R"({"a":1})"), "[]");
}

TEST(GeneratePatch, maps_each_kind) {
    EXPECT_EQ(generated(R"({"age":30,"gone":1})", R"({"age":31,"email":"e"})"),
              R"([{"op":"replace","path":"/age","value":31},)"
              R"({"op":"add","path":"/email","value":"e"},)"
              R"({"op":"remove","path":"/gone"}])");
}

TEST(GeneratePatch, uses_rfc6901_pointers) {
    EXPECT_EQ(generated(R"({"a/b":{"first name":1}})", R"({"a/b":{"first name":2}})"),
              R"([{"op":"replace","path":"/a~1b/first name","value":2}])");
}

TEST(GeneratePatch, explicit_null_sides_become_replace) {
    EXPECT_EQ(generated(R"({"a":null,"b":1})", R"({"a":1,"b":null})"),
              R"([{"op":"replace","path":"/a","value":1},)"
              R"({"op":"replace","path":"/b","value":null}])");
}

TEST(GeneratePatch, array_removals_run_back_to_front) {
    EXPECT_EQ(generated(R"({"a":[1,2,3,4]})", R"({"a":[1]})"),
              R"([{"op":"remove","path":"/a/3"},)"
              R"({"op":"remove","path":"/a/2"},)"
              R"({"op":"remove","path":"/a/1"}])");
}

TEST(GeneratePatch, array_additions_run_front_to_back) {
    EXPECT_EQ(generated("[1]", "[1,2,3]"),
              R"([{"op":"add","path":"/1","value":2},)"
              R"({"op":"add","path":"/2","value":3}])");
}

TEST(GeneratePatch, removal_runs_are_split_by_parent) {
    EXPECT_EQ(generated(R"({"a":[1,2,3],"b":[1,2,3]})", R"({"a":[1],"b":[1,2]})"),
              R"([{"op":"remove","path":"/a/2"},)"
              R"({"op":"remove","path":"/a/1"},)"
              R"({"op":"remove","path":"/b/2"}])");
}

TEST(GeneratePatch, same_and_type_changed_produce_nothing) {
    const auto records = std::vector{
        jt::DiffRecord{.kind = jt::DiffKind::same, .path = "$.a", .pointer = "/a",
                       .old_value = jt::Value{1}, .new_value = jt::Value{1}},
        jt::DiffRecord{.kind = jt::DiffKind::type_changed, .path = "$.b", .pointer = "/b",
                       .old_value = jt::Value{1}, .new_value = jt::Value{"1"}},
    };
    EXPECT_TRUE(jt::generate_patch(records).empty());
}

TEST(GeneratePatch, output_applies_to_old_tree) {
    const auto before = jt::parse(R"({"user":{"name":"John","tags":["a","b","c"],"meta":null}})");
    const auto after = jt::parse(R"({"user":{"name":"Jane","tags":["a"],"meta":{"v":1},"new":true}})");
    const auto ops = jt::generate_patch(jt::diff(before, after));
    EXPECT_EQ(jt::apply_patch(before, ops), after);
}

TEST(GeneratePatch, top_level_empty_key_is_refused) {
    const auto records = jt::diff(jt::parse(R"({"":1,"k":0})"), jt::parse(R"({"":2,"k":0})"));
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].pointer, "/");
    try {
        jt::generate_patch(records);
        FAIL() << "expected Exception";
    } catch (const jt::Exception& e) {
        EXPECT_EQ(e.kind(), jt::ErrorKind::invalid_path);
        EXPECT_EQ(e.error().path, "/");
    }
}

TEST(GeneratePatch, nested_empty_keys_round_trip) {
    const auto before = jt::parse(R"({"":{"":1,"a":[1,2]},"k":0})");
    const auto after = jt::parse(R"({"":{"":2,"a":[1]},"k":0})");
    const auto ops = jt::generate_patch(jt::diff(before, after));
    EXPECT_EQ(jt::apply_patch(before, ops), after);
}

TEST(GeneratePatch, root_change_is_still_allowed) {
    const auto ops = jt::generate_patch(jt::diff(jt::Value{1}, jt::Value{2}));
    ASSERT_EQ(ops.size(), 1u);
    EXPECT_EQ(ops[0].path, "");
    EXPECT_EQ(jt::apply_patch(jt::Value{1}, ops), jt::Value{2});
}
