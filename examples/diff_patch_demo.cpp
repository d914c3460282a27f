// diff_patch_demo - compare two documents and turn the result into a patch
//
// Demonstrates:
//   - Diffing two JSON documents with and without options
//   - Exporting diff records and patches via nlohmann/json
//   - Generating a patch from a diff and applying it to reproduce the new
//     document
//
// Build: cmake --build build -DJSONTREE_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/diff_patch_demo

#include <jsontree-cpp/jsontree.hpp>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace jt = jsontree_cpp;

int main() {
    const auto before = jt::parse(R"({
        "name": "John",
        "age": 30,
        "roles": ["admin", "ops", "dev"],
        "settings": {"theme": "Dark", "beta": null}
    })");
    const auto after = jt::parse(R"({
        "name": "John",
        "age": 31,
        "email": "john@example.com",
        "roles": ["dev", "admin"],
        "settings": {"theme": "dark", "beta": true}
    })");

    // =========================================================================
    // Plain diff
    // =========================================================================
    const auto records = jt::diff(before, after);
    std::printf("-- diff (%zu records) --\n", records.size());
    for (const auto& r : records) {
        std::printf("  %s\n", jt::to_string(r).c_str());
    }

    // =========================================================================
    // Diff with options
    // =========================================================================
    const auto options = jt::DiffOptions{.ignore_case = true, .ignore_order = true};
    const auto relaxed = jt::diff(before, after, options);
    std::printf("\n-- diff, ignoring case and array order (%zu records) --\n", relaxed.size());
    for (const auto& r : relaxed) {
        std::printf("  %s\n", jt::to_string(r).c_str());
    }

    // =========================================================================
    // Records as JSON
    // =========================================================================
    auto records_json = jt::Json::array();
    for (const auto& r : records) records_json.push_back(jt::Json(r));
    std::printf("\n-- records as JSON --\n%s\n", records_json.dump(2).c_str());

    // =========================================================================
    // Generate and apply
    // =========================================================================
    const auto ops = jt::generate_patch(records);
    std::printf("\n-- generated patch --\n%s\n", jt::dump(jt::to_value(ops), 2).c_str());

    const auto result = jt::apply_patch(before, ops);
    std::printf("\nresult matches new document: %s\n", result == after ? "yes" : "no");

    return 0;
}
