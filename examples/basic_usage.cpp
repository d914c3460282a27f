// basic_usage - demonstrates core jsontree-cpp API
//
// Shows building Value trees in code and from JSON text, typed access,
// Pointer lookups, and applying a hand-written patch.
//
// Build: cmake --build build -DJSONTREE_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/basic_usage

#include <jsontree-cpp/jsontree.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace jt = jsontree_cpp;

int main() {
    // -- Build a document in code ---------------------------------------------
    auto profile = jt::Object{};
    profile.set("name", "John");
    profile.set("age", 30);
    profile.set("tags", jt::Array{"admin", "ops"});
    auto doc = jt::Value{profile};

    std::printf("document: %s\n", jt::dump(doc).c_str());

    // -- Typed access -------------------------------------------------------------
    const auto& obj = doc.as_object();
    std::printf("name = %s, age = %g\n",
                obj.at("name").as_string().c_str(), obj.at("age").as_number());

    // -- Pointer lookups ------------------------------------------------------------
    const auto& first_tag = jt::get(doc, jt::Pointer::parse("/tags/0"));
    std::printf("/tags/0 = %s\n", first_tag.as_string().c_str());

    if (jt::find(doc, jt::Pointer::parse("/email")) == nullptr) {
        std::printf("/email is not set\n");
    }

    // -- Apply a patch ----------------------------------------------------------------
    const auto ops = std::vector{
        jt::PatchOperation{.op = jt::OpType::add, .path = "/email", .value = jt::Value{"j@x.com"}},
        jt::PatchOperation{.op = jt::OpType::remove, .path = "/age"},
        jt::PatchOperation{.op = jt::OpType::replace, .path = "/name", .value = jt::Value{"Jane"}},
        jt::PatchOperation{.op = jt::OpType::add, .path = "/tags/-", .value = jt::Value{"dev"}},
    };
    auto patched = jt::apply_patch(doc, ops);
    std::printf("patched:  %s\n", jt::dump(patched).c_str());

    // -- Failures leave the input alone ---------------------------------------------
    const auto bad = jt::parse_patch_json(R"([
        {"op":"add","path":"/nickname","value":"JJ"},
        {"op":"add","path":"/y/z","value":1}
    ])");
    try {
        jt::apply_patch_in_place(patched, bad);
    } catch (const jt::PatchError& e) {
        std::printf("rejected: %s\n", e.what());
        std::printf("unchanged: %s\n", jt::dump(patched).c_str());
    }

    return 0;
}
