// Fuzz target for patch documents - parses the input as a patch, applies it
// to a fixed document, and checks the all-or-nothing guarantee.

#include <jsontree-cpp/json.hpp>
#include <jsontree-cpp/patch.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const auto original = jsontree_cpp::parse(
        R"({"name":"x","list":[1,2,3],"nested":{"a":{"b":null}},"flag":false})");

    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);
    auto doc = original;
    try {
        const auto ops = jsontree_cpp::parse_patch_json(text);
        jsontree_cpp::apply_patch_in_place(doc, ops);
        // Round-trip: a successful result must serialize
        (void)jsontree_cpp::dump(doc);
    } catch (const jsontree_cpp::Exception&) {
        if (doc != original) std::abort();
    }
    return 0;
}
