// Fuzz target for Pointer::parse() and resolution - any input either parses
// or throws a library Exception, and a parsed pointer prints back unchanged.

#include <jsontree-cpp/json.hpp>
#include <jsontree-cpp/pointer.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const auto doc = jsontree_cpp::parse(
        R"({"a":{"b":[1,2,{"c":null}]},"a/b":true,"m~n":"x","":{"":0}})");

    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);
    try {
        const auto pointer = jsontree_cpp::Pointer::parse(text);
        // "/" is the root and prints as ""; everything else is canonical
        if (text != "/" && pointer.to_string() != text) std::abort();
        if (jsontree_cpp::Pointer::parse(pointer.to_string()) != pointer) std::abort();

        const auto* found = jsontree_cpp::find(doc, pointer);
        auto resolved = found != nullptr;
        try {
            (void)jsontree_cpp::get(doc, pointer);
        } catch (const jsontree_cpp::Exception&) {
            resolved = false;
        }
        // find() and get() must agree on what exists
        if (resolved != (found != nullptr)) std::abort();
    } catch (const jsontree_cpp::Exception&) {
        // Malformed pointers are expected
    }
    return 0;
}
