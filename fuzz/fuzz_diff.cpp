// Fuzz target for diff() and generate_patch() - splits the input into two
// JSON documents on the first newline and checks that the generated patch
// reproduces the second.

#include <jsontree-cpp/diff.hpp>
#include <jsontree-cpp/json.hpp>
#include <jsontree-cpp/patch.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view(reinterpret_cast<const char*>(data), size);
    const auto split = input.find('\n');
    if (split == std::string_view::npos) return 0;

    try {
        const auto before = jsontree_cpp::parse(input.substr(0, split));
        const auto after = jsontree_cpp::parse(input.substr(split + 1));

        if (!jsontree_cpp::diff(before, before).empty()) std::abort();

        const auto records = jsontree_cpp::diff(before, after);
        // type_changed records carry no operation
        for (const auto& r : records) {
            if (r.kind == jsontree_cpp::DiffKind::type_changed) return 0;
        }
        const auto ops = jsontree_cpp::generate_patch(records);
        if (jsontree_cpp::apply_patch(before, ops) != after) std::abort();
    } catch (const jsontree_cpp::Exception& e) {
        // Invalid JSON is expected, as is a change under the top-level ""
        // key, which generate_patch() refuses. Anything else is a bug.
        if (e.kind() != jsontree_cpp::ErrorKind::invalid_json &&
            e.kind() != jsontree_cpp::ErrorKind::invalid_path) {
            std::abort();
        }
    }
    return 0;
}
