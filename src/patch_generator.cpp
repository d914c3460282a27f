#include <jsontree-cpp/error.hpp>
#include <jsontree-cpp/patch.hpp>
#include <jsontree-cpp/pointer.hpp>

#include <algorithm>
#include <charconv>
#include <functional>
#include <utility>

namespace jsontree_cpp {

namespace {

auto index_of(const Pointer& p) -> std::optional<std::size_t> {
    if (p.is_root() || p.back() == "-" || !is_array_index(p.back())) return std::nullopt;
    auto result = std::size_t{0};
    const auto& token = p.back();
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec != std::errc{}) return std::nullopt;
    return result;
}

auto is_plain_removal(const DiffRecord& r) -> bool {
    return r.kind == DiffKind::removed && !r.new_value;
}

// "/" parses as the root, so the member at the top-level "" key has no
// pointer of its own.
void require_addressable(const DiffRecord& r) {
    if (r.path != "$" && Pointer::parse(r.pointer).is_root()) {
        throw Exception{ErrorKind::invalid_path,
                        "no pointer addresses " + r.path + " apart from the root",
                        r.pointer};
    }
}

auto translate(const DiffRecord& r) -> std::optional<PatchOperation> {
    if (r.kind == DiffKind::same || r.kind == DiffKind::type_changed) return std::nullopt;
    require_addressable(r);
    switch (r.kind) {
        case DiffKind::added:
            // The slot already exists when the old side is an explicit null.
            if (r.old_value) {
                return PatchOperation{.op = OpType::replace, .path = r.pointer, .value = r.new_value};
            }
            return PatchOperation{.op = OpType::add, .path = r.pointer, .value = r.new_value};
        case DiffKind::removed:
            if (r.new_value) {
                return PatchOperation{.op = OpType::replace, .path = r.pointer, .value = Value{}};
            }
            return PatchOperation{.op = OpType::remove, .path = r.pointer};
        case DiffKind::modified:
            return PatchOperation{.op = OpType::replace, .path = r.pointer, .value = r.new_value};
        case DiffKind::same:
        case DiffKind::type_changed:
            return std::nullopt;
    }
    return std::nullopt;
}

}  // anonymous namespace

auto generate_patch(std::span<const DiffRecord> records) -> std::vector<PatchOperation> {
    auto operations = std::vector<PatchOperation>{};
    operations.reserve(records.size());

    std::size_t i = 0;
    while (i < records.size()) {
        // Collect a run of element removals sharing one parent so they can
        // be emitted back to front; earlier removals would shift later indices.
        if (is_plain_removal(records[i])) {
            const auto first = Pointer::parse(records[i].pointer);
            if (index_of(first)) {
                const auto parent = first.parent();
                auto run = std::vector<std::pair<std::size_t, const DiffRecord*>>{};
                auto j = i;
                while (j < records.size() && is_plain_removal(records[j])) {
                    auto p = Pointer::parse(records[j].pointer);
                    auto idx = index_of(p);
                    if (!idx || p.parent() != parent) break;
                    run.emplace_back(*idx, &records[j]);
                    ++j;
                }
                std::ranges::sort(run, std::greater{}, &std::pair<std::size_t, const DiffRecord*>::first);
                for (const auto& [idx, record] : run) {
                    operations.push_back(PatchOperation{.op = OpType::remove, .path = record->pointer});
                }
                i = j;
                continue;
            }
        }
        if (auto op = translate(records[i])) operations.push_back(std::move(*op));
        ++i;
    }
    return operations;
}

}  // namespace jsontree_cpp
