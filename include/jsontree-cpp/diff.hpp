/// @file diff.hpp
/// @brief Structural comparison of two Value trees.

#pragma once

#include <jsontree-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsontree_cpp {

/// The kind of difference a DiffRecord reports.
enum class DiffKind : std::uint8_t {
    added,         ///< A value exists only in the new tree (or was null).
    removed,       ///< A value exists only in the old tree (or became null).
    modified,      ///< A scalar changed value without changing type.
    same,          ///< Unchanged leaf; only reported with include_same.
    type_changed,  ///< The value changed type. Not recursed into.
};

/// Convert a DiffKind to its string representation.
constexpr auto to_string_view(DiffKind kind) noexcept -> std::string_view {
    switch (kind) {
        case DiffKind::added:        return "added";
        case DiffKind::removed:      return "removed";
        case DiffKind::modified:     return "modified";
        case DiffKind::same:         return "same";
        case DiffKind::type_changed: return "type_changed";
    }
    return "unknown";
}

/// Options controlling diff().
struct DiffOptions {
    bool ignore_case{false};        ///< Fold A-Z to a-z before comparing. Non-ASCII letters are not folded.
    bool ignore_whitespace{false};  ///< Drop all whitespace from strings before comparing.
    bool ignore_order{false};       ///< Match array elements as a multiset.
    bool include_same{false};       ///< Report unchanged leaves as DiffKind::same.
    std::size_t max_depth{0};       ///< Stop recursing past this depth. 0 = unlimited.

    auto operator==(const DiffOptions&) const -> bool = default;
};

/// One reported difference at one location.
///
/// A side that has no value at the location is nullopt; a side holding an
/// explicit JSON null is an engaged Null. Added records never carry a
/// non-null old value and removed records never carry a non-null new value.
struct DiffRecord {
    DiffKind kind;                    ///< What happened.
    std::string path;                 ///< Location as "$.a[0]['b c']".
    std::string pointer;              ///< Same location as "/a/0/b c".
    std::optional<Value> old_value;   ///< Value in the old tree.
    std::optional<Value> new_value;   ///< Value in the new tree.

    auto operator==(const DiffRecord&) const -> bool = default;
};

/// Compare two trees and list their differences.
///
/// Object keys are visited in sorted order and array elements in index
/// order, so the result is deterministic for a given input and options.
/// @code
/// auto records = diff(parse(R"({"age":30})"), parse(R"({"age":31,"email":"e"})"));
/// // records[0]: modified $.age, records[1]: added $.email
/// @endcode
auto diff(const Value& before, const Value& after,
          const DiffOptions& options = {}) -> std::vector<DiffRecord>;

/// Structural equality under the string folding options of diff().
/// With default options this is operator==.
auto equivalent(const Value& a, const Value& b, const DiffOptions& options) -> bool;

/// The "$"-rooted display form of a key step: ".key" or "['key']".
auto key_path_segment(std::string_view key) -> std::string;

/// A one-line description, e.g. "modified: $.age = 30 -> 31".
auto to_string(const DiffRecord& record) -> std::string;

}  // namespace jsontree_cpp
