/// @file pointer.hpp
/// @brief JSON Pointer parsing and resolution against a Value tree.
///
/// Grammar (RFC 6901 with one extension):
///   ""        -> root
///   "/"       -> root (not the empty-string key)
///   "/a/b/0"  -> tokens ["a", "b", "0"]
///   "/a~1b"   -> key "a/b"   (~1 = /, ~0 = ~)
///   "/list/-" -> append position of "list" (add only)

#pragma once

#include <jsontree-cpp/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsontree_cpp {

/// A parsed pointer: a sequence of unescaped reference tokens.
///
/// Whether a token is an object key or an array index is decided by the
/// container it is applied to, so tokens are kept as strings.
class Pointer {
public:
    /// The root pointer (no tokens).
    Pointer() = default;

    explicit Pointer(std::vector<std::string> tokens) : tokens_{std::move(tokens)} {}

    /// Parse a pointer string.
    /// @throws Exception (invalid_path) on a missing leading '/' or a bad '~' escape.
    static auto parse(std::string_view text) -> Pointer;

    auto tokens() const noexcept -> const std::vector<std::string>& { return tokens_; }
    auto size() const noexcept -> std::size_t { return tokens_.size(); }
    auto is_root() const noexcept -> bool { return tokens_.empty(); }

    /// The final token. Must not be called on the root pointer.
    auto back() const -> const std::string& { return tokens_.back(); }

    /// The pointer to the containing node. The parent of root is root.
    auto parent() const -> Pointer;

    /// True if this pointer equals other or addresses one of its ancestors.
    auto is_prefix_of(const Pointer& other) const -> bool;

    /// Serialize back to pointer syntax, escaping '~' and '/'.
    auto to_string() const -> std::string;

    /// Append one (unescaped) token.
    friend auto operator/(Pointer p, std::string token) -> Pointer {
        p.tokens_.push_back(std::move(token));
        return p;
    }

    auto operator==(const Pointer&) const -> bool = default;

private:
    std::vector<std::string> tokens_;
};

/// Escape a reference token: '~' -> "~0", '/' -> "~1".
auto escape_token(std::string_view token) -> std::string;

/// Unescape a reference token: "~1" -> '/', "~0" -> '~'.
/// @throws Exception (invalid_path) if '~' is not followed by '0' or '1'.
auto unescape_token(std::string_view token) -> std::string;

/// True if the token is "-" or matches ^(0|[1-9][0-9]*)$.
auto is_array_index(std::string_view token) -> bool;

/// Interpret a token as an index into an array of the given size.
/// The append marker "-" yields size. No bounds check is performed
/// otherwise; callers decide whether size itself is acceptable.
/// @throws Exception (invalid_index) if the token is not an index,
///         (index_out_of_range) if the number does not fit in size_t.
auto parse_array_index(std::string_view token, std::size_t size,
                       const Pointer& where = {}) -> std::size_t;

/// Find the node a pointer addresses, or nullptr if any segment is missing
/// or cannot be applied.
auto find(const Value& root, const Pointer& pointer) -> const Value*;
auto find(Value& root, const Pointer& pointer) -> Value*;

/// Get the node a pointer addresses.
/// @throws Exception with path_not_found, invalid_index, index_out_of_range
///         or invalid_type naming the failing segment.
auto get(const Value& root, const Pointer& pointer) -> const Value&;
auto get(Value& root, const Pointer& pointer) -> Value&;

/// Get the container that holds the final token of a non-root pointer.
/// Every intermediate segment must already exist; nothing is created.
/// @throws Exception as for get(), or invalid_type if the parent is a scalar.
auto resolve_parent(Value& root, const Pointer& pointer) -> Value&;

}  // namespace jsontree_cpp
