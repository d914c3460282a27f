/// @file patch.hpp
/// @brief Edit operations (add/remove/replace/move/copy/test), the engine
/// that applies them, and the generator that derives them from a diff.

#pragma once

#include <jsontree-cpp/diff.hpp>
#include <jsontree-cpp/error.hpp>
#include <jsontree-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace jsontree_cpp {

/// The six edit operations.
enum class OpType : std::uint8_t {
    add,
    remove,
    replace,
    move,
    copy,
    test,
};

/// Convert an OpType to its wire name.
constexpr auto to_string_view(OpType op) noexcept -> std::string_view {
    switch (op) {
        case OpType::add:     return "add";
        case OpType::remove:  return "remove";
        case OpType::replace: return "replace";
        case OpType::move:    return "move";
        case OpType::copy:    return "copy";
        case OpType::test:    return "test";
    }
    return "unknown";
}

/// Parse a wire name, or nullopt if it names no operation.
auto parse_op_type(std::string_view name) -> std::optional<OpType>;

/// One edit instruction.
///
/// `value` is required for add/replace/test and `from` for move/copy;
/// apply_patch() reports a missing one as invalid_patch.
///
/// @code
/// auto op = PatchOperation{.op = OpType::add, .path = "/email", .value = Value{"a@b.com"}};
/// @endcode
struct PatchOperation {
    OpType op{OpType::add};
    std::string path;
    std::optional<Value> value;
    std::optional<std::string> from;

    auto operator==(const PatchOperation&) const -> bool = default;
};

/// A patch that failed at one operation.
///
/// Carries the zero-based index and a copy of the failing operation in
/// addition to the underlying Error.
class PatchError : public Exception {
public:
    PatchError(std::size_t index, PatchOperation operation, Error error);

    auto index() const noexcept -> std::size_t { return index_; }
    auto operation() const noexcept -> const PatchOperation& { return operation_; }

private:
    std::size_t index_;
    PatchOperation operation_;
};

// =============================================================================
// Patch documents
// =============================================================================

/// Read a patch document (a JSON array of operation objects).
/// @throws PatchError (invalid_patch) naming the first malformed entry,
///         or Exception (invalid_patch) if the document is not an array.
auto parse_patch(const Value& document) -> std::vector<PatchOperation>;

/// The wire form of one operation.
auto to_value(const PatchOperation& op) -> Value;

/// The wire form of a patch document.
auto to_value(std::span<const PatchOperation> operations) -> Value;

// =============================================================================
// Applying
// =============================================================================

/// Apply one operation to a document in place.
///
/// On failure the document may be left partially modified (for example
/// after the remove half of a replace). Use apply_patch() for atomicity.
/// @throws Exception describing why the operation failed.
void apply_operation(Value& document, const PatchOperation& op);

/// Apply operations in order to a copy of the document and return it.
///
/// All or nothing: the first failing operation aborts the whole call and
/// the input is never modified.
/// @throws PatchError identifying the failing operation.
auto apply_patch(const Value& document,
                 std::span<const PatchOperation> operations) -> Value;

/// Parse a patch document and apply it.
auto apply_patch(const Value& document, const Value& patch_document) -> Value;

/// Apply operations to a document in place with the strong guarantee:
/// on failure the document is unchanged.
void apply_patch_in_place(Value& document, std::span<const PatchOperation> operations);

// =============================================================================
// Generating
// =============================================================================

/// Turn diff records into operations that transform the old tree into
/// the new one.
///
/// added -> add, removed -> remove, modified -> replace. An added record
/// over an explicit null and a removed record leaving an explicit null
/// become replace. Consecutive removals of array elements under one parent
/// are emitted highest index first. same and type_changed records are
/// informational and produce nothing.
/// @throws Exception (invalid_path) for a change under the top-level ""
///         key, whose pointer "/" would address the root instead.
auto generate_patch(std::span<const DiffRecord> records) -> std::vector<PatchOperation>;

}  // namespace jsontree_cpp
