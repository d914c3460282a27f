/// @file json.hpp
/// @brief nlohmann/json interoperability for jsontree-cpp.
///
/// Provides ADL serialization (to_json/from_json) between Value trees and
/// nlohmann::ordered_json, plus text parse/dump helpers. ordered_json keeps
/// object keys in document order, matching Object.

#pragma once

#include <jsontree-cpp/diff.hpp>
#include <jsontree-cpp/patch.hpp>
#include <jsontree-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace jsontree_cpp {

/// The JSON document type used at the text boundary.
using Json = nlohmann::ordered_json;

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(Json& j, const Value& v);
void from_json(const Json& j, Value& v);

void to_json(Json& j, const PatchOperation& op);
void from_json(const Json& j, PatchOperation& op);

/// {"kind": ..., "path": ..., "pointer": ..., "old": ..., "new": ...};
/// absent sides are omitted.
void to_json(Json& j, const DiffRecord& record);

// =============================================================================
// Text
// =============================================================================

/// The deepest nesting of arrays and objects parse() accepts.
inline constexpr int max_nesting_depth = 512;

/// Parse JSON text into a Value.
/// @throws Exception (invalid_json) with the parser's message, or if
///         containers nest deeper than max_nesting_depth.
auto parse(std::string_view text) -> Value;

/// Serialize a Value. indent < 0 produces compact output.
auto dump(const Value& value, int indent = -1) -> std::string;

/// Parse a patch document from JSON text.
/// @throws Exception (invalid_json) or PatchError (invalid_patch).
auto parse_patch_json(std::string_view text) -> std::vector<PatchOperation>;

/// Write the compact serialization of a Value.
auto operator<<(std::ostream& os, const Value& value) -> std::ostream&;

}  // namespace jsontree_cpp
