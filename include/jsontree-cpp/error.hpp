/// @file error.hpp
/// @brief Error types for the jsontree-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsontree_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_patch,       ///< Malformed patch document or unknown operation.
    invalid_path,        ///< Malformed pointer syntax.
    path_not_found,      ///< A required path segment does not exist.
    index_out_of_range,  ///< A numeric array segment is beyond the bounds.
    invalid_index,       ///< An array segment is not a valid index.
    invalid_type,        ///< A segment addresses into a scalar value.
    test_failed,         ///< A test operation's equality check failed.
    operation_failed,    ///< Generic failure of an operation.
    invalid_json,        ///< JSON text could not be parsed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_patch:      return "invalid_patch";
        case ErrorKind::invalid_path:       return "invalid_path";
        case ErrorKind::path_not_found:     return "path_not_found";
        case ErrorKind::index_out_of_range: return "index_out_of_range";
        case ErrorKind::invalid_index:      return "invalid_index";
        case ErrorKind::invalid_type:       return "invalid_type";
        case ErrorKind::test_failed:        return "test_failed";
        case ErrorKind::operation_failed:   return "operation_failed";
        case ErrorKind::invalid_json:       return "invalid_json";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.
    std::string path;    ///< The pointer the error refers to, if any.

    /// Construct an Error with the given kind, message and optional path.
    Error(ErrorKind k, std::string msg, std::string p = {})
        : kind{k}, message{std::move(msg)}, path{std::move(p)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Render an error as "<kind>: <message> (path: <path>)".
auto to_string(const Error& error) -> std::string;

/// The exception thrown by every failing library operation.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error);

    /// Construct from the parts of an Error.
    Exception(ErrorKind kind, std::string message, std::string path = {});

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

protected:
    Exception(Error error, const std::string& what_arg);

private:
    Error error_;
};

}  // namespace jsontree_cpp
