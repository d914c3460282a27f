#include <jsontree-cpp/error.hpp>

#include <utility>

namespace jsontree_cpp {

auto to_string(const Error& error) -> std::string {
    auto result = std::string{to_string_view(error.kind)};
    result += ": ";
    result += error.message;
    if (!error.path.empty()) {
        result += " (path: ";
        result += error.path;
        result += ')';
    }
    return result;
}

Exception::Exception(Error error)
    : std::runtime_error{to_string(error)}, error_{std::move(error)} {}

Exception::Exception(ErrorKind kind, std::string message, std::string path)
    : Exception{Error{kind, std::move(message), std::move(path)}} {}

Exception::Exception(Error error, const std::string& what_arg)
    : std::runtime_error{what_arg}, error_{std::move(error)} {}

}  // namespace jsontree_cpp
