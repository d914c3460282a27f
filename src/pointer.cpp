#include <jsontree-cpp/pointer.hpp>
#include <jsontree-cpp/error.hpp>

#include <algorithm>
#include <charconv>
#include <system_error>

namespace jsontree_cpp {

// =============================================================================
// Parsing
// =============================================================================

auto Pointer::parse(std::string_view text) -> Pointer {
    if (text.empty() || text == "/") return Pointer{};
    if (text[0] != '/') {
        throw Exception{ErrorKind::invalid_path,
                        "pointer must start with '/' or be empty", std::string{text}};
    }
    auto tokens = std::vector<std::string>{};
    auto pos = std::size_t{1};
    while (true) {
        auto next = text.find('/', pos);
        auto segment = text.substr(pos, next == std::string_view::npos ? next : next - pos);
        try {
            tokens.push_back(unescape_token(segment));
        } catch (const Exception& e) {
            throw Exception{e.kind(), e.error().message, std::string{text}};
        }
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return Pointer{std::move(tokens)};
}

auto Pointer::parent() const -> Pointer {
    if (tokens_.empty()) return {};
    return Pointer{std::vector<std::string>{tokens_.begin(), tokens_.end() - 1}};
}

auto Pointer::is_prefix_of(const Pointer& other) const -> bool {
    if (tokens_.size() > other.tokens_.size()) return false;
    return std::equal(tokens_.begin(), tokens_.end(), other.tokens_.begin());
}

auto Pointer::to_string() const -> std::string {
    auto result = std::string{};
    for (const auto& token : tokens_) {
        result.push_back('/');
        result += escape_token(token);
    }
    return result;
}

auto escape_token(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (auto c : token) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result.push_back(c);
        }
    }
    return result;
}

auto unescape_token(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    // Single left-to-right pass, so "~01" becomes "~1" and not "/".
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] != '~') {
            result.push_back(token[i]);
            continue;
        }
        if (i + 1 < token.size() && token[i + 1] == '0') {
            result.push_back('~');
        } else if (i + 1 < token.size() && token[i + 1] == '1') {
            result.push_back('/');
        } else {
            throw Exception{ErrorKind::invalid_path,
                            "'~' must be followed by '0' or '1' in '" + std::string{token} + "'"};
        }
        ++i;
    }
    return result;
}

auto is_array_index(std::string_view token) -> bool {
    if (token == "-") return true;
    if (token.empty()) return false;
    if (token.size() > 1 && token[0] == '0') return false;
    return std::ranges::all_of(token, [](char c) { return c >= '0' && c <= '9'; });
}

auto parse_array_index(std::string_view token, std::size_t size,
                       const Pointer& where) -> std::size_t {
    if (token == "-") return size;
    if (!is_array_index(token)) {
        throw Exception{ErrorKind::invalid_index,
                        "'" + std::string{token} + "' is not an array index",
                        where.to_string()};
    }
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec == std::errc::result_out_of_range) {
        throw Exception{ErrorKind::index_out_of_range,
                        "index " + std::string{token} + " is out of range",
                        where.to_string()};
    }
    return result;
}

// =============================================================================
// Resolution
// =============================================================================

namespace {

/// Step from node into the child named by the token at position depth.
/// Throws with the pointer prefix up to and including the failing segment.
template <typename V>
auto child_at(V& node, const Pointer& pointer, std::size_t depth) -> V& {
    const auto& token = pointer.tokens()[depth];
    auto where = [&] {
        return Pointer{std::vector<std::string>{
            pointer.tokens().begin(),
            pointer.tokens().begin() + static_cast<std::ptrdiff_t>(depth) + 1}};
    };
    if (auto* obj = node.template get_if<Object>()) {
        auto* child = obj->find(token);
        if (!child) {
            throw Exception{ErrorKind::path_not_found,
                            "no member '" + token + "'", where().to_string()};
        }
        return *child;
    }
    if (auto* arr = node.template get_if<Array>()) {
        auto index = parse_array_index(token, arr->size(), where());
        if (index >= arr->size()) {
            throw Exception{ErrorKind::index_out_of_range,
                            "index " + token + " is out of range for array of size " +
                                std::to_string(arr->size()),
                            where().to_string()};
        }
        return (*arr)[index];
    }
    throw Exception{ErrorKind::invalid_type,
                    "cannot address '" + token + "' inside a " +
                        std::string{to_string_view(node.type())},
                    where().to_string()};
}

template <typename V>
auto get_impl(V& root, const Pointer& pointer) -> V& {
    auto* current = &root;
    for (std::size_t i = 0; i < pointer.size(); ++i) {
        current = &child_at(*current, pointer, i);
    }
    return *current;
}

template <typename V>
auto find_impl(V& root, const Pointer& pointer) -> V* {
    auto* current = &root;
    for (const auto& token : pointer.tokens()) {
        if (auto* obj = current->template get_if<Object>()) {
            current = obj->find(token);
            if (!current) return nullptr;
        } else if (auto* arr = current->template get_if<Array>()) {
            if (token == "-" || !is_array_index(token)) return nullptr;
            auto index = std::size_t{0};
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), index);
            if (ec != std::errc{} || index >= arr->size()) return nullptr;
            current = &(*arr)[index];
        } else {
            return nullptr;
        }
    }
    return current;
}

}  // anonymous namespace

auto find(const Value& root, const Pointer& pointer) -> const Value* {
    return find_impl(root, pointer);
}

auto find(Value& root, const Pointer& pointer) -> Value* {
    return find_impl(root, pointer);
}

auto get(const Value& root, const Pointer& pointer) -> const Value& {
    return get_impl(root, pointer);
}

auto get(Value& root, const Pointer& pointer) -> Value& {
    return get_impl(root, pointer);
}

auto resolve_parent(Value& root, const Pointer& pointer) -> Value& {
    auto& parent = get(root, pointer.parent());
    if (!parent.is_container()) {
        throw Exception{ErrorKind::invalid_type,
                        "cannot address '" + pointer.back() + "' inside a " +
                            std::string{to_string_view(parent.type())},
                        pointer.to_string()};
    }
    return parent;
}

}  // namespace jsontree_cpp
