/// @file value.hpp
/// @brief The JSON value tree: Null, Value, Array, Object, and ValueType.

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsontree_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator==(const Null&) const -> bool = default;
};

/// The six kinds of JSON value. The order matches Value::Storage.
enum class ValueType : std::uint8_t {
    null,
    boolean,
    number,
    string,
    array,
    object,
};

/// Convert a ValueType to its string representation.
constexpr auto to_string_view(ValueType type) noexcept -> std::string_view {
    switch (type) {
        case ValueType::null:    return "null";
        case ValueType::boolean: return "boolean";
        case ValueType::number:  return "number";
        case ValueType::string:  return "string";
        case ValueType::array:   return "array";
        case ValueType::object:  return "object";
    }
    return "unknown";
}

class Value;
struct Member;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// A mapping of unique string keys to values that remembers insertion order.
///
/// Lookup is linear in the number of members. Overwriting an existing key
/// keeps its position; new keys are appended. Equality ignores order.
class Object {
public:
    using iterator = std::vector<Member>::iterator;
    using const_iterator = std::vector<Member>::const_iterator;

    Object() = default;

    /// Construct from key/value pairs. Later duplicates overwrite earlier ones.
    Object(std::initializer_list<Member> members);

    auto size() const noexcept -> std::size_t;
    auto empty() const noexcept -> bool;

    auto contains(std::string_view key) const -> bool;

    /// Get the value at a key, or nullptr if the key is absent.
    auto find(std::string_view key) -> Value*;
    auto find(std::string_view key) const -> const Value*;

    /// Get the value at a key.
    /// @throws Exception (path_not_found) if the key is absent.
    auto at(std::string_view key) -> Value&;
    auto at(std::string_view key) const -> const Value&;

    /// Insert or overwrite a key. Returns the stored value.
    auto set(std::string key, Value value) -> Value&;

    /// Remove a key. Returns false if the key was absent.
    auto erase(std::string_view key) -> bool;

    /// All keys in insertion order.
    auto keys() const -> std::vector<std::string>;

    auto begin() noexcept -> iterator;
    auto end() noexcept -> iterator;
    auto begin() const noexcept -> const_iterator;
    auto end() const noexcept -> const_iterator;

    /// Same key set and equal values per key, regardless of order.
    friend auto operator==(const Object& a, const Object& b) -> bool;

private:
    std::vector<Member> members_;
};

/// A JSON value: a closed sum over the six JSON variants.
///
/// Arrays and objects own their children, so copying a Value is a deep
/// copy and the tree can never share nodes or form cycles. Numbers are
/// stored as double.
///
/// @code
/// auto doc = Value{Object{{"name", "John"}, {"tags", Array{"a", "b"}}}};
/// doc.as_object().set("age", 30);
/// @endcode
class Value {
public:
    using Storage = std::variant<Null, bool, double, std::string, Array, Object>;

    /// Construct a null value.
    Value() = default;

    Value(Null) noexcept {}
    Value(std::nullptr_t) noexcept {}
    Value(bool b) : storage_{b} {}

    /// Any non-bool arithmetic type is stored as a double.
    template <typename T>
        requires (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
    Value(T number) : storage_{static_cast<double>(number)} {}

    Value(const char* s) : storage_{std::string{s}} {}
    Value(std::string s) : storage_{std::move(s)} {}
    Value(Array a) : storage_{std::move(a)} {}
    Value(Object o);

    auto type() const noexcept -> ValueType {
        return static_cast<ValueType>(storage_.index());
    }

    auto is_null() const noexcept -> bool { return type() == ValueType::null; }
    auto is_bool() const noexcept -> bool { return type() == ValueType::boolean; }
    auto is_number() const noexcept -> bool { return type() == ValueType::number; }
    auto is_string() const noexcept -> bool { return type() == ValueType::string; }
    auto is_array() const noexcept -> bool { return type() == ValueType::array; }
    auto is_object() const noexcept -> bool { return type() == ValueType::object; }

    /// True for arrays and objects.
    auto is_container() const noexcept -> bool { return is_array() || is_object(); }

    /// Get the alternative T, or nullptr on type mismatch.
    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&storage_); }

    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&storage_); }

    // -- Typed access (throws Exception with invalid_type on mismatch) --------

    auto as_bool() const -> bool;
    auto as_number() const -> double;
    auto as_string() const -> const std::string&;
    auto as_array() -> Array&;
    auto as_array() const -> const Array&;
    auto as_object() -> Object&;
    auto as_object() const -> const Object&;

    /// The underlying variant, for std::visit.
    auto storage() noexcept -> Storage& { return storage_; }
    auto storage() const noexcept -> const Storage& { return storage_; }

    /// Deep structural equality. Arrays compare in order, objects by key set.
    friend auto operator==(const Value& a, const Value& b) -> bool;

private:
    Storage storage_;
};

/// One key/value entry of an Object.
struct Member {
    std::string key;
    Value value;
};

inline Value::Value(Object o) : storage_{std::move(o)} {}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Object& o) { ... },
///     [](const Array& a) { ... },
///     [](const auto&) { ... },
/// }, value.storage());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsontree_cpp
