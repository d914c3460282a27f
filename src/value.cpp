#include <jsontree-cpp/value.hpp>
#include <jsontree-cpp/error.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace jsontree_cpp {

static_assert(std::variant_size_v<Value::Storage> == 6);
static_assert(std::is_same_v<std::variant_alternative_t<
    static_cast<std::size_t>(ValueType::object), Value::Storage>, Object>);

// -- Object -------------------------------------------------------------------

Object::Object(std::initializer_list<Member> members) {
    members_.reserve(members.size());
    for (const auto& m : members) {
        set(m.key, m.value);
    }
}

auto Object::size() const noexcept -> std::size_t { return members_.size(); }

auto Object::empty() const noexcept -> bool { return members_.empty(); }

auto Object::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto Object::find(std::string_view key) -> Value* {
    auto it = std::ranges::find(members_, key, &Member::key);
    return it == members_.end() ? nullptr : &it->value;
}

auto Object::find(std::string_view key) const -> const Value* {
    auto it = std::ranges::find(members_, key, &Member::key);
    return it == members_.end() ? nullptr : &it->value;
}

auto Object::at(std::string_view key) -> Value& {
    if (auto* v = find(key)) return *v;
    throw Exception{ErrorKind::path_not_found, "no member '" + std::string{key} + "'"};
}

auto Object::at(std::string_view key) const -> const Value& {
    if (const auto* v = find(key)) return *v;
    throw Exception{ErrorKind::path_not_found, "no member '" + std::string{key} + "'"};
}

auto Object::set(std::string key, Value value) -> Value& {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    members_.push_back(Member{std::move(key), std::move(value)});
    return members_.back().value;
}

auto Object::erase(std::string_view key) -> bool {
    auto it = std::ranges::find(members_, key, &Member::key);
    if (it == members_.end()) return false;
    members_.erase(it);
    return true;
}

auto Object::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(members_.size());
    for (const auto& m : members_) result.push_back(m.key);
    return result;
}

auto Object::begin() noexcept -> iterator { return members_.begin(); }
auto Object::end() noexcept -> iterator { return members_.end(); }
auto Object::begin() const noexcept -> const_iterator { return members_.begin(); }
auto Object::end() const noexcept -> const_iterator { return members_.end(); }

auto operator==(const Object& a, const Object& b) -> bool {
    if (a.size() != b.size()) return false;
    return std::ranges::all_of(a.members_, [&](const Member& m) {
        const auto* other = b.find(m.key);
        return other && *other == m.value;
    });
}

// -- Value --------------------------------------------------------------------

namespace {

[[noreturn]] void throw_type_mismatch(ValueType expected, ValueType actual) {
    throw Exception{ErrorKind::invalid_type,
                    "expected " + std::string{to_string_view(expected)} +
                    ", got " + std::string{to_string_view(actual)}};
}

}  // anonymous namespace

auto Value::as_bool() const -> bool {
    if (const auto* b = get_if<bool>()) return *b;
    throw_type_mismatch(ValueType::boolean, type());
}

auto Value::as_number() const -> double {
    if (const auto* n = get_if<double>()) return *n;
    throw_type_mismatch(ValueType::number, type());
}

auto Value::as_string() const -> const std::string& {
    if (const auto* s = get_if<std::string>()) return *s;
    throw_type_mismatch(ValueType::string, type());
}

auto Value::as_array() -> Array& {
    if (auto* a = get_if<Array>()) return *a;
    throw_type_mismatch(ValueType::array, type());
}

auto Value::as_array() const -> const Array& {
    if (const auto* a = get_if<Array>()) return *a;
    throw_type_mismatch(ValueType::array, type());
}

auto Value::as_object() -> Object& {
    if (auto* o = get_if<Object>()) return *o;
    throw_type_mismatch(ValueType::object, type());
}

auto Value::as_object() const -> const Object& {
    if (const auto* o = get_if<Object>()) return *o;
    throw_type_mismatch(ValueType::object, type());
}

auto operator==(const Value& a, const Value& b) -> bool {
    if (a.type() != b.type()) return false;
    return std::visit(overload{
        [](Null, Null) { return true; },
        [](bool x, bool y) { return x == y; },
        [](double x, double y) { return x == y; },
        [](const std::string& x, const std::string& y) { return x == y; },
        [](const Array& x, const Array& y) {
            return std::ranges::equal(x, y);
        },
        [](const Object& x, const Object& y) { return x == y; },
        [](const auto&, const auto&) { return false; },
    }, a.storage(), b.storage());
}

}  // namespace jsontree_cpp
