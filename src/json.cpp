#include <jsontree-cpp/json.hpp>

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace jsontree_cpp {

namespace {

constexpr auto max_exact_integer = 9007199254740992.0;  // 2^53

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(Json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](double d) {
            // Integral values within the exact double range print without ".0".
            // Negative zero stays a double to keep its sign.
            if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) <= max_exact_integer &&
                !(d == 0.0 && std::signbit(d))) {
                j = static_cast<std::int64_t>(d);
            } else {
                j = d;
            }
        },
        [&](const std::string& s) { j = s; },
        [&](const Array& arr) {
            j = Json::array();
            for (const auto& item : arr) {
                auto item_json = Json{};
                to_json(item_json, item);
                j.push_back(std::move(item_json));
            }
        },
        [&](const Object& obj) {
            j = Json::object();
            for (const auto& m : obj) {
                auto member_json = Json{};
                to_json(member_json, m.value);
                j[m.key] = std::move(member_json);
            }
        },
    }, v.storage());
}

void from_json(const Json& j, Value& v) {
    switch (j.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            v = Null{};
            break;
        case Json::value_t::boolean:
            v = j.get<bool>();
            break;
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:
            v = j.get<double>();
            break;
        case Json::value_t::string:
            v = j.get<std::string>();
            break;
        case Json::value_t::array: {
            auto arr = Array{};
            arr.reserve(j.size());
            for (const auto& item : j) {
                auto value = Value{};
                from_json(item, value);
                arr.push_back(std::move(value));
            }
            v = std::move(arr);
            break;
        }
        case Json::value_t::object: {
            auto obj = Object{};
            for (const auto& [key, item] : j.items()) {
                auto value = Value{};
                from_json(item, value);
                obj.set(key, std::move(value));
            }
            v = std::move(obj);
            break;
        }
        case Json::value_t::binary:
            throw Exception{ErrorKind::invalid_json, "binary values are not supported"};
    }
}

void to_json(Json& j, const PatchOperation& op) {
    auto value = to_value(op);
    to_json(j, value);
}

void from_json(const Json& j, PatchOperation& op) {
    auto value = Value{};
    from_json(j, value);
    auto wrapped = Array{std::move(value)};
    op = std::move(parse_patch(Value{std::move(wrapped)}).front());
}

void to_json(Json& j, const DiffRecord& record) {
    j = Json::object();
    j["kind"] = std::string{to_string_view(record.kind)};
    j["path"] = record.path;
    j["pointer"] = record.pointer;
    if (record.old_value) {
        auto old_json = Json{};
        to_json(old_json, *record.old_value);
        j["old"] = std::move(old_json);
    }
    if (record.new_value) {
        auto new_json = Json{};
        to_json(new_json, *record.new_value);
        j["new"] = std::move(new_json);
    }
}

// =============================================================================
// Text
// =============================================================================

auto parse(std::string_view text) -> Value {
    // depth counts the containers enclosing the one being opened.
    auto limit_nesting = [](int depth, Json::parse_event_t event, Json&) {
        if ((event == Json::parse_event_t::object_start ||
             event == Json::parse_event_t::array_start) &&
            depth >= max_nesting_depth) {
            throw Exception{ErrorKind::invalid_json,
                            "nesting exceeds " + std::to_string(max_nesting_depth) + " levels"};
        }
        return true;
    };
    auto j = Json{};
    try {
        j = Json::parse(text, limit_nesting);
    } catch (const Json::parse_error& e) {
        throw Exception{ErrorKind::invalid_json, e.what()};
    }
    auto v = Value{};
    from_json(j, v);
    return v;
}

auto dump(const Value& value, int indent) -> std::string {
    auto j = Json{};
    to_json(j, value);
    try {
        return j.dump(indent);
    } catch (const Json::type_error& e) {
        // Invalid UTF-8 in a string.
        throw Exception{ErrorKind::operation_failed, e.what()};
    }
}

auto parse_patch_json(std::string_view text) -> std::vector<PatchOperation> {
    return parse_patch(parse(text));
}

auto operator<<(std::ostream& os, const Value& value) -> std::ostream& {
    return os << dump(value);
}

}  // namespace jsontree_cpp
