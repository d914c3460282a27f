#include <jsontree-cpp/diff.hpp>
#include <jsontree-cpp/json.hpp>
#include <jsontree-cpp/logging.hpp>
#include <jsontree-cpp/pointer.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace jsontree_cpp {

namespace {

auto is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto is_identifier_char(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto normalize(const std::string& s, const DiffOptions& options) -> std::string {
    auto result = std::string{};
    result.reserve(s.size());
    for (auto c : s) {
        if (options.ignore_whitespace && is_space(c)) continue;
        if (options.ignore_case && c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        result.push_back(c);
    }
    return result;
}

auto strings_equal(const std::string& a, const std::string& b, const DiffOptions& options) -> bool {
    if (!options.ignore_case && !options.ignore_whitespace) return a == b;
    return normalize(a, options) == normalize(b, options);
}

/// Location of the node being compared, in both address forms.
struct Location {
    std::string path;
    Pointer pointer;

    auto key(const std::string& k) const -> Location {
        return {path + key_path_segment(k), pointer / k};
    }

    auto index(std::size_t i) const -> Location {
        return {path + "[" + std::to_string(i) + "]", pointer / std::to_string(i)};
    }
};

class Differ {
public:
    explicit Differ(const DiffOptions& options) : options_{options} {}

    void compare(const Location& at, const Value& a, const Value& b, std::size_t depth) {
        if (options_.max_depth > 0 && depth > options_.max_depth) return;

        if (a.is_null() && b.is_null()) {
            if (options_.include_same) emit(DiffKind::same, at, a, b);
            return;
        }
        if (a.is_null()) {
            emit(DiffKind::added, at, a, b);
            return;
        }
        if (b.is_null()) {
            emit(DiffKind::removed, at, a, b);
            return;
        }
        if (a.type() != b.type()) {
            emit(DiffKind::type_changed, at, a, b);
            return;
        }

        std::visit(overload{
            [&](const Array& x, const Array& y) {
                if (options_.ignore_order) {
                    compare_unordered(at, x, y);
                } else {
                    compare_ordered(at, x, y, depth);
                }
            },
            [&](const Object& x, const Object& y) { compare_objects(at, x, y, depth); },
            [&](const std::string& x, const std::string& y) {
                compare_leaf(at, a, b, strings_equal(x, y, options_));
            },
            [&](const auto&, const auto&) { compare_leaf(at, a, b, a == b); },
        }, a.storage(), b.storage());
    }

    auto take() -> std::vector<DiffRecord> { return std::move(records_); }

private:
    void emit(DiffKind kind, const Location& at,
              std::optional<Value> old_value, std::optional<Value> new_value) {
        records_.push_back(DiffRecord{
            .kind = kind,
            .path = at.path,
            .pointer = at.pointer.to_string(),
            .old_value = std::move(old_value),
            .new_value = std::move(new_value),
        });
    }

    void compare_leaf(const Location& at, const Value& a, const Value& b, bool equal) {
        if (!equal) {
            emit(DiffKind::modified, at, a, b);
        } else if (options_.include_same) {
            emit(DiffKind::same, at, a, b);
        }
    }

    void compare_ordered(const Location& at, const Array& a, const Array& b, std::size_t depth) {
        const auto n = std::max(a.size(), b.size());
        for (std::size_t i = 0; i < n; ++i) {
            if (i >= a.size()) {
                emit(DiffKind::added, at.index(i), std::nullopt, b[i]);
            } else if (i >= b.size()) {
                emit(DiffKind::removed, at.index(i), a[i], std::nullopt);
            } else {
                compare(at.index(i), a[i], b[i], depth + 1);
            }
        }
    }

    // Each element of b claims the first unclaimed equivalent element of a.
    // Leftovers of a are removals, leftovers of b are additions.
    void compare_unordered(const Location& at, const Array& a, const Array& b) {
        auto claimed = std::vector<bool>(a.size(), false);
        auto match = std::vector<std::optional<std::size_t>>(b.size());
        for (std::size_t j = 0; j < b.size(); ++j) {
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!claimed[i] && equivalent(a[i], b[j], options_)) {
                    claimed[i] = true;
                    match[j] = i;
                    break;
                }
            }
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!claimed[i]) emit(DiffKind::removed, at.index(i), a[i], std::nullopt);
        }
        for (std::size_t j = 0; j < b.size(); ++j) {
            if (!match[j]) {
                emit(DiffKind::added, at.index(j), std::nullopt, b[j]);
            } else if (options_.include_same) {
                emit(DiffKind::same, at.index(j), a[*match[j]], b[j]);
            }
        }
    }

    void compare_objects(const Location& at, const Object& a, const Object& b, std::size_t depth) {
        auto keys = a.keys();
        for (const auto& m : b) {
            if (!a.contains(m.key)) keys.push_back(m.key);
        }
        std::ranges::sort(keys);

        for (const auto& key : keys) {
            const auto* old_value = a.find(key);
            const auto* new_value = b.find(key);
            if (old_value && new_value) {
                compare(at.key(key), *old_value, *new_value, depth + 1);
            } else if (old_value) {
                emit(DiffKind::removed, at.key(key), *old_value, std::nullopt);
            } else {
                emit(DiffKind::added, at.key(key), std::nullopt, *new_value);
            }
        }
    }

    const DiffOptions& options_;
    std::vector<DiffRecord> records_;
};

}  // anonymous namespace

auto key_path_segment(std::string_view key) -> std::string {
    if (!key.empty() && is_identifier_start(key[0]) &&
        std::ranges::all_of(key, is_identifier_char)) {
        return "." + std::string{key};
    }
    auto result = std::string{"['"};
    for (auto c : key) {
        if (c == '\'' || c == '\\') result.push_back('\\');
        result.push_back(c);
    }
    result += "']";
    return result;
}

auto equivalent(const Value& a, const Value& b, const DiffOptions& options) -> bool {
    if (a.type() != b.type()) return false;
    return std::visit(overload{
        [&](const std::string& x, const std::string& y) {
            return strings_equal(x, y, options);
        },
        [&](const Array& x, const Array& y) {
            return std::ranges::equal(x, y, [&](const Value& l, const Value& r) {
                return equivalent(l, r, options);
            });
        },
        [&](const Object& x, const Object& y) {
            if (x.size() != y.size()) return false;
            return std::ranges::all_of(x, [&](const Member& m) {
                const auto* other = y.find(m.key);
                return other && equivalent(m.value, *other, options);
            });
        },
        [&](const auto&, const auto&) { return a == b; },
    }, a.storage(), b.storage());
}

auto diff(const Value& before, const Value& after,
          const DiffOptions& options) -> std::vector<DiffRecord> {
    auto differ = Differ{options};
    differ.compare(Location{"$", Pointer{}}, before, after, 0);
    auto records = differ.take();
    logger()->debug("diff produced {} record(s)", records.size());
    return records;
}

auto to_string(const DiffRecord& record) -> std::string {
    auto show = [](const std::optional<Value>& v) {
        return v ? dump(*v) : std::string{"(absent)"};
    };
    auto result = std::string{to_string_view(record.kind)} + ": " + record.path;
    switch (record.kind) {
        case DiffKind::added:
            result += " = " + show(record.new_value);
            break;
        case DiffKind::removed:
        case DiffKind::same:
            result += " = " + show(record.old_value);
            break;
        case DiffKind::modified:
            result += " = " + show(record.old_value) + " -> " + show(record.new_value);
            break;
        case DiffKind::type_changed: {
            auto type_of = [](const std::optional<Value>& v) {
                return v ? std::string{to_string_view(v->type())} : std::string{"(absent)"};
            };
            result += " = " + type_of(record.old_value) + " -> " + type_of(record.new_value);
            break;
        }
    }
    return result;
}

}  // namespace jsontree_cpp
