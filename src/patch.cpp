#include <jsontree-cpp/patch.hpp>
#include <jsontree-cpp/logging.hpp>
#include <jsontree-cpp/pointer.hpp>

#include <string>
#include <utility>

namespace jsontree_cpp {

namespace {

auto describe(std::size_t index, const PatchOperation& op, const Error& error) -> std::string {
    auto result = "operation #" + std::to_string(index) + " (" +
                  std::string{to_string_view(op.op)} + " " + op.path;
    if (op.from) result += " from " + *op.from;
    return result + "): " + to_string(error);
}

}  // anonymous namespace

PatchError::PatchError(std::size_t index, PatchOperation operation, Error error)
    : Exception{error, describe(index, operation, error)},
      index_{index},
      operation_{std::move(operation)} {}

auto parse_op_type(std::string_view name) -> std::optional<OpType> {
    for (auto op : {OpType::add, OpType::remove, OpType::replace,
                    OpType::move, OpType::copy, OpType::test}) {
        if (to_string_view(op) == name) return op;
    }
    return std::nullopt;
}

// =============================================================================
// Patch documents
// =============================================================================

namespace {

auto read_operation(const Value& entry) -> PatchOperation {
    const auto* obj = entry.get_if<Object>();
    if (!obj) {
        throw Exception{ErrorKind::invalid_patch, "operation must be an object"};
    }

    auto string_member = [&](std::string_view key) -> std::optional<std::string> {
        const auto* v = obj->find(key);
        if (!v) return std::nullopt;
        const auto* s = v->get_if<std::string>();
        if (!s) {
            throw Exception{ErrorKind::invalid_patch,
                            "'" + std::string{key} + "' must be a string"};
        }
        return *s;
    };

    auto op_name = string_member("op");
    if (!op_name) throw Exception{ErrorKind::invalid_patch, "missing 'op'"};
    auto op_type = parse_op_type(*op_name);
    if (!op_type) {
        throw Exception{ErrorKind::invalid_patch, "unknown operation '" + *op_name + "'"};
    }

    auto path = string_member("path");
    if (!path) throw Exception{ErrorKind::invalid_patch, "missing 'path'"};

    auto op = PatchOperation{.op = *op_type, .path = std::move(*path)};
    switch (op.op) {
        case OpType::add:
        case OpType::replace:
        case OpType::test:
            if (const auto* v = obj->find("value")) {
                op.value = *v;
            } else {
                throw Exception{ErrorKind::invalid_patch, "missing 'value'"};
            }
            break;
        case OpType::move:
        case OpType::copy:
            op.from = string_member("from");
            if (!op.from) throw Exception{ErrorKind::invalid_patch, "missing 'from'"};
            break;
        case OpType::remove:
            break;
    }
    return op;
}

}  // anonymous namespace

auto parse_patch(const Value& document) -> std::vector<PatchOperation> {
    const auto* entries = document.get_if<Array>();
    if (!entries) {
        throw Exception{ErrorKind::invalid_patch, "patch document must be an array"};
    }
    auto operations = std::vector<PatchOperation>{};
    operations.reserve(entries->size());
    for (std::size_t i = 0; i < entries->size(); ++i) {
        try {
            operations.push_back(read_operation((*entries)[i]));
        } catch (const Exception& e) {
            auto partial = PatchOperation{};
            if (const auto* obj = (*entries)[i].get_if<Object>()) {
                if (const auto* p = obj->find("path"); p && p->is_string()) {
                    partial.path = p->as_string();
                }
            }
            throw PatchError{i, std::move(partial), e.error()};
        }
    }
    return operations;
}

auto to_value(const PatchOperation& op) -> Value {
    auto obj = Object{{"op", std::string{to_string_view(op.op)}}};
    if (op.from) obj.set("from", *op.from);
    obj.set("path", op.path);
    if (op.value) obj.set("value", *op.value);
    return obj;
}

auto to_value(std::span<const PatchOperation> operations) -> Value {
    auto arr = Array{};
    arr.reserve(operations.size());
    for (const auto& op : operations) arr.push_back(to_value(op));
    return arr;
}

// =============================================================================
// Applying
// =============================================================================

namespace {

void add_at(Value& document, const Pointer& path, Value value) {
    if (path.is_root()) {
        document = std::move(value);
        return;
    }
    auto& parent = resolve_parent(document, path);
    const auto& token = path.back();
    if (auto* obj = parent.get_if<Object>()) {
        obj->set(token, std::move(value));
        return;
    }
    auto& arr = parent.as_array();
    auto index = parse_array_index(token, arr.size(), path);
    if (index > arr.size()) {
        throw Exception{ErrorKind::index_out_of_range,
                        "index " + token + " is past the end of array of size " +
                            std::to_string(arr.size()),
                        path.to_string()};
    }
    arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
}

void remove_at(Value& document, const Pointer& path) {
    if (path.is_root()) {
        document = Null{};
        return;
    }
    auto& parent = resolve_parent(document, path);
    const auto& token = path.back();
    if (auto* obj = parent.get_if<Object>()) {
        if (!obj->erase(token)) {
            throw Exception{ErrorKind::path_not_found,
                            "no member '" + token + "'", path.to_string()};
        }
        return;
    }
    auto& arr = parent.as_array();
    auto index = parse_array_index(token, arr.size(), path);
    if (index >= arr.size()) {
        throw Exception{ErrorKind::index_out_of_range,
                        "index " + token + " is out of range for array of size " +
                            std::to_string(arr.size()),
                        path.to_string()};
    }
    arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(index));
}

auto require_value(const PatchOperation& op) -> const Value& {
    if (!op.value) {
        throw Exception{ErrorKind::invalid_patch,
                        std::string{to_string_view(op.op)} + " requires 'value'", op.path};
    }
    return *op.value;
}

auto require_from(const PatchOperation& op) -> Pointer {
    if (!op.from) {
        throw Exception{ErrorKind::invalid_patch,
                        std::string{to_string_view(op.op)} + " requires 'from'", op.path};
    }
    return Pointer::parse(*op.from);
}

}  // anonymous namespace

void apply_operation(Value& document, const PatchOperation& op) {
    const auto path = Pointer::parse(op.path);
    switch (op.op) {
        case OpType::add:
            add_at(document, path, require_value(op));
            break;
        case OpType::remove:
            remove_at(document, path);
            break;
        case OpType::replace: {
            const auto& value = require_value(op);
            remove_at(document, path);
            add_at(document, path, value);
            break;
        }
        case OpType::move: {
            const auto from = require_from(op);
            auto value = get(document, from);
            if (from == path) break;
            if (from.is_prefix_of(path)) {
                throw Exception{ErrorKind::invalid_patch,
                                "cannot move a value into one of its own children",
                                op.path};
            }
            remove_at(document, from);
            add_at(document, path, std::move(value));
            break;
        }
        case OpType::copy: {
            const auto from = require_from(op);
            auto value = get(document, from);
            add_at(document, path, std::move(value));
            break;
        }
        case OpType::test: {
            const auto& expected = require_value(op);
            if (get(document, path) != expected) {
                throw Exception{ErrorKind::test_failed,
                                "value does not match", op.path};
            }
            break;
        }
    }
}

auto apply_patch(const Value& document,
                 std::span<const PatchOperation> operations) -> Value {
    auto result = document;
    for (std::size_t i = 0; i < operations.size(); ++i) {
        const auto& op = operations[i];
        logger()->debug("applying operation #{}: {} {}", i, to_string_view(op.op), op.path);
        try {
            apply_operation(result, op);
        } catch (const Exception& e) {
            auto error = PatchError{i, op, e.error()};
            logger()->debug("patch rejected: {}", error.what());
            throw error;
        }
    }
    return result;
}

auto apply_patch(const Value& document, const Value& patch_document) -> Value {
    const auto operations = parse_patch(patch_document);
    return apply_patch(document, operations);
}

void apply_patch_in_place(Value& document, std::span<const PatchOperation> operations) {
    auto result = apply_patch(document, operations);
    document = std::move(result);
}

}  // namespace jsontree_cpp
