/**
 * @file Patch.cpp
 * @brief Implementation of patch application
 *
 * Every operation resolves the parent container of its target, changes it,
 * and rebuilds the path from that container back up to the root. The
 * rebuild moves each ancestor out of the document, replaces the child on
 * the path and moves it back, so siblings off the path are carried over
 * untouched.
 */

#include "jpatch/Patch.hpp"
#include "jpatch/Equality.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace jpatch {

namespace {

enum class IndexMode {
    Existing, // read, remove, replace, move source: [0, size-1]
    Add       // insert position: [0, size]
};

std::string context(std::size_t index, const char* name) {
    return "Operation " + std::to_string(index) + " (" + name + ")";
}

/**
 * @brief Parse an array index segment
 *
 * @param segment Raw segment
 * @param size Current list size
 * @param mode Which range applies
 * @param path Full pointer text, for PathNotFound
 * @param ctx Operation context for messages
 * @return Position in the list
 * @throws InvalidOperation for malformed segments or an add position past
 *         the end
 * @throws PathNotFound for an existing-element index past the end
 */
std::size_t parse_array_index(const std::string& segment, std::size_t size, IndexMode mode,
                              const std::string& path, const std::string& ctx) {
    if (segment.empty() || segment == "-") {
        throw InvalidOperation(ctx + ": Invalid array index segment '" + segment + "'.");
    }

    if (!std::all_of(segment.begin(), segment.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw InvalidOperation(ctx + ": Array index must be an integer, got '" + segment + "'.");
    }

    if (segment.size() > 1 && segment[0] == '0') {
        throw InvalidOperation(ctx + ": Array index must not have leading zeros.");
    }

    // Accumulate with a cap so huge digit strings stay out of range
    const std::size_t limit = size + 1;
    std::size_t pos = 0;
    for (char c : segment) {
        pos = pos * 10 + static_cast<std::size_t>(c - '0');
        if (pos > limit) {
            pos = limit;
            break;
        }
    }

    if (mode == IndexMode::Add) {
        if (pos > size) {
            throw InvalidOperation(ctx + ": Array index out of range for add.");
        }
    } else if (pos >= size) {
        throw PathNotFound(path, ctx);
    }

    return pos;
}

/**
 * @brief Encoded pointer text of the first n segments
 */
std::string prefix_string(const Pointer& ptr, std::size_t n) {
    std::string out;
    for (std::size_t i = 0; i < n; ++i) {
        out += '/';
        out += encode_segment(ptr.segments()[i]);
    }
    return out;
}

/**
 * @brief Resolve a pointer to an existing value
 */
const Value& get_at(const Value& document, const Pointer& ptr, const std::string& ctx) {
    const Value* current = &document;
    const auto& segments = ptr.segments();

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];

        if (current->is_object()) {
            auto it = current->find(seg);
            if (it == current->end()) {
                throw PathNotFound(ptr.to_string(), ctx);
            }
            current = &(*it);
        } else if (current->is_array()) {
            std::size_t idx = parse_array_index(seg, current->size(), IndexMode::Existing,
                                                ptr.to_string(), ctx);
            current = &(*current)[idx];
        } else {
            throw TypeMismatch(prefix_string(ptr, i), type_name(*current), ctx);
        }
    }

    return *current;
}

/**
 * @brief Mutable reference to the child named by segment depth of ptr
 */
Value& child_slot(Value& node, const Pointer& ptr, std::size_t depth, const std::string& ctx) {
    const auto& seg = ptr.segments()[depth];

    if (node.is_object()) {
        auto it = node.find(seg);
        if (it == node.end()) {
            throw PathNotFound(ptr.to_string(), ctx);
        }
        return *it;
    }
    if (node.is_array()) {
        std::size_t idx = parse_array_index(seg, node.size(), IndexMode::Existing,
                                            ptr.to_string(), ctx);
        return node[idx];
    }
    throw TypeMismatch(prefix_string(ptr, depth), type_name(node), ctx);
}

/**
 * @brief Rebuild node with fn applied to the value at target
 *
 * Walks down target moving each child out of its parent, applies fn to the
 * value at the end of the walk, then moves the results back up.
 */
template <typename Fn>
Value update_at(Value node, const Pointer& target, std::size_t depth, const Fn& fn,
                const std::string& ctx) {
    if (depth == target.size()) {
        return fn(std::move(node));
    }

    Value& slot = child_slot(node, target, depth, ctx);
    slot = update_at(std::move(slot), target, depth + 1, fn, ctx);
    return node;
}

void require_container(const Value& parent, const Pointer& path, const std::string& ctx) {
    if (!is_container(parent)) {
        std::string where = path.parent().to_string();
        throw TypeMismatch(where.empty() ? "/" : where, type_name(parent), ctx);
    }
}

Value do_add(Value document, const Pointer& path, const Value& value, const std::string& ctx) {
    if (path.is_root()) {
        return value;
    }

    const std::string& key = path.last();
    return update_at(std::move(document), path.parent(), 0, [&](Value parent) {
        require_container(parent, path, ctx);
        if (parent.is_array()) {
            if (key == "-") {
                parent.push_back(value);
            } else {
                std::size_t pos = parse_array_index(key, parent.size(), IndexMode::Add,
                                                    path.to_string(), ctx);
                parent.insert(parent.begin() + static_cast<std::ptrdiff_t>(pos), value);
            }
        } else {
            parent[key] = value;
        }
        return parent;
    }, ctx);
}

Value do_remove(Value document, const Pointer& path, const std::string& ctx) {
    if (path.is_root()) {
        throw InvalidOperation(ctx + ": Cannot remove the document root.");
    }

    const std::string& key = path.last();
    return update_at(std::move(document), path.parent(), 0, [&](Value parent) {
        require_container(parent, path, ctx);
        if (parent.is_array()) {
            std::size_t pos = parse_array_index(key, parent.size(), IndexMode::Existing,
                                                path.to_string(), ctx);
            parent.erase(pos);
        } else {
            if (parent.erase(key) == 0) {
                throw PathNotFound(path.to_string(), ctx);
            }
        }
        return parent;
    }, ctx);
}

Value do_replace(Value document, const Pointer& path, const Value& value, const std::string& ctx) {
    if (path.is_root()) {
        return value;
    }

    const std::string& key = path.last();
    return update_at(std::move(document), path.parent(), 0, [&](Value parent) {
        require_container(parent, path, ctx);
        if (parent.is_array()) {
            std::size_t pos = parse_array_index(key, parent.size(), IndexMode::Existing,
                                                path.to_string(), ctx);
            parent[pos] = value;
        } else {
            auto it = parent.find(key);
            if (it == parent.end()) {
                throw PathNotFound(path.to_string(), ctx);
            }
            *it = value;
        }
        return parent;
    }, ctx);
}

Value do_move(Value document, const Move& op, const std::string& ctx) {
    // RFC 6902 Section 4.4: "from" must not be a proper prefix of "path"
    const std::string from = op.from.to_string();
    const std::string path = op.path.to_string();
    if (path != from && path.compare(0, from.size() + 1, from + "/") == 0) {
        throw InvalidOperation(ctx + ": 'from' cannot be a proper prefix of 'path'.");
    }

    if (path == from) {
        return document;
    }

    Value value = get_at(document, op.from, ctx);
    document = do_remove(std::move(document), op.from, ctx);
    return do_add(std::move(document), op.path, value, ctx);
}

Value do_copy(Value document, const Copy& op, const std::string& ctx) {
    Value value = get_at(document, op.from, ctx);
    return do_add(std::move(document), op.path, value, ctx);
}

Value do_test(Value document, const Test& op, const std::string& ctx) {
    const Value& actual = get_at(document, op.path, ctx);
    if (!deep_equals(actual, op.value)) {
        throw TestFailed(op.path.to_string());
    }
    return document;
}

} // anonymous namespace

Value apply_operation(Value document, const Operation& op, std::size_t index) {
    const std::string ctx = context(index, op_name(op));

    auto log = logger();
    if (log->should_log(spdlog::level::debug)) {
        log->debug("{} at '{}'", ctx, op_path(op).to_string());
    }

    return std::visit([&](const auto& o) -> Value {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Add>) {
            return do_add(std::move(document), o.path, o.value, ctx);
        } else if constexpr (std::is_same_v<T, Remove>) {
            return do_remove(std::move(document), o.path, ctx);
        } else if constexpr (std::is_same_v<T, Replace>) {
            return do_replace(std::move(document), o.path, o.value, ctx);
        } else if constexpr (std::is_same_v<T, Move>) {
            return do_move(std::move(document), o, ctx);
        } else if constexpr (std::is_same_v<T, Copy>) {
            return do_copy(std::move(document), o, ctx);
        } else {
            static_assert(std::is_same_v<T, Test>, "unhandled operation kind");
            return do_test(std::move(document), o, ctx);
        }
    }, op);
}

Value apply(const Value& document, const Patch& patch) {
    Value current = document;
    for (std::size_t i = 0; i < patch.size(); ++i) {
        current = apply_operation(std::move(current), patch[i], i);
    }
    return current;
}

Value apply(const Value& document, const Value& patch, PointerCache* cache) {
    if (!patch.is_array()) {
        throw InvalidOperation("A patch must be a list of operation objects.");
    }

    Value current = document;
    for (std::size_t i = 0; i < patch.size(); ++i) {
        Operation op = operation_from_json(patch[i], i, cache);
        current = apply_operation(std::move(current), op, i);
    }
    return current;
}

std::string apply_json(const std::string& document_json, const std::string& patch_json,
                       int indent) {
    Value document;
    try {
        document = Value::parse(document_json);
    } catch (const Value::parse_error& e) {
        throw DocumentParseError("document", e.what());
    }

    Value patch;
    try {
        patch = Value::parse(patch_json);
    } catch (const Value::parse_error& e) {
        throw DocumentParseError("patch", e.what());
    }

    if (!patch.is_array()) {
        throw InvalidOperation("Patch JSON must be a list.");
    }

    return jpatch::apply(document, patch).dump(indent);
}

const Value& get(const Value& document, const std::string& path, PointerCache* cache) {
    Pointer ptr = parse_pointer(path, cache);
    return get_at(document, ptr, "get");
}

bool test(const Value& document, const std::string& path, const Value& expected,
          PointerCache* cache) {
    return deep_equals(jpatch::get(document, path, cache), expected);
}

} // namespace jpatch
