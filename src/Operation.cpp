/**
 * @file Operation.cpp
 * @brief Implementation of operation encoding and decoding
 */

#include "jpatch/Operation.hpp"
#include "jpatch/Errors.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace jpatch {

namespace {
    // Variant alternative order: Add, Remove, Replace, Move, Copy, Test
    constexpr const char* kOpNames[] = {"add", "remove", "replace", "move", "copy", "test"};

    std::string context(std::size_t index, const std::string& name) {
        return "Operation " + std::to_string(index) + " (" + name + ")";
    }

    /**
     * @brief Fetch the mandatory "value" member
     */
    const Value& require_value(const Value& j, std::size_t index, const std::string& name) {
        auto it = j.find("value");
        if (it == j.end()) {
            throw InvalidOperation(context(index, name) + ": Missing 'value'.");
        }
        return *it;
    }

    /**
     * @brief Fetch and parse the mandatory "from" member
     */
    Pointer require_from(const Value& j, std::size_t index, const std::string& name,
                         PointerCache* cache) {
        auto it = j.find("from");
        if (it == j.end() || !it->is_string()) {
            throw InvalidOperation(context(index, name) + ": Missing 'from'.");
        }
        return parse_pointer(it->get<std::string>(), cache);
    }
}

const char* op_name(const Operation& op) {
    return kOpNames[op.index()];
}

const Pointer& op_path(const Operation& op) {
    return std::visit([](const auto& o) -> const Pointer& { return o.path; }, op);
}

Operation operation_from_json(const Value& j, std::size_t index, PointerCache* cache) {
    if (!j.is_object()) {
        throw InvalidOperation("Operation " + std::to_string(index) + ": must be an object.");
    }

    auto op_it = j.find("op");
    if (op_it == j.end() || !op_it->is_string() || op_it->get<std::string>().empty()) {
        throw InvalidOperation("Operation " + std::to_string(index) + ": missing valid 'op'.");
    }
    const std::string name = op_it->get<std::string>();

    auto path_it = j.find("path");
    if (path_it == j.end() || !path_it->is_string()) {
        throw InvalidOperation(context(index, name) + ": missing valid 'path'.");
    }

    if (name == "add") {
        Pointer path = parse_pointer(path_it->get<std::string>(), cache);
        return Add{std::move(path), require_value(j, index, name)};
    }
    if (name == "remove") {
        return Remove{parse_pointer(path_it->get<std::string>(), cache)};
    }
    if (name == "replace") {
        Pointer path = parse_pointer(path_it->get<std::string>(), cache);
        return Replace{std::move(path), require_value(j, index, name)};
    }
    if (name == "move") {
        Pointer path = parse_pointer(path_it->get<std::string>(), cache);
        return Move{require_from(j, index, name, cache), std::move(path)};
    }
    if (name == "copy") {
        Pointer path = parse_pointer(path_it->get<std::string>(), cache);
        return Copy{require_from(j, index, name, cache), std::move(path)};
    }
    if (name == "test") {
        Pointer path = parse_pointer(path_it->get<std::string>(), cache);
        return Test{std::move(path), require_value(j, index, name)};
    }

    throw InvalidOperation(context(index, name) + ": Unsupported operation.");
}

Patch patch_from_json(const Value& j, PointerCache* cache) {
    if (!j.is_array()) {
        throw InvalidOperation("A patch must be a list of operation objects.");
    }

    Patch patch;
    patch.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        patch.push_back(operation_from_json(j[i], i, cache));
    }
    return patch;
}

void to_json(Value& j, const Operation& op) {
    j = Value::object();
    j["op"] = op_name(op);
    std::visit([&j](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Move> || std::is_same_v<T, Copy>) {
            j["from"] = o.from.to_string();
        }
        j["path"] = o.path.to_string();
        if constexpr (std::is_same_v<T, Add> || std::is_same_v<T, Replace> ||
                      std::is_same_v<T, Test>) {
            j["value"] = o.value;
        }
    }, op);
}

Value patch_to_json(const Patch& patch) {
    Value out = Value::array();
    for (const auto& op : patch) {
        Value j;
        to_json(j, op);
        out.push_back(std::move(j));
    }
    return out;
}

} // namespace jpatch
