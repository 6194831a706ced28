/**
 * @file Value.hpp
 * @brief Document value type for patch and diff
 *
 * Uses nlohmann::ordered_json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - List ([Value, ...])
 * - Map ({String: Value, ...}, insertion ordered)
 */

#ifndef JPATCH_VALUE_HPP
#define JPATCH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace jpatch {

/**
 * @brief JSON-like document value
 *
 * This is an alias for nlohmann::ordered_json. Lists and maps are distinct
 * value types (is_array() / is_object()), so an empty list and an empty map
 * never collapse into each other. Map keys keep their insertion order, which
 * the diff engine relies on when emitting operations.
 *
 * Note that operator== on this type is order-sensitive for maps and treats
 * 1 and 1.0 as equal; use deep_equals() for patch semantics.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Value kinds as seen by equality and diff
 *
 * Signed and unsigned integer storage are both Integer.
 */
enum class Kind {
    Null,
    Boolean,
    Integer,
    Float,
    String,
    List,
    Map,
    Other
};

/**
 * @brief Classify a value
 * @param val The value to inspect
 * @return Kind of the value (Other for binary or discarded values)
 */
inline Kind kind_of(const Value& val) {
    if (val.is_null()) return Kind::Null;
    if (val.is_boolean()) return Kind::Boolean;
    if (val.is_number_integer()) return Kind::Integer;
    if (val.is_number_float()) return Kind::Float;
    if (val.is_string()) return Kind::String;
    if (val.is_array()) return Kind::List;
    if (val.is_object()) return Kind::Map;
    return Kind::Other;
}

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "list", "map")
 */
inline std::string type_name(const Value& val) {
    switch (kind_of(val)) {
        case Kind::Null: return "null";
        case Kind::Boolean: return "boolean";
        case Kind::Integer: return "integer";
        case Kind::Float: return "float";
        case Kind::String: return "string";
        case Kind::List: return "list";
        case Kind::Map: return "map";
        default: return "unknown";
    }
}

/**
 * @brief Check if value is a container (list or map)
 * @param val The value to check
 * @return true if val is a list or map, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace jpatch

#endif // JPATCH_VALUE_HPP
