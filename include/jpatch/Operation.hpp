/**
 * @file Operation.hpp
 * @brief Patch operations and their JSON encoding
 *
 * An operation is one of exactly six kinds (RFC 6902 Section 4):
 * add, remove, replace, move, copy, test. They form a closed
 * std::variant; code that handles operations uses std::visit so every
 * kind is accounted for.
 *
 * Wire shape: {"op": NAME, "path": POINTER, "value"?: ANY, "from"?: POINTER}
 */

#ifndef JPATCH_OPERATION_HPP
#define JPATCH_OPERATION_HPP

#include "jpatch/Pointer.hpp"
#include "jpatch/PointerCache.hpp"
#include "jpatch/Value.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace jpatch {

struct Add {
    Pointer path;
    Value value;
};

struct Remove {
    Pointer path;
};

struct Replace {
    Pointer path;
    Value value;
};

struct Move {
    Pointer from;
    Pointer path;
};

struct Copy {
    Pointer from;
    Pointer path;
};

struct Test {
    Pointer path;
    Value value;
};

using Operation = std::variant<Add, Remove, Replace, Move, Copy, Test>;
using Patch = std::vector<Operation>;

/**
 * @brief RFC name of the operation ("add", "remove", ...)
 */
const char* op_name(const Operation& op);

/**
 * @brief Target path of the operation
 */
const Pointer& op_path(const Operation& op);

/**
 * @brief Decode one operation object
 *
 * @param j Operation object
 * @param index Position in the patch, used in error messages
 * @param cache Optional pointer cache for "path" and "from"
 * @return Decoded operation
 * @throws InvalidOperation if j is not an object, "op" is missing or
 *         unknown, "path" is missing, or a required "value"/"from" is absent
 * @throws PointerSyntaxError if "path" or "from" is malformed
 */
Operation operation_from_json(const Value& j, std::size_t index = 0,
                              PointerCache* cache = nullptr);

/**
 * @brief Decode a whole patch
 *
 * @param j Array of operation objects
 * @param cache Optional pointer cache
 * @throws InvalidOperation if j is not an array or any element is invalid
 */
Patch patch_from_json(const Value& j, PointerCache* cache = nullptr);

/**
 * @brief Encode an operation (ADL hook for nlohmann::json)
 *
 * Members appear in the order op, from, path, value.
 */
void to_json(Value& j, const Operation& op);

/**
 * @brief Encode a whole patch as an array of operation objects
 */
Value patch_to_json(const Patch& patch);

} // namespace jpatch

#endif // JPATCH_OPERATION_HPP
