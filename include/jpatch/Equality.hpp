/**
 * @file Equality.hpp
 * @brief Structural deep equality over document values
 *
 * Rules:
 * - Values of different kinds are never equal (1 and 1.0 differ)
 * - Lists: same length, element-wise equal, order matters
 * - Maps: same key set regardless of order, equal value per key
 * - Scalars: exact equality within their kind
 *
 * The comparison walks both trees with an explicit work list, so nesting
 * depth is limited by memory rather than by the call stack.
 */

#ifndef JPATCH_EQUALITY_HPP
#define JPATCH_EQUALITY_HPP

#include "jpatch/Value.hpp"

#include <cstddef>

namespace jpatch {

/**
 * @brief Compare two values structurally
 *
 * Examples:
 * ```cpp
 * deep_equals(Value{{"a", 1}, {"b", 2}}, Value{{"b", 2}, {"a", 1}}); // true
 * deep_equals(Value(1), Value(1.0));                                 // false
 * deep_equals(Value::array(), Value::object());                      // false
 * ```
 */
bool deep_equals(const Value& a, const Value& b);

/**
 * @brief Compare two values that sit at depth in a larger document
 *
 * @param depth Nesting depth of a and b
 * @param max_depth Deepest level the comparison may reach
 * @throws DepthExceeded if a pair below max_depth has to be compared
 */
bool deep_equals(const Value& a, const Value& b, std::size_t depth, std::size_t max_depth);

} // namespace jpatch

#endif // JPATCH_EQUALITY_HPP
