/**
 * @file Validate.hpp
 * @brief Structural validation of patches
 */

#ifndef JPATCH_VALIDATE_HPP
#define JPATCH_VALIDATE_HPP

#include "jpatch/Value.hpp"

#include <string>
#include <vector>

namespace jpatch {

/**
 * @brief Check a patch without applying it
 *
 * Only the shape of the patch is checked: each element is an object, "op"
 * names one of the six operations, "path"/"from" are well-formed pointers,
 * and "value"/"from" are present where the operation needs them. Whether
 * the paths exist in some document is not checked.
 *
 * @param patch Patch as JSON
 * @return Error messages, empty if the patch is valid
 *
 * Examples:
 * ```cpp
 * validate(Value::parse(R"([{"op":"add","path":"/a","value":1}])")); // {}
 * validate(Value::parse(R"([{"op":"add","path":"/a"}])"));
 * // {"Operation 0 (add): missing 'value'."}
 * ```
 */
std::vector<std::string> validate(const Value& patch);

} // namespace jpatch

#endif // JPATCH_VALIDATE_HPP
