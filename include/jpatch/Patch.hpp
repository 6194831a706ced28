/**
 * @file Patch.hpp
 * @brief Applying patches to documents
 *
 * Operations are applied in order; the result of operation k is the input
 * of operation k+1. Inputs are never modified: each call returns a new
 * document.
 *
 * There is no rollback. When operation k throws, the document produced by
 * operations 0..k-1 is discarded along with the call. Callers that want to
 * keep intermediate documents drive apply_operation() themselves.
 *
 * Array index segments:
 * - "-" is only valid as the append position of "add"
 * - otherwise digits only, no leading zero except "0" itself
 * - existing-element access (read/remove/replace/move source) needs an
 *   index in [0, size-1]; "add" accepts [0, size]
 */

#ifndef JPATCH_PATCH_HPP
#define JPATCH_PATCH_HPP

#include "jpatch/Operation.hpp"
#include "jpatch/PointerCache.hpp"
#include "jpatch/Value.hpp"

#include <cstddef>
#include <string>

namespace jpatch {

/**
 * @brief Apply a single operation
 *
 * @param document Current document (taken by value; pass a copy to keep it)
 * @param op Operation to apply
 * @param index Position of the operation in its patch, for error messages
 * @return New document
 * @throws InvalidOperation, PathNotFound, TypeMismatch, TestFailed
 *
 * Examples:
 * ```cpp
 * Value doc = {{"items", {1, 2}}};
 * auto out = apply_operation(doc, Add{Pointer::parse("/items/-"), 3});
 * // out: {"items": [1, 2, 3]}
 * ```
 */
Value apply_operation(Value document, const Operation& op, std::size_t index = 0);

/**
 * @brief Apply a decoded patch
 *
 * @param document Source document (unchanged)
 * @param patch Operations to apply in order
 * @return Patched document
 */
Value apply(const Value& document, const Patch& patch);

/**
 * @brief Apply a patch given as JSON
 *
 * Each operation object is decoded right before it is applied, so a
 * malformed operation k fails only after operations 0..k-1 succeeded.
 *
 * @param document Source document (unchanged)
 * @param patch Array of operation objects
 * @param cache Optional pointer cache
 * @throws InvalidOperation if patch is not an array or an operation is
 *         malformed
 */
Value apply(const Value& document, const Value& patch, PointerCache* cache = nullptr);

/**
 * @brief Apply a patch to a JSON text document
 *
 * @param document_json Document text
 * @param patch_json Patch text (a JSON array)
 * @param indent Output indentation, -1 for compact
 * @return Patched document text
 * @throws DocumentParseError if either text is not valid JSON
 * @throws InvalidOperation if the patch text is not an array
 */
std::string apply_json(const std::string& document_json, const std::string& patch_json,
                       int indent = -1);

/**
 * @brief Value at a pointer
 *
 * @param document Source document
 * @param path Pointer text ("" for the whole document)
 * @param cache Optional pointer cache
 * @return Reference into document
 * @throws PathNotFound, TypeMismatch, InvalidOperation
 */
const Value& get(const Value& document, const std::string& path, PointerCache* cache = nullptr);

/**
 * @brief Check the value at a pointer without throwing on mismatch
 *
 * Unlike the "test" operation this returns false on mismatch. Path errors
 * still throw.
 *
 * @return true if the value at path deep-equals expected
 */
bool test(const Value& document, const std::string& path, const Value& expected,
          PointerCache* cache = nullptr);

} // namespace jpatch

#endif // JPATCH_PATCH_HPP
