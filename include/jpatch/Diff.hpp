/**
 * @file Diff.hpp
 * @brief Generating patches between two documents
 *
 * Strategy per location:
 * - Equal values: nothing
 * - Different kinds (list vs map, container vs scalar, scalars): replace
 * - Two maps: remove keys missing from the target (source order), then add
 *   or recurse into keys of the target (target order)
 * - Two lists: identity diff if an identity key is configured for the
 *   path and both lists qualify, else LCS diff if enabled, else replace
 *
 * The removes-before-adds ordering of map and LCS diffs is part of the
 * output contract; consumers replaying patches depend on it.
 */

#ifndef JPATCH_DIFF_HPP
#define JPATCH_DIFF_HPP

#include "jpatch/DiffOptions.hpp"
#include "jpatch/Operation.hpp"
#include "jpatch/Value.hpp"

namespace jpatch {

/**
 * @brief Compute a patch that turns from into to
 *
 * @param from Source document
 * @param to Target document
 * @param options Identity keys, LCS switch and depth bound
 * @return Operations such that apply(from, result) deep-equals to
 * @throws DepthExceeded if nesting goes past options.max_depth
 *
 * Examples:
 * ```cpp
 * diff(Value{"a", "b", "c"}, Value{"a", "c"});
 * // [{"op": "remove", "path": "/1"}]
 *
 * DiffOptions opts;
 * opts.list_identity_by_pointer["/items"] = "id";
 * diff(from, to, opts); // may emit "move" for reordered items
 * ```
 */
Patch diff(const Value& from, const Value& to, const DiffOptions& options = DiffOptions());

} // namespace jpatch

#endif // JPATCH_DIFF_HPP
