/**
 * @file DiffOptions.hpp
 * @brief Per-path configuration of the diff engine
 *
 * Options can be built in code or loaded from a JSON or TOML file:
 *
 * ```toml
 * use_lcs = true
 * max_depth = 512
 *
 * [identity]
 * "/items" = "id"
 * ```
 *
 * The same options as JSON:
 * `{"use_lcs": true, "max_depth": 512, "identity": {"/items": "id"}}`
 */

#ifndef JPATCH_DIFFOPTIONS_HPP
#define JPATCH_DIFFOPTIONS_HPP

#include "jpatch/Value.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace jpatch {

struct DiffOptions {
    static constexpr std::size_t kDefaultMaxDepth = 512;

    /// Pointer text (exact, escaped form) => identity key of the list items
    std::map<std::string, std::string> list_identity_by_pointer;

    /// Use LCS for lists without an identity key; otherwise replace them whole
    bool use_lcs = true;

    /// Deepest nesting level diff() descends to before throwing DepthExceeded
    std::size_t max_depth = kDefaultMaxDepth;

    /**
     * @brief Identity key configured for a list at pointer
     * @param pointer Pointer text as the diff engine builds it ("" for root)
     * @return Key name, or nullopt if the list has none
     */
    std::optional<std::string> identity_key_for(const std::string& pointer) const;
};

/**
 * @brief Build options from a JSON object
 *
 * Recognised members: "identity" (object of pointer => key), "use_lcs"
 * (boolean), "max_depth" (non-negative integer). Unknown members are
 * ignored.
 *
 * @throws OptionsError if value is not an object or a member has the
 *         wrong type
 */
DiffOptions diff_options_from_value(const Value& value);

/**
 * @brief Load options from a .json or .toml file
 *
 * @param path Path to the options file
 * @throws OptionsError if the file is missing, cannot be parsed, has an
 *         unsupported extension or the wrong shape
 */
DiffOptions load_diff_options(const std::string& path);

} // namespace jpatch

#endif // JPATCH_DIFFOPTIONS_HPP
