/**
 * @file Diff.cpp
 * @brief Implementation of the diff engine
 */

#include "jpatch/Diff.hpp"
#include "jpatch/Equality.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/Logging.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace jpatch {

namespace {

using IdIndex = std::unordered_map<std::string, std::size_t>;

/**
 * @brief Identity of a list item
 *
 * @return The item's id as a string, or nullopt if the item is not a map,
 *         lacks the key, or the key holds something other than a string or
 *         an integer
 */
std::optional<std::string> read_id(const Value& item, const std::string& id_key) {
    if (!item.is_object()) {
        return std::nullopt;
    }

    auto it = item.find(id_key);
    if (it == item.end()) {
        return std::nullopt;
    }

    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return it->dump(); // decimal text for signed and unsigned storage
    }
    return std::nullopt;
}

/**
 * @brief Ids of every item of list, in order
 *
 * @return nullopt if any item has no usable id or two items share one
 */
std::optional<std::vector<std::string>> collect_ids(const Value& list, const std::string& id_key) {
    std::vector<std::string> ids;
    ids.reserve(list.size());
    std::unordered_set<std::string> seen;

    for (const auto& item : list) {
        auto id = read_id(item, id_key);
        if (!id || !seen.insert(*id).second) {
            return std::nullopt;
        }
        ids.push_back(std::move(*id));
    }
    return ids;
}

IdIndex build_index(const std::vector<std::string>& ids) {
    IdIndex index;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        index[ids[i]] = i;
    }
    return index;
}

Pointer index_path(const Pointer& list_path, std::size_t index) {
    return list_path.child(std::to_string(index));
}

class Differ {
public:
    Differ(const DiffOptions& options, Patch& ops)
        : options_(options)
        , ops_(ops)
    {}

    void diff_at(const Pointer& path, const Value& from, const Value& to, std::size_t depth) {
        if (depth > options_.max_depth) {
            throw DepthExceeded(options_.max_depth);
        }

        if (deep_equals(from, to, depth, options_.max_depth)) {
            return;
        }

        if (from.is_object() && to.is_object()) {
            diff_object(path, from, to, depth);
            return;
        }

        if (from.is_array() && to.is_array()) {
            diff_list(path, from, to, depth);
            return;
        }

        ops_.push_back(Replace{path, to});
    }

private:
    void diff_object(const Pointer& path, const Value& from, const Value& to, std::size_t depth) {
        for (auto it = from.begin(); it != from.end(); ++it) {
            if (to.find(it.key()) == to.end()) {
                ops_.push_back(Remove{path.child(it.key())});
            }
        }

        for (auto it = to.begin(); it != to.end(); ++it) {
            auto source = from.find(it.key());
            if (source == from.end()) {
                ops_.push_back(Add{path.child(it.key()), it.value()});
                continue;
            }
            diff_at(path.child(it.key()), *source, it.value(), depth + 1);
        }
    }

    void diff_list(const Pointer& path, const Value& from, const Value& to, std::size_t depth) {
        if (!options_.list_identity_by_pointer.empty()) {
            const std::string where = path.to_string();
            if (auto id_key = options_.identity_key_for(where)) {
                if (diff_list_by_id(path, from, to, *id_key, depth)) {
                    return;
                }
                logger()->debug("Identity diff at '{}' abstained (key '{}'), falling back to {}",
                                where, *id_key, options_.use_lcs ? "LCS" : "replace");
            }
        }

        if (options_.use_lcs) {
            diff_list_by_lcs(path, from, to, depth + 1);
            return;
        }

        ops_.push_back(Replace{path, to});
    }

    /**
     * @brief Diff two lists whose items carry a unique identity key
     *
     * @return false, emitting nothing, if either list does not qualify
     */
    bool diff_list_by_id(const Pointer& path, const Value& from, const Value& to,
                         const std::string& id_key, std::size_t depth) {
        auto from_ids = collect_ids(from, id_key);
        if (!from_ids) {
            return false;
        }
        auto to_ids = collect_ids(to, id_key);
        if (!to_ids) {
            return false;
        }

        const IdIndex target_index = build_index(*to_ids);

        // Working copy of the list as the emitted operations leave it
        std::vector<const Value*> current;
        current.reserve(from.size());
        for (const auto& item : from) {
            current.push_back(&item);
        }
        std::vector<std::string> ids = std::move(*from_ids);
        IdIndex current_index = build_index(ids);

        // Drop items that are gone, back to front so indices stay valid
        for (std::size_t i = current.size(); i-- > 0;) {
            if (target_index.count(ids[i]) != 0) {
                continue;
            }
            ops_.push_back(Remove{index_path(path, i)});
            current_index.erase(ids[i]);
            current.erase(current.begin() + static_cast<std::ptrdiff_t>(i));
            ids.erase(ids.begin() + static_cast<std::ptrdiff_t>(i));
            for (auto& entry : current_index) {
                if (entry.second > i) {
                    --entry.second;
                }
            }
        }

        for (std::size_t i = 0; i < to.size(); ++i) {
            const Value& target = to[i];
            const std::string& target_id = (*to_ids)[i];

            if (i >= current.size()) {
                ops_.push_back(Add{path.child("-"), target});
                current.push_back(&target);
                ids.push_back(target_id);
                current_index[target_id] = current.size() - 1;
                continue;
            }

            if (ids[i] == target_id) {
                diff_at(index_path(path, i), *current[i], target, depth + 1);
                continue;
            }

            auto found = current_index.find(target_id);
            if (found != current_index.end()) {
                const std::size_t j = found->second;
                ops_.push_back(Move{index_path(path, j), index_path(path, i)});

                const Value* moved = current[j];
                std::string moved_id = ids[j];
                current.erase(current.begin() + static_cast<std::ptrdiff_t>(j));
                ids.erase(ids.begin() + static_cast<std::ptrdiff_t>(j));
                current.insert(current.begin() + static_cast<std::ptrdiff_t>(i), moved);
                ids.insert(ids.begin() + static_cast<std::ptrdiff_t>(i), std::move(moved_id));
                current_index = build_index(ids);

                diff_at(index_path(path, i), *current[i], target, depth + 1);
                continue;
            }

            ops_.push_back(Add{index_path(path, i), target});
            current.insert(current.begin() + static_cast<std::ptrdiff_t>(i), &target);
            ids.insert(ids.begin() + static_cast<std::ptrdiff_t>(i), target_id);
            current_index = build_index(ids);
        }

        return true;
    }

    /**
     * @brief Diff two lists by longest common subsequence
     *
     * Emits only removes and adds: every remove (highest index first), then
     * every add (lowest index first).
     *
     * @param item_depth Nesting depth of the list items
     */
    void diff_list_by_lcs(const Pointer& path, const Value& from, const Value& to,
                          std::size_t item_depth) {
        const std::size_t m = from.size();
        const std::size_t n = to.size();

        // table[i][j] = LCS length of from[0..i) and to[0..j)
        std::vector<std::vector<std::size_t>> table(m + 1, std::vector<std::size_t>(n + 1, 0));
        for (std::size_t i = 1; i <= m; ++i) {
            for (std::size_t j = 1; j <= n; ++j) {
                if (deep_equals(from[i - 1], to[j - 1], item_depth, options_.max_depth)) {
                    table[i][j] = table[i - 1][j - 1] + 1;
                } else {
                    table[i][j] = std::max(table[i - 1][j], table[i][j - 1]);
                }
            }
        }

        std::vector<std::size_t> removes; // collected highest index first
        std::vector<std::size_t> adds;    // collected highest index first

        std::size_t i = m;
        std::size_t j = n;
        while (i > 0 || j > 0) {
            if (i > 0 && j > 0 &&
                deep_equals(from[i - 1], to[j - 1], item_depth, options_.max_depth)) {
                --i;
                --j;
            } else if (j > 0 && (i == 0 || table[i][j - 1] >= table[i - 1][j])) {
                adds.push_back(j - 1);
                --j;
            } else {
                removes.push_back(i - 1);
                --i;
            }
        }

        for (std::size_t index : removes) {
            ops_.push_back(Remove{index_path(path, index)});
        }
        for (auto it = adds.rbegin(); it != adds.rend(); ++it) {
            ops_.push_back(Add{index_path(path, *it), to[*it]});
        }
    }

    const DiffOptions& options_;
    Patch& ops_;
};

} // anonymous namespace

Patch diff(const Value& from, const Value& to, const DiffOptions& options) {
    Patch ops;
    // Identical documents need no depth budget, however deep they are
    if (deep_equals(from, to)) {
        return ops;
    }

    Differ differ(options, ops);
    differ.diff_at(Pointer(), from, to, 0);
    return ops;
}

} // namespace jpatch
