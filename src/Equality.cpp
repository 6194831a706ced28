/**
 * @file Equality.cpp
 * @brief Implementation of deep equality
 */

#include "jpatch/Equality.hpp"
#include "jpatch/Errors.hpp"

#include <limits>
#include <vector>

namespace jpatch {

namespace {

struct Pending {
    const Value* a;
    const Value* b;
    std::size_t depth;
};

bool equal_walk(const Value& a, const Value& b, std::size_t depth, std::size_t max_depth) {
    std::vector<Pending> work;
    work.push_back({&a, &b, depth});

    while (!work.empty()) {
        const Pending next = work.back();
        work.pop_back();

        if (next.depth > max_depth) {
            throw DepthExceeded(max_depth);
        }

        const Value& x = *next.a;
        const Value& y = *next.b;
        const Kind kind = kind_of(x);
        if (kind != kind_of(y)) {
            return false;
        }

        switch (kind) {
            case Kind::List: {
                if (x.size() != y.size()) {
                    return false;
                }
                for (std::size_t i = x.size(); i-- > 0;) {
                    work.push_back({&x[i], &y[i], next.depth + 1});
                }
                break;
            }

            case Kind::Map: {
                if (x.size() != y.size()) {
                    return false;
                }
                // Same size, so every key of x present in y means equal key sets
                for (auto it = x.begin(); it != x.end(); ++it) {
                    auto other = y.find(it.key());
                    if (other == y.end()) {
                        return false;
                    }
                    work.push_back({&it.value(), &(*other), next.depth + 1});
                }
                break;
            }

            default:
                // Signed and unsigned storage compare by value here
                if (x != y) {
                    return false;
                }
                break;
        }
    }

    return true;
}

} // anonymous namespace

bool deep_equals(const Value& a, const Value& b) {
    return equal_walk(a, b, 0, std::numeric_limits<std::size_t>::max());
}

bool deep_equals(const Value& a, const Value& b, std::size_t depth, std::size_t max_depth) {
    return equal_walk(a, b, depth, max_depth);
}

} // namespace jpatch
