/**
 * @file PointerCache.hpp
 * @brief Bounded cache of parsed JSON Pointers
 *
 * Patches tend to repeat the same paths, so the applier can reuse parsed
 * pointers through a caller-owned cache. Eviction is FIFO: once the cache
 * is full, the entry inserted first is dropped, no matter how recently it
 * was read.
 *
 * Thread safety: a PointerCache is not synchronized. Give each thread its
 * own instance or guard a shared one with a lock.
 */

#ifndef JPATCH_POINTERCACHE_HPP
#define JPATCH_POINTERCACHE_HPP

#include "jpatch/Pointer.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>

namespace jpatch {

class PointerCache {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit PointerCache(std::size_t capacity = kDefaultCapacity);

    /**
     * @brief Parse pointer text, reusing a cached result when present
     *
     * @param raw Pointer text
     * @return Parsed pointer
     * @throws PointerSyntaxError if raw is malformed (nothing is cached)
     */
    Pointer parse(const std::string& raw);

    /// Drop every entry.
    void clear();

    bool contains(const std::string& raw) const;
    std::size_t size() const noexcept { return entries_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    std::unordered_map<std::string, Pointer> entries_;
    std::deque<std::string> order_; // insertion order, oldest first
};

/**
 * @brief Parse through the cache when one is given
 */
inline Pointer parse_pointer(const std::string& raw, PointerCache* cache) {
    return cache ? cache->parse(raw) : Pointer::parse(raw);
}

} // namespace jpatch

#endif // JPATCH_POINTERCACHE_HPP
