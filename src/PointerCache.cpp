/**
 * @file PointerCache.cpp
 * @brief Implementation of the FIFO pointer cache
 */

#include "jpatch/PointerCache.hpp"

namespace jpatch {

PointerCache::PointerCache(std::size_t capacity)
    : capacity_(capacity)
{}

Pointer PointerCache::parse(const std::string& raw) {
    auto it = entries_.find(raw);
    if (it != entries_.end()) {
        return it->second;
    }

    Pointer parsed = Pointer::parse(raw);
    if (capacity_ == 0) {
        return parsed;
    }

    if (entries_.size() >= capacity_) {
        entries_.erase(order_.front());
        order_.pop_front();
    }

    entries_.emplace(raw, parsed);
    order_.push_back(raw);
    return parsed;
}

void PointerCache::clear() {
    entries_.clear();
    order_.clear();
}

bool PointerCache::contains(const std::string& raw) const {
    return entries_.find(raw) != entries_.end();
}

} // namespace jpatch
