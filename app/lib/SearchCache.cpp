/*
 * In-memory search cache implementation
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "SearchCache.hpp"

InMemorySearchCache::InMemorySearchCache(std::chrono::seconds ttl, TimeSource now)
    : ttl_(ttl)
    , now_(std::move(now))
{}

InMemorySearchCache::Clock::time_point InMemorySearchCache::now() const
{
    return now_ ? now_() : Clock::now();
}

std::optional<SearchResult> InMemorySearchCache::get(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }

    if (now() - it->second.stored_at >= ttl_) {
        entries_.erase(it);
        ++misses_;
        return std::nullopt;
    }

    ++hits_;
    return it->second.result;
}

void InMemorySearchCache::put(const std::string& key, const SearchResult& result)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = now();
    if (current - last_sweep_ >= ttl_) {
        sweep_expired_locked(current);
    }
    entries_[key] = Entry{result, current};
}

void InMemorySearchCache::sweep_expired_locked(Clock::time_point current)
{
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (current - it->second.stored_at >= ttl_) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    last_sweep_ = current;
}

SearchCacheStats InMemorySearchCache::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    SearchCacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.entries = entries_.size();
    return stats;
}

void InMemorySearchCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}
