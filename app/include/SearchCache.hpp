/*
 * Cache collaborator for the search gateway
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef SEARCH_CACHE_HPP
#define SEARCH_CACHE_HPP

#include "SearchTypes.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/**
 * Abstract cache consulted before any search provider is contacted.
 * Eviction is entirely up to the implementation.
 */
class ISearchCache {
public:
    virtual ~ISearchCache() = default;

    virtual std::optional<SearchResult> get(const std::string& key) = 0;
    virtual void put(const std::string& key, const SearchResult& result) = 0;
};

using SearchCachePtr = std::shared_ptr<ISearchCache>;

struct SearchCacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::size_t entries{0};

    double hit_rate() const {
        const auto lookups = hits + misses;
        return lookups == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(lookups);
    }
};

/**
 * Process-local cache with a fixed time-to-live per entry.
 * Expired entries are dropped on lookup, and put() sweeps the whole map
 * at most once per TTL period.
 */
class InMemorySearchCache : public ISearchCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    explicit InMemorySearchCache(std::chrono::seconds ttl = std::chrono::hours(1),
                                 TimeSource now = nullptr);

    std::optional<SearchResult> get(const std::string& key) override;
    void put(const std::string& key, const SearchResult& result) override;

    SearchCacheStats stats() const;
    void clear();

private:
    struct Entry {
        SearchResult result;
        Clock::time_point stored_at;
    };

    Clock::time_point now() const;
    void sweep_expired_locked(Clock::time_point current);

    std::chrono::seconds ttl_;
    TimeSource now_;
    Clock::time_point last_sweep_{};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
};

#endif // SEARCH_CACHE_HPP
