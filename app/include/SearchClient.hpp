/*
 * Provider-resilient web search gateway with a cache seam
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef SEARCH_CLIENT_HPP
#define SEARCH_CLIENT_HPP

#include "CostTracker.hpp"
#include "ProviderRegistry.hpp"
#include "RateLimiter.hpp"
#include "SearchCache.hpp"
#include "SearchTypes.hpp"

#include <functional>
#include <memory>
#include <string>

/**
 * Search counterpart of LlmClient.
 *
 * A cache hit returns immediately with cache_hit=true and consumes neither
 * budget nor rate-limit slots. A miss walks the search-capable providers
 * with the same budget/rate checks as completions; the first success is
 * written back to the cache. Exhausting every provider after at least one
 * failed attempt is reported as FailureKind::SearchFailed.
 */
class SearchClient {
public:
    using SearchBackend = std::function<SearchReply(const ProviderConfig& provider,
                                                    const SearchQuery& query)>;

    /**
     * @param cache Optional cache collaborator; nullptr disables caching
     * @throws std::invalid_argument if registry, cost tracker or backend is missing
     */
    SearchClient(std::shared_ptr<const ProviderRegistry> registry,
                 std::shared_ptr<CostTracker> cost_tracker,
                 std::shared_ptr<RateLimiter> rate_limiter,
                 SearchBackend backend,
                 SearchCachePtr cache = nullptr);

    SearchOutcome search(const SearchQuery& query) const;

    /**
     * Convenience wrapper with default parameters
     */
    SearchOutcome search(const std::string& query, int count = 10) const;

    /**
     * Lower-case, trim and collapse internal whitespace
     */
    static std::string normalize_query(const std::string& query);

    /**
     * Cache key covering the normalized query and every result-shaping parameter
     */
    static std::string cache_key(const SearchQuery& query);

private:
    SearchReply call_backend(const ProviderConfig& provider, const SearchQuery& query) const;

    std::shared_ptr<const ProviderRegistry> registry_;
    std::shared_ptr<CostTracker> cost_tracker_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    SearchBackend backend_;
    SearchCachePtr cache_;
};

#endif // SEARCH_CLIENT_HPP
