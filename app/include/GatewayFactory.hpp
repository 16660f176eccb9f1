/*
 * Assembles the gateway components from configuration
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef GATEWAY_FACTORY_HPP
#define GATEWAY_FACTORY_HPP

#include "CostTracker.hpp"
#include "GatewayConfig.hpp"
#include "HttpProviderBackend.hpp"
#include "LlmClient.hpp"
#include "ProviderRegistry.hpp"
#include "RateLimiter.hpp"
#include "SearchCache.hpp"
#include "SearchClient.hpp"

#include <memory>

/**
 * Shared components for one budget period. The clients borrow the tracker,
 * limiter and cache through shared ownership.
 */
struct Gateway {
    std::shared_ptr<const ProviderRegistry> registry;
    std::shared_ptr<CostTracker> cost_tracker;
    std::shared_ptr<RateLimiter> rate_limiter;
    std::shared_ptr<InMemorySearchCache> search_cache;
    std::unique_ptr<LlmClient> llm;
    std::unique_ptr<SearchClient> search;
};

class GatewayFactory {
public:
    /**
     * Build every component from a configuration
     * @param backend Optional transport (for testing); defaults to libcurl
     * @throws GatewayConfigError on duplicate provider ids
     */
    static Gateway create_from_config(const GatewayConfig& config,
                                      std::shared_ptr<HttpProviderBackend> backend = nullptr);

    /**
     * One window per provider that declares a rate limit
     */
    static std::shared_ptr<RateLimiter> create_rate_limiter(const ProviderRegistry& registry,
                                                            RateLimiter::TimeSource now = nullptr);
};

#endif // GATEWAY_FACTORY_HPP
