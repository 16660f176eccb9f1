/*
 * Gateway assembly
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "GatewayFactory.hpp"
#include "Logger.hpp"

Gateway GatewayFactory::create_from_config(const GatewayConfig& config,
                                           std::shared_ptr<HttpProviderBackend> backend)
{
    if (!backend) {
        backend = std::make_shared<HttpProviderBackend>();
    }

    Gateway gateway;
    gateway.registry = std::make_shared<ProviderRegistry>(config.providers);
    gateway.cost_tracker = std::make_shared<CostTracker>(config.budget_ceiling_usd,
                                                         config.alert_threshold);
    gateway.rate_limiter = create_rate_limiter(*gateway.registry);
    gateway.search_cache = std::make_shared<InMemorySearchCache>(config.search_cache_ttl);

    gateway.llm = std::make_unique<LlmClient>(
        gateway.registry, gateway.cost_tracker, gateway.rate_limiter,
        [backend](const ProviderConfig& provider, const InvocationRequest& request) {
            return backend->complete(provider, request);
        });

    gateway.search = std::make_unique<SearchClient>(
        gateway.registry, gateway.cost_tracker, gateway.rate_limiter,
        [backend](const ProviderConfig& provider, const SearchQuery& query) {
            return backend->search(provider, query);
        },
        gateway.search_cache);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Gateway ready: {} provider(s), budget ${:.2f}",
                     gateway.registry->size(), config.budget_ceiling_usd);
    }

    return gateway;
}

std::shared_ptr<RateLimiter> GatewayFactory::create_rate_limiter(const ProviderRegistry& registry,
                                                                 RateLimiter::TimeSource now)
{
    auto limiter = std::make_shared<RateLimiter>(std::move(now));
    for (const auto& provider : registry.providers()) {
        if (provider.rate_limit.enabled()) {
            limiter->configure(provider.id, provider.rate_limit);
        }
    }
    return limiter;
}
