/*
 * Provider-resilient completion/embedding gateway
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef LLM_CLIENT_HPP
#define LLM_CLIENT_HPP

#include "CostTracker.hpp"
#include "GatewayTypes.hpp"
#include "ProviderRegistry.hpp"
#include "RateLimiter.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * Walks the ranked provider list for one logical request.
 *
 * For each candidate, in priority order:
 *   1. skip if the estimated cost does not fit the budget (budget-skipped)
 *   2. skip if the provider's rate window is full (rate-limited)
 *   3. call the provider; the first success wins and its cost is recorded
 *   4. a provider 429 counts as rate-limited, with its Retry-After hint
 *   5. a transient failure moves on to the next candidate
 *   6. a rejected request is surfaced immediately
 *
 * invoke() is const and safe to call from many threads at once; the cost
 * tracker and rate limiter carry all shared state.
 */
class LlmClient {
public:
    /**
     * Transport for one provider call. Must honour request.timeout_ms and
     * report failures through ProviderReply::status rather than throwing.
     */
    using ProviderBackend = std::function<ProviderReply(const ProviderConfig& provider,
                                                        const InvocationRequest& request)>;

    /**
     * @throws std::invalid_argument if registry, cost tracker or backend is missing
     */
    LlmClient(std::shared_ptr<const ProviderRegistry> registry,
              std::shared_ptr<CostTracker> cost_tracker,
              std::shared_ptr<RateLimiter> rate_limiter,
              ProviderBackend backend);

    /**
     * Serve one request with automatic failover
     */
    InvocationOutcome invoke(const InvocationRequest& request) const;

    /**
     * Convenience wrapper building a completion request from a prompt
     */
    InvocationOutcome complete(const std::string& prompt,
                               const std::string& system_prompt = "",
                               const std::string& step = "") const;

    /**
     * Convenience wrapper building an embedding request
     */
    InvocationOutcome embed(const std::vector<std::string>& inputs,
                            const std::string& step = "") const;

    /**
     * Pre-call cost estimate of `request` on `provider`
     */
    static double estimate_cost(const ProviderConfig& provider, const InvocationRequest& request);

    const ProviderRegistry& registry() const { return *registry_; }
    const CostTracker& cost_tracker() const { return *cost_tracker_; }

private:
    static int estimate_request_tokens(const InvocationRequest& request);
    static double actual_cost(const ProviderConfig& provider,
                              const ProviderReply& reply,
                              double estimate);
    ProviderReply call_backend(const ProviderConfig& provider,
                               const InvocationRequest& request) const;

    std::shared_ptr<const ProviderRegistry> registry_;
    std::shared_ptr<CostTracker> cost_tracker_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    ProviderBackend backend_;
};

#endif // LLM_CLIENT_HPP
