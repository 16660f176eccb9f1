/*
 * Per-provider request/token windows
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include "GatewayTypes.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/**
 * Admission decision for one call
 */
struct RateDecision {
    bool allowed{true};
    std::chrono::milliseconds retry_after{0};   // Positive when denied
};

/**
 * Observable window counters of one provider
 */
struct RateWindowState {
    std::chrono::steady_clock::time_point window_start;
    int calls{0};
    int tokens{0};
};

/**
 * Fixed-window call/token counter per provider.
 *
 * Windows are configured up front (configure() is not safe to call while
 * other threads are acquiring). Each provider has its own lock, so
 * providers never contend with each other. A denial is advisory
 * backpressure, not an error. Providers without a configured limit are
 * always admitted.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    /**
     * @param now Optional time source (for testing); defaults to steady_clock
     */
    explicit RateLimiter(TimeSource now = nullptr);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    void configure(const std::string& provider_id, const RateLimitConfig& limit);

    /**
     * Admit the call (consuming one slot and `tokens` from the window) or
     * deny it with the time until the window rolls over. A charge above
     * max_tokens is admitted only into a window with no tokens spent yet.
     */
    RateDecision try_acquire(const std::string& provider_id, int tokens = 0);

    std::optional<RateWindowState> window_state(const std::string& provider_id) const;
    bool is_limited(const std::string& provider_id) const;

private:
    struct ProviderWindow {
        RateLimitConfig limit;
        std::mutex mutex;
        RateWindowState state;
        bool started{false};
    };

    Clock::time_point now() const;

    TimeSource now_;
    std::unordered_map<std::string, std::unique_ptr<ProviderWindow>> windows_;
};

#endif // RATE_LIMITER_HPP
