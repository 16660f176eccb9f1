/*
 * Per-provider request/token windows implementation
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "RateLimiter.hpp"
#include "Logger.hpp"

#include <algorithm>

RateLimiter::RateLimiter(TimeSource now)
    : now_(std::move(now))
{}

RateLimiter::Clock::time_point RateLimiter::now() const
{
    return now_ ? now_() : Clock::now();
}

void RateLimiter::configure(const std::string& provider_id, const RateLimitConfig& limit)
{
    if (!limit.enabled()) {
        windows_.erase(provider_id);
        return;
    }

    auto window = std::make_unique<ProviderWindow>();
    window->limit = limit;
    if (window->limit.window.count() <= 0) {
        window->limit.window = std::chrono::seconds(60);
    }
    windows_[provider_id] = std::move(window);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Rate limit for {}: {} calls / {} tokens per {}ms",
                      provider_id, limit.max_calls, limit.max_tokens, limit.window.count());
    }
}

RateDecision RateLimiter::try_acquire(const std::string& provider_id, int tokens)
{
    auto it = windows_.find(provider_id);
    if (it == windows_.end()) {
        return RateDecision{};
    }

    ProviderWindow& window = *it->second;
    const auto current = now();

    std::lock_guard<std::mutex> lock(window.mutex);

    if (!window.started || current - window.state.window_start >= window.limit.window) {
        window.state = RateWindowState{current, 0, 0};
        window.started = true;
    }

    tokens = std::max(0, tokens);
    const bool calls_exhausted = window.limit.max_calls > 0 &&
                                 window.state.calls >= window.limit.max_calls;
    // A charge larger than the whole budget can never fit, so it is admitted
    // into a window with no tokens spent and uses that window up.
    const bool oversized_into_fresh = tokens > window.limit.max_tokens && window.state.tokens == 0;
    const bool tokens_exhausted = window.limit.max_tokens > 0 && !oversized_into_fresh &&
                                  window.state.tokens + tokens > window.limit.max_tokens;

    if (calls_exhausted || tokens_exhausted) {
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
            window.state.window_start + window.limit.window - current);
        RateDecision decision;
        decision.allowed = false;
        decision.retry_after = std::max(wait, std::chrono::milliseconds(1));
        return decision;
    }

    window.state.calls += 1;
    window.state.tokens += tokens;
    return RateDecision{};
}

std::optional<RateWindowState> RateLimiter::window_state(const std::string& provider_id) const
{
    auto it = windows_.find(provider_id);
    if (it == windows_.end()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(it->second->mutex);
    if (!it->second->started) {
        return std::nullopt;
    }
    return it->second->state;
}

bool RateLimiter::is_limited(const std::string& provider_id) const
{
    return windows_.count(provider_id) > 0;
}
