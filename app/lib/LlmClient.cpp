/*
 * Provider-resilient completion/embedding gateway implementation
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "LlmClient.hpp"
#include "FailoverSupport.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

std::string format_usd(double amount)
{
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "$%.6f", amount);
    return buffer;
}

} // namespace

LlmClient::LlmClient(std::shared_ptr<const ProviderRegistry> registry,
                     std::shared_ptr<CostTracker> cost_tracker,
                     std::shared_ptr<RateLimiter> rate_limiter,
                     ProviderBackend backend)
    : registry_(std::move(registry))
    , cost_tracker_(std::move(cost_tracker))
    , rate_limiter_(std::move(rate_limiter))
    , backend_(std::move(backend))
{
    if (!registry_ || !cost_tracker_ || !backend_) {
        throw std::invalid_argument("LlmClient requires a registry, a cost tracker and a backend");
    }
}

int LlmClient::estimate_request_tokens(const InvocationRequest& request)
{
    int tokens = 0;
    if (request.capability == ProviderCapability::Embedding) {
        for (const auto& input : request.embedding_inputs) {
            tokens += estimate_tokens(input);
        }
    } else {
        for (const auto& msg : request.messages) {
            tokens += estimate_tokens(msg.content);
        }
    }
    return tokens;
}

double LlmClient::estimate_cost(const ProviderConfig& provider, const InvocationRequest& request)
{
    const int input_tokens = estimate_request_tokens(request);
    const int output_tokens = request.capability == ProviderCapability::Embedding
        ? 0
        : std::max(0, request.max_tokens);
    return provider.cost.price(input_tokens, output_tokens);
}

double LlmClient::actual_cost(const ProviderConfig& provider,
                              const ProviderReply& reply,
                              double estimate)
{
    if (reply.reported_cost) {
        return *reply.reported_cost;
    }
    if (reply.usage.prompt_tokens > 0 || reply.usage.completion_tokens > 0) {
        return provider.cost.price(reply.usage.prompt_tokens, reply.usage.completion_tokens);
    }
    return estimate;
}

ProviderReply LlmClient::call_backend(const ProviderConfig& provider,
                                      const InvocationRequest& request) const
{
    try {
        return backend_(provider, request);
    } catch (const std::exception& ex) {
        ProviderReply reply;
        reply.status = ReplyStatus::NetworkError;
        reply.error = std::string("Provider transport threw: ") + ex.what();
        return reply;
    }
}

InvocationOutcome LlmClient::invoke(const InvocationRequest& request) const
{
    const auto start_time = std::chrono::steady_clock::now();
    auto logger = Logger::get_logger("core_logger");

    InvocationOutcome outcome;

    const auto candidates = registry_->candidates_for(request.capability);
    if (candidates.empty()) {
        outcome.failure = FailureKind::Configuration;
        outcome.error_message = std::string("No providers configured for capability '") +
                                to_string(request.capability) + "'";
        if (logger) {
            logger->error("{}", outcome.error_message);
        }
        return outcome;
    }

    const int request_tokens = estimate_request_tokens(request) +
        (request.capability == ProviderCapability::Embedding ? 0 : std::max(0, request.max_tokens));

    for (const auto& provider : candidates) {
        AttemptNote note;
        note.provider_id = provider.id;

        const double estimate = estimate_cost(provider, request);

        if (request.budget_ceiling && estimate > *request.budget_ceiling) {
            note.disposition = AttemptDisposition::BudgetSkipped;
            note.reason = "estimated " + format_usd(estimate) + " exceeds request cap " +
                          format_usd(*request.budget_ceiling);
            if (logger) {
                logger->debug("Skipping {}: {}", provider.id, note.reason);
            }
            outcome.attempts.push_back(std::move(note));
            continue;
        }

        auto reservation = cost_tracker_->try_reserve(estimate);
        if (!reservation) {
            note.disposition = AttemptDisposition::BudgetSkipped;
            note.reason = "estimated " + format_usd(estimate) + " exceeds remaining budget " +
                          format_usd(cost_tracker_->remaining_budget());
            if (logger) {
                logger->debug("Skipping {}: {}", provider.id, note.reason);
            }
            outcome.attempts.push_back(std::move(note));
            continue;
        }

        if (rate_limiter_) {
            const RateDecision decision = rate_limiter_->try_acquire(provider.id, request_tokens);
            if (!decision.allowed) {
                note.disposition = AttemptDisposition::RateLimited;
                note.retry_after = decision.retry_after;
                note.reason = "window full, retry after " +
                              std::to_string(decision.retry_after.count()) + "ms";
                if (logger) {
                    logger->debug("Skipping {}: {}", provider.id, note.reason);
                }
                outcome.attempts.push_back(std::move(note));
                continue;
            }
        }

        const auto attempt_start = std::chrono::steady_clock::now();
        ProviderReply reply = call_backend(provider, request);
        note.elapsed = elapsed_since(attempt_start);

        if (reply.status == ReplyStatus::Ok) {
            const double cost = actual_cost(provider, reply, estimate);
            cost_tracker_->commit(*reservation, provider.id, cost, provider.model, request.step);

            note.disposition = AttemptDisposition::Succeeded;
            outcome.attempts.push_back(std::move(note));

            outcome.success = true;
            outcome.provider_id = provider.id;
            outcome.model_used = provider.model;
            outcome.cost = cost;
            outcome.reply = std::move(reply);
            outcome.elapsed = elapsed_since(start_time);

            if (logger) {
                logger->info("{} served {} request in {}ms (cost {}, {} attempt(s))",
                             provider.id, to_string(request.capability), outcome.elapsed.count(),
                             format_usd(cost), outcome.attempts.size());
            }
            return outcome;
        }

        if (reply.status == ReplyStatus::Rejected) {
            note.disposition = AttemptDisposition::Rejected;
            note.reason = reply.error;
            outcome.attempts.push_back(std::move(note));

            outcome.failure = FailureKind::RequestRejected;
            outcome.provider_id = provider.id;
            outcome.model_used = provider.model;
            outcome.error_message = "Request rejected by " + provider.id + ": " + reply.error;
            outcome.reply = std::move(reply);
            outcome.elapsed = elapsed_since(start_time);

            if (logger) {
                logger->error("{}", outcome.error_message);
            }
            return outcome;
        }

        if (reply.status == ReplyStatus::Throttled) {
            note.disposition = AttemptDisposition::RateLimited;
            note.retry_after = reply.retry_after;
            note.reason = "throttled by provider" + (reply.error.empty() ? "" : ": " + reply.error);
            if (logger) {
                logger->warn("Provider {} throttled the request (retry after {}ms), trying next candidate",
                             provider.id, reply.retry_after.count());
            }
            outcome.attempts.push_back(std::move(note));
            continue;
        }

        note.disposition = AttemptDisposition::TransientFailure;
        note.retry_after = reply.retry_after;
        note.reason = std::string(to_string(reply.status)) +
                      (reply.error.empty() ? "" : ": " + reply.error);
        if (logger) {
            logger->warn("Provider {} failed, trying next candidate: {}", provider.id, note.reason);
        }
        outcome.attempts.push_back(std::move(note));
    }

    const ExhaustionSummary summary = classify_exhaustion(outcome.attempts,
                                                          FailureKind::AllProvidersFailed);
    outcome.failure = summary.kind;
    outcome.error_message = summary.message;
    outcome.retry_after = summary.retry_after;
    outcome.elapsed = elapsed_since(start_time);

    if (logger) {
        logger->error("{} request exhausted every provider ({}): {}",
                      to_string(request.capability), to_string(summary.kind), summary.message);
    }
    return outcome;
}

InvocationOutcome LlmClient::complete(const std::string& prompt,
                                      const std::string& system_prompt,
                                      const std::string& step) const
{
    InvocationRequest request;
    request.capability = ProviderCapability::Completion;
    request.step = step;
    if (!system_prompt.empty()) {
        request.messages.push_back({MessageRole::System, system_prompt});
    }
    request.messages.push_back({MessageRole::User, prompt});
    return invoke(request);
}

InvocationOutcome LlmClient::embed(const std::vector<std::string>& inputs,
                                   const std::string& step) const
{
    InvocationRequest request;
    request.capability = ProviderCapability::Embedding;
    request.embedding_inputs = inputs;
    request.step = step;
    return invoke(request);
}
