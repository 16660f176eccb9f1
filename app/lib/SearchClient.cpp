/*
 * Provider-resilient web search gateway implementation
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "SearchClient.hpp"
#include "FailoverSupport.hpp"
#include "Logger.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // namespace

SearchClient::SearchClient(std::shared_ptr<const ProviderRegistry> registry,
                           std::shared_ptr<CostTracker> cost_tracker,
                           std::shared_ptr<RateLimiter> rate_limiter,
                           SearchBackend backend,
                           SearchCachePtr cache)
    : registry_(std::move(registry))
    , cost_tracker_(std::move(cost_tracker))
    , rate_limiter_(std::move(rate_limiter))
    , backend_(std::move(backend))
    , cache_(std::move(cache))
{
    if (!registry_ || !cost_tracker_ || !backend_) {
        throw std::invalid_argument("SearchClient requires a registry, a cost tracker and a backend");
    }
}

std::string SearchClient::normalize_query(const std::string& query)
{
    std::string normalized;
    normalized.reserve(query.size());

    bool pending_space = false;
    for (unsigned char c : query) {
        if (std::isspace(c)) {
            pending_space = !normalized.empty();
            continue;
        }
        if (pending_space) {
            normalized += ' ';
            pending_space = false;
        }
        normalized += static_cast<char>(std::tolower(c));
    }
    return normalized;
}

std::string SearchClient::cache_key(const SearchQuery& query)
{
    std::vector<std::string> domains = query.domains;
    std::sort(domains.begin(), domains.end());

    Json::Value key(Json::objectValue);
    key["query"] = normalize_query(query.query);
    key["count"] = query.count;
    key["recency"] = query.recency;
    key["domains"] = Json::Value(Json::arrayValue);
    for (const auto& domain : domains) {
        key["domains"].append(domain);
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, key);
}

SearchReply SearchClient::call_backend(const ProviderConfig& provider,
                                       const SearchQuery& query) const
{
    try {
        return backend_(provider, query);
    } catch (const std::exception& ex) {
        SearchReply reply;
        reply.status = ReplyStatus::NetworkError;
        reply.error = std::string("Search transport threw: ") + ex.what();
        return reply;
    }
}

SearchOutcome SearchClient::search(const SearchQuery& query) const
{
    const auto start_time = std::chrono::steady_clock::now();
    auto logger = Logger::get_logger("search_logger");

    SearchOutcome outcome;
    outcome.result.query = query.query;

    const std::string key = cache_key(query);
    if (cache_) {
        if (auto cached = cache_->get(key)) {
            outcome.success = true;
            outcome.result = std::move(*cached);
            outcome.result.query = query.query;
            outcome.result.cache_hit = true;
            outcome.elapsed = elapsed_since(start_time);
            if (logger) {
                logger->debug("Search cache hit: {}", query.query);
            }
            return outcome;
        }
        if (logger) {
            logger->debug("Search cache miss: {}", query.query);
        }
    }

    const auto candidates = registry_->candidates_for(ProviderCapability::Search);
    if (candidates.empty()) {
        outcome.failure = FailureKind::Configuration;
        outcome.error_message = "No search providers configured";
        if (logger) {
            logger->error("{}", outcome.error_message);
        }
        return outcome;
    }

    for (const auto& provider : candidates) {
        AttemptNote note;
        note.provider_id = provider.id;

        const double estimate = provider.cost.price(0, 0);

        if (query.budget_ceiling && estimate > *query.budget_ceiling) {
            note.disposition = AttemptDisposition::BudgetSkipped;
            note.reason = "query price exceeds request cap";
            outcome.attempts.push_back(std::move(note));
            continue;
        }

        auto reservation = cost_tracker_->try_reserve(estimate);
        if (!reservation) {
            note.disposition = AttemptDisposition::BudgetSkipped;
            note.reason = "query price exceeds remaining budget";
            if (logger) {
                logger->debug("Skipping {}: {}", provider.id, note.reason);
            }
            outcome.attempts.push_back(std::move(note));
            continue;
        }

        if (rate_limiter_) {
            const RateDecision decision = rate_limiter_->try_acquire(provider.id);
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
        SearchReply reply = call_backend(provider, query);
        note.elapsed = elapsed_since(attempt_start);

        if (reply.status == ReplyStatus::Ok) {
            const double cost = reply.reported_cost.value_or(estimate);
            cost_tracker_->commit(*reservation, provider.id, cost, provider.model, query.step);

            note.disposition = AttemptDisposition::Succeeded;
            outcome.attempts.push_back(std::move(note));

            outcome.success = true;
            outcome.cost = cost;
            outcome.result.hits = std::move(reply.hits);
            outcome.result.provider_id = provider.id;
            outcome.result.cache_hit = false;

            if (cache_) {
                cache_->put(key, outcome.result);
            }

            outcome.elapsed = elapsed_since(start_time);
            if (logger) {
                logger->info("{} answered search '{}' with {} hit(s) in {}ms",
                             provider.id, query.query, outcome.result.hits.size(),
                             outcome.elapsed.count());
            }
            return outcome;
        }

        if (reply.status == ReplyStatus::Rejected) {
            note.disposition = AttemptDisposition::Rejected;
            note.reason = reply.error;
            outcome.attempts.push_back(std::move(note));

            outcome.failure = FailureKind::RequestRejected;
            outcome.result.provider_id = provider.id;
            outcome.error_message = "Search rejected by " + provider.id + ": " + reply.error;
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
                logger->warn("Search provider {} throttled the query (retry after {}ms), trying next candidate",
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
            logger->warn("Search provider {} failed, trying next candidate: {}",
                         provider.id, note.reason);
        }
        outcome.attempts.push_back(std::move(note));
    }

    const ExhaustionSummary summary = classify_exhaustion(outcome.attempts,
                                                          FailureKind::SearchFailed);
    outcome.failure = summary.kind;
    outcome.error_message = summary.message;
    outcome.retry_after = summary.retry_after;
    outcome.elapsed = elapsed_since(start_time);

    if (logger) {
        logger->error("Search '{}' exhausted every provider ({})", query.query,
                      to_string(summary.kind));
    }
    return outcome;
}

SearchOutcome SearchClient::search(const std::string& query, int count) const
{
    SearchQuery request;
    request.query = query;
    request.count = count;
    return search(request);
}
