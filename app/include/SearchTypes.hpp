/*
 * Web search value types
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef SEARCH_TYPES_HPP
#define SEARCH_TYPES_HPP

#include "GatewayTypes.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct SearchQuery {
    std::string query;
    int count{10};                        // 1-25 results
    std::vector<std::string> domains;     // e.g. "*.gov"
    std::string recency;                  // "1d", "1w", "1m", "1y" or empty
    int timeout_ms{15000};
    std::optional<double> budget_ceiling; // Per-query cost cap (USD)
    std::string step;
};

struct SearchHit {
    std::string title;
    std::string url;
    std::string snippet;
    std::string published_date;
    std::optional<double> relevance_score;
};

/**
 * Normalized search result, as returned to callers and stored in the cache
 */
struct SearchResult {
    std::string query;
    std::vector<SearchHit> hits;
    std::string provider_id;
    bool cache_hit{false};
};

/**
 * Raw reply of one search provider call
 */
struct SearchReply {
    ReplyStatus status{ReplyStatus::NetworkError};
    int http_status{0};
    std::vector<SearchHit> hits;
    std::optional<double> reported_cost;
    std::string error;
    std::chrono::milliseconds retry_after{0};
};

/**
 * Result of SearchClient::search
 */
struct SearchOutcome {
    bool success{false};
    SearchResult result;
    double cost{0.0};
    std::chrono::milliseconds elapsed{0};

    FailureKind failure{FailureKind::None};
    std::string error_message;
    std::chrono::milliseconds retry_after{0};
    std::vector<AttemptNote> attempts;
};

#endif // SEARCH_TYPES_HPP
