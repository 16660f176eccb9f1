/*
 * Shared pieces of the ranked-candidate failover walk
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef FAILOVER_SUPPORT_HPP
#define FAILOVER_SUPPORT_HPP

#include "GatewayTypes.hpp"

#include <chrono>
#include <string>
#include <vector>

/**
 * Terminal classification of a walk in which no candidate succeeded
 */
struct ExhaustionSummary {
    FailureKind kind{FailureKind::AllProvidersFailed};
    std::string message;
    std::chrono::milliseconds retry_after{0};
};

/**
 * Reduce per-candidate notes to one failure kind.
 *
 * - any candidate actually attempted and failed -> `errored_kind`
 * - every candidate skipped for budget           -> BudgetExceeded
 * - otherwise (rate limited, possibly mixed with budget skips)
 *                                                -> RateLimited, with the
 *   smallest positive suggested wait among rate-limited candidates
 *   (local window denials and provider 429s alike)
 *
 * @param errored_kind AllProvidersFailed for completions, SearchFailed for search
 */
ExhaustionSummary classify_exhaustion(const std::vector<AttemptNote>& attempts,
                                      FailureKind errored_kind);

/**
 * Map an HTTP status code to a reply classification
 */
ReplyStatus classify_http_status(long status_code);

/**
 * Rough prompt token count used for pre-call cost estimates (4 chars/token)
 */
int estimate_tokens(const std::string& text);

#endif // FAILOVER_SUPPORT_HPP
