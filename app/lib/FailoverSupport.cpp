/*
 * Shared pieces of the ranked-candidate failover walk
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "FailoverSupport.hpp"

#include <algorithm>
#include <optional>

ExhaustionSummary classify_exhaustion(const std::vector<AttemptNote>& attempts,
                                      FailureKind errored_kind)
{
    ExhaustionSummary summary;

    std::size_t budget_skipped = 0;
    std::size_t errored = 0;
    std::optional<std::chrono::milliseconds> shortest_wait;

    std::string reasons;
    for (const auto& note : attempts) {
        switch (note.disposition) {
            case AttemptDisposition::BudgetSkipped:
                ++budget_skipped;
                break;
            case AttemptDisposition::RateLimited:
                // A 429 without Retry-After carries no hint
                if (note.retry_after.count() <= 0) {
                    break;
                }
                if (!shortest_wait || note.retry_after < *shortest_wait) {
                    shortest_wait = note.retry_after;
                }
                break;
            case AttemptDisposition::TransientFailure:
            case AttemptDisposition::Rejected:
                ++errored;
                break;
            case AttemptDisposition::Succeeded:
                break;
        }

        if (!reasons.empty()) {
            reasons += "; ";
        }
        reasons += note.provider_id + ": " + to_string(note.disposition);
        if (!note.reason.empty()) {
            reasons += " (" + note.reason + ")";
        }
    }

    if (errored > 0) {
        summary.kind = errored_kind;
        summary.message = "All " + std::to_string(attempts.size()) +
                          " providers failed. " + reasons;
    } else if (!attempts.empty() && budget_skipped == attempts.size()) {
        summary.kind = FailureKind::BudgetExceeded;
        summary.message = "Budget exceeded for every provider. " + reasons;
    } else {
        summary.kind = FailureKind::RateLimited;
        summary.retry_after = shortest_wait.value_or(std::chrono::milliseconds(0));
        summary.message = "Every provider is rate limited; retry after " +
                          std::to_string(summary.retry_after.count()) + "ms. " + reasons;
    }

    return summary;
}

ReplyStatus classify_http_status(long status_code)
{
    if (status_code >= 200 && status_code < 300) {
        return ReplyStatus::Ok;
    }
    if (status_code == 429) {
        return ReplyStatus::Throttled;
    }
    if (status_code == 408 || status_code == 504) {
        return ReplyStatus::Timeout;
    }
    if (status_code == 401 || status_code == 403) {
        return ReplyStatus::AuthError;
    }
    if (status_code == 400 || status_code == 413 || status_code == 422) {
        return ReplyStatus::Rejected;
    }
    if (status_code <= 0) {
        return ReplyStatus::NetworkError;
    }
    // 5xx and provider-specific 4xx (unknown model, moved endpoint) are
    // problems of this provider, not of the request.
    return ReplyStatus::ServerError;
}

int estimate_tokens(const std::string& text)
{
    return static_cast<int>((text.size() + 3) / 4);
}
