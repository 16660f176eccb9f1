/*
 * String conversions for gateway value types
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "GatewayTypes.hpp"

const char* to_string(ProviderCapability capability)
{
    switch (capability) {
        case ProviderCapability::Completion: return "completion";
        case ProviderCapability::Embedding: return "embedding";
        case ProviderCapability::Search: return "search";
        case ProviderCapability::None: return "none";
    }
    return "mixed";
}

const char* to_string(ProviderFamily family)
{
    switch (family) {
        case ProviderFamily::ChatCompletion: return "chat";
        case ProviderFamily::Embedding: return "embedding";
        case ProviderFamily::WebSearch: return "search";
    }
    return "unknown";
}

const char* to_string(ReplyStatus status)
{
    switch (status) {
        case ReplyStatus::Ok: return "ok";
        case ReplyStatus::NetworkError: return "network_error";
        case ReplyStatus::Timeout: return "timeout";
        case ReplyStatus::ServerError: return "server_error";
        case ReplyStatus::Throttled: return "throttled";
        case ReplyStatus::AuthError: return "auth_error";
        case ReplyStatus::Rejected: return "rejected";
    }
    return "unknown";
}

const char* to_string(FailureKind kind)
{
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::Configuration: return "configuration";
        case FailureKind::BudgetExceeded: return "budget_exceeded";
        case FailureKind::RateLimited: return "rate_limited";
        case FailureKind::AllProvidersFailed: return "all_providers_failed";
        case FailureKind::RequestRejected: return "request_rejected";
        case FailureKind::SearchFailed: return "search_failed";
    }
    return "unknown";
}

const char* to_string(AttemptDisposition disposition)
{
    switch (disposition) {
        case AttemptDisposition::BudgetSkipped: return "budget-skipped";
        case AttemptDisposition::RateLimited: return "rate-limited";
        case AttemptDisposition::TransientFailure: return "transient-failure";
        case AttemptDisposition::Rejected: return "rejected";
        case AttemptDisposition::Succeeded: return "succeeded";
    }
    return "unknown";
}

std::optional<ProviderCapability> capability_from_string(const std::string& name)
{
    if (name == "completion") return ProviderCapability::Completion;
    if (name == "embedding") return ProviderCapability::Embedding;
    if (name == "search") return ProviderCapability::Search;
    return std::nullopt;
}

std::optional<ProviderFamily> family_from_string(const std::string& name)
{
    if (name == "chat") return ProviderFamily::ChatCompletion;
    if (name == "embedding") return ProviderFamily::Embedding;
    if (name == "search") return ProviderFamily::WebSearch;
    return std::nullopt;
}
