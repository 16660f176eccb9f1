/*
 * Core value types shared by the invocation and search gateways
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef GATEWAY_TYPES_HPP
#define GATEWAY_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Capability tags a provider can serve
 */
enum class ProviderCapability : uint32_t {
    None       = 0,
    Completion = 1 << 0,   // Chat/text completion
    Embedding  = 1 << 1,   // Vector embeddings
    Search     = 1 << 2,   // Web search
};

inline ProviderCapability operator|(ProviderCapability a, ProviderCapability b) {
    return static_cast<ProviderCapability>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline ProviderCapability operator&(ProviderCapability a, ProviderCapability b) {
    return static_cast<ProviderCapability>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline bool has_capability(ProviderCapability caps, ProviderCapability flag) {
    return (static_cast<uint32_t>(caps) & static_cast<uint32_t>(flag)) != 0;
}

/**
 * Wire family of a provider endpoint
 */
enum class ProviderFamily {
    ChatCompletion,
    Embedding,
    WebSearch,
};

/**
 * Per-call pricing of a provider
 */
struct CostModel {
    double per_1k_input_tokens{0.0};
    double per_1k_output_tokens{0.0};
    double per_call{0.0};            // Flat charge, e.g. per search query

    double price(int input_tokens, int output_tokens) const {
        return per_call
            + per_1k_input_tokens * static_cast<double>(input_tokens) / 1000.0
            + per_1k_output_tokens * static_cast<double>(output_tokens) / 1000.0;
    }
};

/**
 * Per-provider request/token ceiling over a fixed window.
 * Zero means unlimited for that dimension.
 */
struct RateLimitConfig {
    int max_calls{0};
    int max_tokens{0};
    std::chrono::milliseconds window{std::chrono::seconds(60)};

    bool enabled() const { return max_calls > 0 || max_tokens > 0; }
};

/**
 * Immutable provider entry loaded from configuration
 */
struct ProviderConfig {
    std::string id;
    ProviderFamily family{ProviderFamily::ChatCompletion};
    std::string model;
    std::string base_url;
    std::string credential_env;      // Environment variable holding the API key
    int priority{0};                 // Lower is tried first
    ProviderCapability capabilities{ProviderCapability::None};
    CostModel cost;
    RateLimitConfig rate_limit;
};

enum class MessageRole {
    System,
    User,
    Assistant,
};

struct ChatMessage {
    MessageRole role;
    std::string content;
};

struct TokenUsage {
    int prompt_tokens{0};
    int completion_tokens{0};
    int total_tokens{0};
};

/**
 * One logical request to the invocation gateway
 */
struct InvocationRequest {
    std::vector<ChatMessage> messages;
    std::vector<std::string> embedding_inputs;              // Used when capability is Embedding
    ProviderCapability capability{ProviderCapability::Completion};
    float temperature{0.7f};
    int max_tokens{1024};
    int timeout_ms{30000};
    std::optional<double> budget_ceiling;                   // Per-request cost cap (USD)
    std::string step;                                       // Pipeline step label for cost breakdown
};

/**
 * Transport-level classification of a provider reply
 */
enum class ReplyStatus {
    Ok,
    NetworkError,
    Timeout,
    ServerError,     // 5xx / overloaded
    Throttled,       // Provider answered 429
    AuthError,       // Missing or refused credentials
    Rejected,        // Request shape refused by the provider
};

/**
 * Raw reply of a single provider call
 */
struct ProviderReply {
    ReplyStatus status{ReplyStatus::NetworkError};
    int http_status{0};
    std::string text;
    std::vector<std::vector<float>> embeddings;
    TokenUsage usage;
    std::optional<double> reported_cost;                    // Provider-reported price, if any
    std::string error;
    std::chrono::milliseconds retry_after{0};
};

/**
 * Failure discriminator surfaced to callers
 */
enum class FailureKind {
    None,
    Configuration,        // No provider serves the capability
    BudgetExceeded,       // Every candidate was unaffordable
    RateLimited,          // Every candidate was under backpressure
    AllProvidersFailed,   // Every attempted candidate failed transiently
    RequestRejected,      // Request refused for its shape; not retried elsewhere
    SearchFailed,         // Search equivalent of AllProvidersFailed
};

/**
 * What happened to one candidate during a failover walk
 */
enum class AttemptDisposition {
    BudgetSkipped,
    RateLimited,
    TransientFailure,
    Rejected,
    Succeeded,
};

struct AttemptNote {
    std::string provider_id;
    AttemptDisposition disposition{AttemptDisposition::TransientFailure};
    std::string reason;
    std::chrono::milliseconds retry_after{0};
    std::chrono::milliseconds elapsed{0};
};

/**
 * Result of LlmClient::invoke
 */
struct InvocationOutcome {
    bool success{false};
    std::string provider_id;          // Empty when no provider served the request
    std::string model_used;
    std::chrono::milliseconds elapsed{0};
    double cost{0.0};
    ProviderReply reply;

    FailureKind failure{FailureKind::None};
    std::string error_message;
    std::chrono::milliseconds retry_after{0};
    std::vector<AttemptNote> attempts;
};

const char* to_string(ProviderCapability capability);
const char* to_string(ProviderFamily family);
const char* to_string(ReplyStatus status);
const char* to_string(FailureKind kind);
const char* to_string(AttemptDisposition disposition);

std::optional<ProviderCapability> capability_from_string(const std::string& name);
std::optional<ProviderFamily> family_from_string(const std::string& name);

/**
 * Whether trying another provider (or retrying later) may help
 */
inline bool is_transient(ReplyStatus status) {
    return status != ReplyStatus::Ok && status != ReplyStatus::Rejected;
}

#endif // GATEWAY_TYPES_HPP
