/*
 * HTTP transport for OpenAI-compatible and web-search providers
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef HTTP_PROVIDER_BACKEND_HPP
#define HTTP_PROVIDER_BACKEND_HPP

#include "GatewayTypes.hpp"
#include "SearchTypes.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * Speaks the wire formats of the configured providers:
 * - chat:      POST {base_url}/chat/completions (OpenAI-compatible)
 * - embedding: POST {base_url}/embeddings
 * - search:    POST {base_url} with {"query", "count", "domains", "recency"}
 *
 * Every failure is reported through the reply status; nothing is thrown.
 * No retries happen here: failover across providers is the caller's job.
 */
class HttpProviderBackend {
public:
    /**
     * HTTP client interface for testability
     */
    struct HttpResponse {
        long status_code{0};
        std::string body;
        std::string error;
        bool timed_out{false};
        std::string retry_after;        // Raw Retry-After header, if any
        bool success() const { return status_code >= 200 && status_code < 300; }
    };

    using HttpClient = std::function<HttpResponse(
        const std::string& url,
        const std::string& method,
        const std::string& body,
        const std::vector<std::pair<std::string, std::string>>& headers,
        int timeout_ms
    )>;

    /**
     * Resolves a credential reference (environment variable name) to a key
     */
    using CredentialResolver = std::function<std::optional<std::string>(const std::string& name)>;

    /**
     * @param http_client Optional HTTP client for testing; defaults to libcurl
     * @param credentials Optional resolver for testing; defaults to the process environment
     */
    explicit HttpProviderBackend(HttpClient http_client = nullptr,
                                 CredentialResolver credentials = nullptr);

    /**
     * Chat completion or embedding call, depending on request.capability
     */
    ProviderReply complete(const ProviderConfig& provider, const InvocationRequest& request) const;

    SearchReply search(const ProviderConfig& provider, const SearchQuery& query) const;

    static std::chrono::milliseconds parse_retry_after(const std::string& header_value);

private:
    static constexpr const char* kChatEndpoint = "/chat/completions";
    static constexpr const char* kEmbeddingsEndpoint = "/embeddings";

    struct PreparedCall {
        std::vector<std::pair<std::string, std::string>> headers;
        std::string error;              // Non-empty when the credential is missing
    };

    PreparedCall prepare(const ProviderConfig& provider) const;
    HttpResponse send(const std::string& url,
                      const std::string& body,
                      const std::vector<std::pair<std::string, std::string>>& headers,
                      int timeout_ms) const;
    HttpResponse default_http_client(const std::string& url,
                                     const std::string& method,
                                     const std::string& body,
                                     const std::vector<std::pair<std::string, std::string>>& headers,
                                     int timeout_ms) const;

    std::string build_chat_payload(const ProviderConfig& provider,
                                   const InvocationRequest& request) const;
    std::string build_embedding_payload(const ProviderConfig& provider,
                                        const InvocationRequest& request) const;
    std::string build_search_payload(const SearchQuery& query) const;

    ProviderReply parse_chat_response(const HttpResponse& response) const;
    ProviderReply parse_embedding_response(const HttpResponse& response) const;
    SearchReply parse_search_response(const HttpResponse& response) const;

    HttpClient http_client_;
    CredentialResolver credentials_;
};

#endif // HTTP_PROVIDER_BACKEND_HPP
