/*
 * Gateway configuration loaded from JSON
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef GATEWAY_CONFIG_HPP
#define GATEWAY_CONFIG_HPP

#include "GatewayTypes.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Invalid or unreadable configuration. Raised at startup only.
 */
class GatewayConfigError : public std::runtime_error {
public:
    explicit GatewayConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

struct GatewayConfig {
    std::vector<ProviderConfig> providers;
    double budget_ceiling_usd{1.0};
    double alert_threshold{0.8};
    std::chrono::seconds search_cache_ttl{3600};
    std::string log_level{"info"};
    std::string log_file;
};

/**
 * Parse a configuration document.
 *
 * {
 *   "budget": {"ceiling_usd": 5.0, "alert_threshold": 0.8},
 *   "search_cache_ttl_seconds": 3600,
 *   "logging": {"level": "info", "file": ""},
 *   "providers": [{
 *     "id": "openrouter-glm", "family": "chat", "model": "z-ai/glm-4.5",
 *     "base_url": "https://openrouter.ai/api/v1", "credential_env": "OPENROUTER_API_KEY",
 *     "priority": 1, "capabilities": ["completion"],
 *     "cost": {"per_1k_input_tokens": 0.0006, "per_1k_output_tokens": 0.0022, "per_call": 0},
 *     "rate_limit": {"max_calls": 60, "max_tokens": 0, "window_seconds": 60}
 *   }]
 * }
 *
 * Capabilities must fit the family: "chat" serves completion and embedding,
 * "embedding" only embedding, "search" only search.
 *
 * @throws GatewayConfigError on malformed JSON or invalid entries
 */
GatewayConfig parse_gateway_config(const std::string& json_text);

/**
 * @throws GatewayConfigError if the file cannot be read or parsed
 */
GatewayConfig load_gateway_config(const std::string& path);

#endif // GATEWAY_CONFIG_HPP
