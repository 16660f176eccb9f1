/*
 * Gateway configuration parsing
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "GatewayConfig.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <fstream>
#include <sstream>

namespace {

double read_number(const Json::Value& node, const char* key, double fallback)
{
    if (!node.isMember(key)) {
        return fallback;
    }
    if (!node[key].isNumeric()) {
        throw GatewayConfigError(std::string("Expected a number for '") + key + "'");
    }
    return node[key].asDouble();
}

int read_int(const Json::Value& node, const char* key, int fallback)
{
    if (!node.isMember(key)) {
        return fallback;
    }
    if (!node[key].isInt()) {
        throw GatewayConfigError(std::string("Expected an integer for '") + key + "'");
    }
    return node[key].asInt();
}

std::string read_string(const Json::Value& node, const char* key, const std::string& fallback = "")
{
    if (!node.isMember(key)) {
        return fallback;
    }
    if (!node[key].isString()) {
        throw GatewayConfigError(std::string("Expected a string for '") + key + "'");
    }
    return node[key].asString();
}

ProviderCapability default_capabilities(ProviderFamily family)
{
    switch (family) {
        case ProviderFamily::ChatCompletion: return ProviderCapability::Completion;
        case ProviderFamily::Embedding: return ProviderCapability::Embedding;
        case ProviderFamily::WebSearch: return ProviderCapability::Search;
    }
    return ProviderCapability::None;
}

// Chat endpoints also serve /embeddings; search endpoints only answer queries.
ProviderCapability family_capabilities(ProviderFamily family)
{
    switch (family) {
        case ProviderFamily::ChatCompletion:
            return ProviderCapability::Completion | ProviderCapability::Embedding;
        case ProviderFamily::Embedding: return ProviderCapability::Embedding;
        case ProviderFamily::WebSearch: return ProviderCapability::Search;
    }
    return ProviderCapability::None;
}

ProviderConfig parse_provider(const Json::Value& node, std::size_t index)
{
    if (!node.isObject()) {
        throw GatewayConfigError("Provider entry " + std::to_string(index) + " is not an object");
    }

    ProviderConfig provider;
    provider.id = read_string(node, "id");
    if (provider.id.empty()) {
        throw GatewayConfigError("Provider entry " + std::to_string(index) + " is missing an id");
    }

    const std::string context = " (provider '" + provider.id + "')";

    const std::string family = read_string(node, "family", "chat");
    const auto parsed_family = family_from_string(family);
    if (!parsed_family) {
        throw GatewayConfigError("Unknown provider family '" + family + "'" + context);
    }
    provider.family = *parsed_family;

    provider.model = read_string(node, "model");
    provider.base_url = read_string(node, "base_url");
    provider.credential_env = read_string(node, "credential_env");
    provider.priority = read_int(node, "priority", 0);

    if (node.isMember("capabilities")) {
        const Json::Value& caps = node["capabilities"];
        if (!caps.isArray()) {
            throw GatewayConfigError("'capabilities' must be an array" + context);
        }
        for (const auto& cap : caps) {
            std::optional<ProviderCapability> parsed;
            if (cap.isString()) {
                parsed = capability_from_string(cap.asString());
            }
            if (!parsed) {
                const std::string name = cap.isString() ? cap.asString() : std::string("<non-string>");
                throw GatewayConfigError("Unknown capability '" + name + "'" + context);
            }
            if (!has_capability(family_capabilities(provider.family), *parsed)) {
                throw GatewayConfigError(std::string("Capability '") + to_string(*parsed) +
                                         "' does not match family '" + to_string(provider.family) +
                                         "'" + context);
            }
            provider.capabilities = provider.capabilities | *parsed;
        }
    } else {
        provider.capabilities = default_capabilities(provider.family);
    }

    if (node.isMember("cost")) {
        const Json::Value& cost = node["cost"];
        if (!cost.isObject()) {
            throw GatewayConfigError("'cost' must be an object" + context);
        }
        provider.cost.per_1k_input_tokens = read_number(cost, "per_1k_input_tokens", 0.0);
        provider.cost.per_1k_output_tokens = read_number(cost, "per_1k_output_tokens", 0.0);
        provider.cost.per_call = read_number(cost, "per_call", 0.0);
        if (provider.cost.per_1k_input_tokens < 0.0 || provider.cost.per_1k_output_tokens < 0.0 ||
            provider.cost.per_call < 0.0) {
            throw GatewayConfigError("Costs must not be negative" + context);
        }
    }

    if (node.isMember("rate_limit")) {
        const Json::Value& limit = node["rate_limit"];
        if (!limit.isObject()) {
            throw GatewayConfigError("'rate_limit' must be an object" + context);
        }
        provider.rate_limit.max_calls = read_int(limit, "max_calls", 0);
        provider.rate_limit.max_tokens = read_int(limit, "max_tokens", 0);
        const int window_seconds = read_int(limit, "window_seconds", 60);
        if (window_seconds <= 0 || provider.rate_limit.max_calls < 0 ||
            provider.rate_limit.max_tokens < 0) {
            throw GatewayConfigError("Invalid rate_limit" + context);
        }
        provider.rate_limit.window = std::chrono::seconds(window_seconds);
    }

    if (provider.base_url.empty()) {
        throw GatewayConfigError("Missing base_url" + context);
    }

    return provider;
}

} // namespace

GatewayConfig parse_gateway_config(const std::string& json_text)
{
    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream stream(json_text);
    std::string errors;

    if (!Json::parseFromStream(reader_builder, stream, &root, &errors)) {
        throw GatewayConfigError("Failed to parse configuration: " + errors);
    }
    if (!root.isObject()) {
        throw GatewayConfigError("Configuration root must be an object");
    }

    GatewayConfig config;

    if (root.isMember("budget")) {
        if (!root["budget"].isObject()) {
            throw GatewayConfigError("'budget' must be an object");
        }
        config.budget_ceiling_usd = read_number(root["budget"], "ceiling_usd", config.budget_ceiling_usd);
        config.alert_threshold = read_number(root["budget"], "alert_threshold", config.alert_threshold);
    }
    if (config.budget_ceiling_usd < 0.0) {
        throw GatewayConfigError("budget.ceiling_usd must not be negative");
    }
    if (config.alert_threshold < 0.0 || config.alert_threshold > 1.0) {
        throw GatewayConfigError("budget.alert_threshold must be between 0 and 1");
    }

    const int ttl = read_int(root, "search_cache_ttl_seconds",
                             static_cast<int>(config.search_cache_ttl.count()));
    if (ttl < 0) {
        throw GatewayConfigError("search_cache_ttl_seconds must not be negative");
    }
    config.search_cache_ttl = std::chrono::seconds(ttl);

    if (root.isMember("logging")) {
        if (!root["logging"].isObject()) {
            throw GatewayConfigError("'logging' must be an object");
        }
        config.log_level = read_string(root["logging"], "level", config.log_level);
        config.log_file = read_string(root["logging"], "file");
    }

    if (root.isMember("providers")) {
        const Json::Value& providers = root["providers"];
        if (!providers.isArray()) {
            throw GatewayConfigError("'providers' must be an array");
        }
        for (Json::ArrayIndex i = 0; i < providers.size(); ++i) {
            config.providers.push_back(parse_provider(providers[i], i));
        }
    }

    return config;
}

GatewayConfig load_gateway_config(const std::string& path)
{
    std::ifstream file(path);
    if (!file) {
        throw GatewayConfigError("Cannot open configuration file: " + path);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_gateway_config(contents.str());
}
