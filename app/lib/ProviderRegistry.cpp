/*
 * Ranked provider catalogue implementation
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ProviderRegistry.hpp"
#include "GatewayConfig.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <unordered_set>

ProviderRegistry::ProviderRegistry(std::vector<ProviderConfig> providers)
    : providers_(std::move(providers))
{
    std::unordered_set<std::string> seen;
    for (const auto& provider : providers_) {
        if (provider.id.empty()) {
            throw GatewayConfigError("Provider entry is missing an id");
        }
        if (!seen.insert(provider.id).second) {
            throw GatewayConfigError("Duplicate provider id: " + provider.id);
        }

        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("Registered provider: {} ({}, priority {})",
                         provider.id, to_string(provider.family), provider.priority);
        }
    }
}

std::vector<ProviderConfig> ProviderRegistry::candidates_for(ProviderCapability capability) const
{
    std::vector<ProviderConfig> result;
    for (const auto& provider : providers_) {
        if (has_capability(provider.capabilities, capability)) {
            result.push_back(provider);
        }
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const ProviderConfig& a, const ProviderConfig& b) {
                         return a.priority < b.priority;
                     });
    return result;
}

const ProviderConfig* ProviderRegistry::find(const std::string& provider_id) const
{
    auto it = std::find_if(providers_.begin(), providers_.end(),
                           [&](const ProviderConfig& p) { return p.id == provider_id; });
    return it != providers_.end() ? &*it : nullptr;
}
