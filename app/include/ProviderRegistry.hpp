/*
 * Ranked provider catalogue
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef PROVIDER_REGISTRY_HPP
#define PROVIDER_REGISTRY_HPP

#include "GatewayTypes.hpp"

#include <string>
#include <vector>

/**
 * Read-only list of provider configurations.
 *
 * Populated once at startup. Candidate order is priority ascending, ties
 * broken by declaration order. Safe to share between threads.
 */
class ProviderRegistry {
public:
    /**
     * @throws GatewayConfigError on an empty or duplicate provider id
     */
    explicit ProviderRegistry(std::vector<ProviderConfig> providers);

    /**
     * Providers supporting `capability`, in the order they should be tried
     */
    std::vector<ProviderConfig> candidates_for(ProviderCapability capability) const;

    /**
     * @return Provider or nullptr if not found
     */
    const ProviderConfig* find(const std::string& provider_id) const;

    const std::vector<ProviderConfig>& providers() const { return providers_; }
    std::size_t size() const { return providers_.size(); }
    bool empty() const { return providers_.empty(); }

private:
    std::vector<ProviderConfig> providers_;
};

#endif // PROVIDER_REGISTRY_HPP
