/*
 * Unit tests for the web search gateway and its cache
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "SearchCache.hpp"
#include "SearchClient.hpp"
#include "TestHelpers.hpp"

#include <memory>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using namespace std::chrono_literals;

namespace {

SearchHit hit(const std::string& title, const std::string& url)
{
    SearchHit result;
    result.title = title;
    result.url = url;
    result.snippet = "Snippet for " + title;
    return result;
}

struct SearchHarness {
    std::shared_ptr<const ProviderRegistry> registry;
    std::shared_ptr<CostTracker> tracker;
    std::shared_ptr<RateLimiter> limiter;
    std::shared_ptr<InMemorySearchCache> cache;
    std::shared_ptr<ScriptedSearchBackend> backend;
    std::unique_ptr<SearchClient> client;
};

SearchHarness make_search_harness(std::vector<ProviderConfig> providers,
                                  double ceiling = 1.0,
                                  bool with_cache = true)
{
    SearchHarness h;
    h.registry = std::make_shared<ProviderRegistry>(std::move(providers));
    h.tracker = std::make_shared<CostTracker>(ceiling);
    h.limiter = std::make_shared<RateLimiter>();
    if (with_cache) {
        h.cache = std::make_shared<InMemorySearchCache>();
    }
    h.backend = std::make_shared<ScriptedSearchBackend>();

    auto backend = h.backend;
    h.client = std::make_unique<SearchClient>(
        h.registry, h.tracker, h.limiter,
        [backend](const ProviderConfig& provider, const SearchQuery& query) {
            return (*backend)(provider, query);
        },
        h.cache);
    return h;
}

} // namespace

// =============================================================================
// Failover
// =============================================================================

TEST_CASE("SearchClient returns hits from the first healthy provider") {
    auto h = make_search_harness({
        make_provider("s1", 1, ProviderCapability::Search, 0.005),
        make_provider("s2", 2, ProviderCapability::Search, 0.005),
    });
    SearchReply down;
    down.status = ReplyStatus::ServerError;
    h.backend->set_reply("s1", down);
    h.backend->set_reply("s2", search_reply({hit("Zoning update", "https://city.gov/zoning")}));

    const auto outcome = h.client->search("zoning ordinance");

    REQUIRE(outcome.success);
    REQUIRE(outcome.result.provider_id == "s2");
    REQUIRE_FALSE(outcome.result.cache_hit);
    REQUIRE(outcome.result.hits.size() == 1);
    REQUIRE(outcome.result.hits[0].url == "https://city.gov/zoning");
    REQUIRE_THAT(h.tracker->running_total(), WithinAbs(0.005, 1e-12));
}

TEST_CASE("SearchClient skips a rate limited provider and uses the next one") {
    auto h = make_search_harness({
        make_provider("s1", 1, ProviderCapability::Search),
        make_provider("s2", 2, ProviderCapability::Search),
    });
    RateLimitConfig limit;
    limit.max_calls = 1;
    limit.window = 60s;
    h.limiter->configure("s1", limit);
    REQUIRE(h.limiter->try_acquire("s1").allowed);

    h.backend->set_reply("s1", search_reply({hit("Unreachable", "https://s1.gov")}));
    h.backend->set_reply("s2", search_reply({hit("Transit plan", "https://city.gov/transit")}));

    const auto outcome = h.client->search("transit plan");

    REQUIRE(outcome.success);
    REQUIRE(outcome.result.provider_id == "s2");
    REQUIRE(outcome.attempts[0].disposition == AttemptDisposition::RateLimited);
    REQUIRE(outcome.attempts[0].retry_after > 0ms);
    REQUIRE(h.backend->calls() == std::vector<std::string>{"s2"});
}

TEST_CASE("SearchClient surfaces a rejected query without trying others") {
    auto h = make_search_harness({
        make_provider("s1", 1, ProviderCapability::Search, 0.005),
        make_provider("s2", 2, ProviderCapability::Search, 0.005),
    });
    SearchReply rejected;
    rejected.status = ReplyStatus::Rejected;
    rejected.http_status = 422;
    rejected.error = "query too long";
    h.backend->set_reply("s1", rejected);
    h.backend->set_reply("s2", search_reply({hit("Would have worked", "https://s2.gov")}));

    const auto outcome = h.client->search("zoning ordinance");

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.failure == FailureKind::RequestRejected);
    REQUIRE(outcome.result.provider_id == "s1");
    REQUIRE_THAT(outcome.error_message, ContainsSubstring("query too long"));
    REQUIRE(h.backend->calls() == std::vector<std::string>{"s1"});
    REQUIRE(h.tracker->running_total() == 0.0);
}

TEST_CASE("SearchClient tries candidates in priority order, not declaration order") {
    auto h = make_search_harness({
        make_provider("late", 9, ProviderCapability::Search),
        make_provider("early", 1, ProviderCapability::Search),
    });
    h.backend->set_reply("late", search_reply({hit("Late", "https://late.gov")}));
    h.backend->set_reply("early", search_reply({hit("Early", "https://early.gov")}));

    const auto outcome = h.client->search("housing plan");

    REQUIRE(outcome.success);
    REQUIRE(outcome.result.provider_id == "early");
    REQUIRE(h.backend->calls() == std::vector<std::string>{"early"});
}

TEST_CASE("SearchClient reports RateLimited with the Retry-After hint when every provider answers 429") {
    auto h = make_search_harness({
        make_provider("s1", 1, ProviderCapability::Search),
        make_provider("s2", 2, ProviderCapability::Search),
    });
    SearchReply slow;
    slow.status = ReplyStatus::Throttled;
    slow.http_status = 429;
    slow.retry_after = 30000ms;
    h.backend->set_reply("s1", slow);
    slow.retry_after = 3000ms;
    h.backend->set_reply("s2", slow);

    const auto outcome = h.client->search("zoning ordinance");

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.failure == FailureKind::RateLimited);
    REQUIRE(outcome.retry_after == 3000ms);
    REQUIRE(h.backend->calls().size() == 2);
    REQUIRE(h.cache->stats().entries == 0);
}

TEST_CASE("SearchClient reports SearchFailed when every provider errors") {
    auto h = make_search_harness({
        make_provider("s1", 1, ProviderCapability::Search),
        make_provider("s2", 2, ProviderCapability::Search),
    });

    const auto outcome = h.client->search("zoning ordinance");

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.failure == FailureKind::SearchFailed);
    REQUIRE(h.backend->calls().size() == 2);
    REQUIRE(h.tracker->running_total() == 0.0);
}

TEST_CASE("SearchClient reports BudgetExceeded when no query fits") {
    auto h = make_search_harness({make_provider("s1", 1, ProviderCapability::Search, 0.5)}, 0.1);

    const auto outcome = h.client->search("zoning ordinance");
    REQUIRE(outcome.failure == FailureKind::BudgetExceeded);
    REQUIRE(h.backend->calls().empty());
}

TEST_CASE("SearchClient reports Configuration without search providers") {
    auto h = make_search_harness({make_provider("chat", 1)});

    const auto outcome = h.client->search("zoning ordinance");
    REQUIRE(outcome.failure == FailureKind::Configuration);
    REQUIRE(h.backend->calls().empty());
}

TEST_CASE("SearchClient prefers the provider-reported query cost") {
    auto h = make_search_harness({make_provider("s1", 1, ProviderCapability::Search, 0.01)});
    auto reply = search_reply({hit("A", "https://a.gov")});
    reply.reported_cost = 0.002;
    h.backend->set_reply("s1", reply);

    const auto outcome = h.client->search("budget hearing");
    REQUIRE_THAT(outcome.cost, WithinAbs(0.002, 1e-12));
}

// =============================================================================
// Caching
// =============================================================================

TEST_CASE("SearchClient serves a repeated normalized query from the cache") {
    auto h = make_search_harness({make_provider("s1", 1, ProviderCapability::Search, 0.01)});

    RateLimitConfig limit;
    limit.max_calls = 1;
    h.limiter->configure("s1", limit);
    h.backend->set_reply("s1", search_reply({hit("Council minutes", "https://city.gov/minutes")}));

    const auto first = h.client->search("City Council  Minutes");
    REQUIRE(first.success);
    REQUIRE_FALSE(first.result.cache_hit);

    const auto second = h.client->search("  city council minutes ");
    REQUIRE(second.success);
    REQUIRE(second.result.cache_hit);
    REQUIRE(second.cost == 0.0);
    REQUIRE(second.result.hits.size() == 1);
    REQUIRE(second.result.provider_id == "s1");

    REQUIRE(h.backend->calls().size() == 1);
    REQUIRE_THAT(h.tracker->running_total(), WithinAbs(0.01, 1e-12));
    REQUIRE(h.limiter->window_state("s1")->calls == 1);

    const auto stats = h.cache->stats();
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.misses == 1);
}

TEST_CASE("SearchClient does not share cache entries across result shapes") {
    auto h = make_search_harness({make_provider("s1", 1, ProviderCapability::Search)});
    h.backend->set_reply("s1", search_reply({hit("A", "https://a.gov")}));

    SearchQuery query;
    query.query = "housing plan";
    REQUIRE(h.client->search(query).success);

    query.count = 5;
    REQUIRE_FALSE(h.client->search(query).result.cache_hit);

    query.domains = {"*.gov"};
    REQUIRE_FALSE(h.client->search(query).result.cache_hit);

    REQUIRE(h.backend->calls().size() == 3);
}

TEST_CASE("SearchClient does not cache failures") {
    auto h = make_search_harness({make_provider("s1", 1, ProviderCapability::Search)});

    REQUIRE_FALSE(h.client->search("housing plan").success);
    h.backend->set_reply("s1", search_reply({hit("A", "https://a.gov")}));

    const auto outcome = h.client->search("housing plan");
    REQUIRE(outcome.success);
    REQUIRE_FALSE(outcome.result.cache_hit);
}

TEST_CASE("SearchClient works without a cache") {
    auto h = make_search_harness({make_provider("s1", 1, ProviderCapability::Search)}, 1.0, false);
    h.backend->set_reply("s1", search_reply({hit("A", "https://a.gov")}));

    REQUIRE(h.client->search("housing plan").success);
    REQUIRE_FALSE(h.client->search("housing plan").result.cache_hit);
    REQUIRE(h.backend->calls().size() == 2);
}

// =============================================================================
// Query normalization and cache keys
// =============================================================================

TEST_CASE("SearchClient normalizes case and whitespace") {
    REQUIRE(SearchClient::normalize_query("  City\tCouncil \n Minutes  ") == "city council minutes");
    REQUIRE(SearchClient::normalize_query("") == "");
    REQUIRE(SearchClient::normalize_query("   ") == "");
}

TEST_CASE("SearchClient cache key ignores domain order") {
    SearchQuery a;
    a.query = "Transit Budget";
    a.domains = {"b.gov", "a.gov"};

    SearchQuery b;
    b.query = "transit budget";
    b.domains = {"a.gov", "b.gov"};

    REQUIRE(SearchClient::cache_key(a) == SearchClient::cache_key(b));

    b.recency = "1w";
    REQUIRE(SearchClient::cache_key(a) != SearchClient::cache_key(b));
}

// =============================================================================
// InMemorySearchCache
// =============================================================================

TEST_CASE("InMemorySearchCache expires entries after the TTL") {
    ManualClock clock;
    InMemorySearchCache cache(std::chrono::seconds(60), clock.source());

    SearchResult result;
    result.query = "q";
    result.provider_id = "s1";
    cache.put("key", result);

    clock.advance(59s);
    REQUIRE(cache.get("key").has_value());

    clock.advance(1s);
    REQUIRE_FALSE(cache.get("key").has_value());
    REQUIRE(cache.stats().entries == 0);
    REQUIRE(cache.stats().hits == 1);
    REQUIRE(cache.stats().misses == 1);
    REQUIRE_THAT(cache.stats().hit_rate(), WithinAbs(0.5, 1e-12));
}

TEST_CASE("InMemorySearchCache drops expired entries that are never looked up again") {
    ManualClock clock;
    InMemorySearchCache cache(std::chrono::seconds(60), clock.source());

    cache.put("a", SearchResult{});
    cache.put("b", SearchResult{});
    clock.advance(30s);
    cache.put("c", SearchResult{});
    REQUIRE(cache.stats().entries == 3);

    clock.advance(31s);
    cache.put("d", SearchResult{});

    REQUIRE(cache.stats().entries == 2);
    REQUIRE(cache.stats().misses == 0);
    REQUIRE(cache.get("c").has_value());
    REQUIRE(cache.get("d").has_value());
}

TEST_CASE("InMemorySearchCache clear drops every entry") {
    InMemorySearchCache cache;
    cache.put("a", SearchResult{});
    cache.put("b", SearchResult{});
    REQUIRE(cache.stats().entries == 2);

    cache.clear();
    REQUIRE(cache.stats().entries == 0);
    REQUIRE_FALSE(cache.get("a").has_value());
}
