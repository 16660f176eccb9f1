/*
 * Unit tests for the completion/embedding gateway
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "LlmClient.hpp"
#include "TestHelpers.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using namespace std::chrono_literals;

namespace {

struct Harness {
    std::shared_ptr<const ProviderRegistry> registry;
    std::shared_ptr<CostTracker> tracker;
    std::shared_ptr<RateLimiter> limiter;
    std::shared_ptr<ScriptedBackend> backend;
    std::unique_ptr<LlmClient> client;
};

Harness make_harness(std::vector<ProviderConfig> providers,
                     double ceiling = 10.0,
                     std::shared_ptr<RateLimiter> limiter = nullptr)
{
    Harness h;
    h.registry = std::make_shared<ProviderRegistry>(std::move(providers));
    h.tracker = std::make_shared<CostTracker>(ceiling);
    h.limiter = limiter ? limiter : std::make_shared<RateLimiter>();
    h.backend = std::make_shared<ScriptedBackend>();

    auto backend = h.backend;
    h.client = std::make_unique<LlmClient>(
        h.registry, h.tracker, h.limiter,
        [backend](const ProviderConfig& provider, const InvocationRequest& request) {
            return (*backend)(provider, request);
        });
    return h;
}

RateLimitConfig one_call_per(std::chrono::milliseconds window)
{
    RateLimitConfig limit;
    limit.max_calls = 1;
    limit.window = window;
    return limit;
}

} // namespace

// =============================================================================
// Failover order
// =============================================================================

TEST_CASE("LlmClient serves from the first healthy provider and stops there") {
    auto h = make_harness({
        make_provider("p1", 1, ProviderCapability::Completion, 0.01),
        make_provider("p2", 2, ProviderCapability::Completion, 0.01),
        make_provider("p3", 3, ProviderCapability::Completion, 0.01),
        make_provider("p4", 4, ProviderCapability::Completion, 0.01),
        make_provider("p5", 5, ProviderCapability::Completion, 0.01),
    });
    h.backend->set_reply("p1", failed_reply(ReplyStatus::ServerError));
    h.backend->set_reply("p2", failed_reply(ReplyStatus::Timeout));
    h.backend->set_reply("p3", ok_reply("served by p3"));
    h.backend->set_reply("p4", ok_reply("never"));

    const auto outcome = h.client->complete("Summarize the ordinance");

    REQUIRE(outcome.success);
    REQUIRE(outcome.failure == FailureKind::None);
    REQUIRE(outcome.provider_id == "p3");
    REQUIRE(outcome.model_used == "p3-model");
    REQUIRE(outcome.reply.text == "served by p3");
    REQUIRE(h.backend->calls() == std::vector<std::string>{"p1", "p2", "p3"});
    REQUIRE(outcome.attempts.size() == 3);
    REQUIRE(outcome.attempts[0].disposition == AttemptDisposition::TransientFailure);
    REQUIRE(outcome.attempts[2].disposition == AttemptDisposition::Succeeded);
}

TEST_CASE("LlmClient tries candidates in priority order, not declaration order") {
    auto h = make_harness({
        make_provider("late", 9),
        make_provider("early", 1),
    });
    h.backend->set_reply("early", ok_reply("early"));
    h.backend->set_reply("late", ok_reply("late"));

    const auto outcome = h.client->complete("hello");
    REQUIRE(outcome.provider_id == "early");
    REQUIRE(h.backend->calls() == std::vector<std::string>{"early"});
}

TEST_CASE("LlmClient treats a throwing backend as a transient failure") {
    auto registry = std::make_shared<ProviderRegistry>(std::vector<ProviderConfig>{
        make_provider("flaky", 1),
        make_provider("steady", 2),
    });
    auto tracker = std::make_shared<CostTracker>(1.0);

    LlmClient client(registry, tracker, nullptr,
        [](const ProviderConfig& provider, const InvocationRequest&) -> ProviderReply {
            if (provider.id == "flaky") {
                throw std::runtime_error("socket closed");
            }
            return ok_reply("fine");
        });

    const auto outcome = client.complete("hello");
    REQUIRE(outcome.success);
    REQUIRE(outcome.provider_id == "steady");
    REQUIRE_THAT(outcome.attempts[0].reason, ContainsSubstring("socket closed"));
}

// =============================================================================
// Terminal failures
// =============================================================================

TEST_CASE("LlmClient reports AllProvidersFailed when every attempt errors") {
    auto h = make_harness({
        make_provider("p1", 1, ProviderCapability::Completion, 0.01),
        make_provider("p2", 2, ProviderCapability::Completion, 0.01),
    });
    h.backend->set_reply("p1", failed_reply(ReplyStatus::ServerError, "overloaded"));
    h.backend->set_reply("p2", failed_reply(ReplyStatus::NetworkError, "refused"));

    const auto outcome = h.client->complete("hello");

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.failure == FailureKind::AllProvidersFailed);
    REQUIRE_THAT(outcome.error_message, ContainsSubstring("overloaded"));
    REQUIRE_THAT(outcome.error_message, ContainsSubstring("refused"));
    REQUIRE(h.backend->calls().size() == 2);
    REQUIRE(h.tracker->running_total() == 0.0);
    REQUIRE(h.tracker->reserved() == 0.0);
}

TEST_CASE("LlmClient reports BudgetExceeded without calling any provider") {
    auto h = make_harness({
        make_provider("p1", 1, ProviderCapability::Completion, 0.10),
        make_provider("p2", 2, ProviderCapability::Completion, 0.20),
    }, 0.05);
    h.backend->set_reply("p1", ok_reply("unreachable"));

    const auto outcome = h.client->complete("hello");

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.failure == FailureKind::BudgetExceeded);
    REQUIRE(h.backend->calls().empty());
    REQUIRE(h.tracker->running_total() == 0.0);
}

TEST_CASE("LlmClient reports RateLimited with the smallest wait") {
    ManualClock clock;
    auto limiter = std::make_shared<RateLimiter>(clock.source());
    limiter->configure("p1", one_call_per(10s));
    limiter->configure("p2", one_call_per(5s));
    REQUIRE(limiter->try_acquire("p1").allowed);
    REQUIRE(limiter->try_acquire("p2").allowed);

    auto h = make_harness({make_provider("p1", 1), make_provider("p2", 2)}, 1.0, limiter);
    h.backend->set_reply("p1", ok_reply("unreachable"));

    const auto outcome = h.client->complete("hello");

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.failure == FailureKind::RateLimited);
    REQUIRE(outcome.retry_after == 5000ms);
    REQUIRE(h.backend->calls().empty());
}

TEST_CASE("LlmClient skips a rate limited provider and uses the next one") {
    ManualClock clock;
    auto limiter = std::make_shared<RateLimiter>(clock.source());
    limiter->configure("p1", one_call_per(60s));
    REQUIRE(limiter->try_acquire("p1").allowed);

    auto h = make_harness({make_provider("p1", 1), make_provider("p2", 2)}, 1.0, limiter);
    h.backend->set_reply("p2", ok_reply("p2"));

    const auto outcome = h.client->complete("hello");
    REQUIRE(outcome.success);
    REQUIRE(outcome.provider_id == "p2");
    REQUIRE(outcome.attempts[0].disposition == AttemptDisposition::RateLimited);
}

TEST_CASE("LlmClient reports RateLimited with the Retry-After hint when every provider answers 429") {
    auto h = make_harness({make_provider("p1", 1), make_provider("p2", 2)});
    h.backend->set_reply("p1", throttled_reply(30000ms));
    h.backend->set_reply("p2", throttled_reply(12000ms));

    const auto outcome = h.client->complete("hello");

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.failure == FailureKind::RateLimited);
    REQUIRE(outcome.retry_after == 12000ms);
    REQUIRE(h.backend->calls() == std::vector<std::string>{"p1", "p2"});
    REQUIRE(outcome.attempts[0].disposition == AttemptDisposition::RateLimited);
    REQUIRE_THAT(outcome.attempts[0].reason, ContainsSubstring("throttled by provider"));
    REQUIRE(h.tracker->running_total() == 0.0);
}

TEST_CASE("LlmClient falls over from a provider answering 429") {
    auto h = make_harness({make_provider("p1", 1), make_provider("p2", 2)});
    h.backend->set_reply("p1", throttled_reply(30000ms));
    h.backend->set_reply("p2", ok_reply("p2"));

    const auto outcome = h.client->complete("hello");
    REQUIRE(outcome.success);
    REQUIRE(outcome.provider_id == "p2");
    REQUIRE(outcome.attempts[0].retry_after == 30000ms);
}

TEST_CASE("LlmClient treats a 429 mixed with a server error as AllProvidersFailed") {
    auto h = make_harness({make_provider("p1", 1), make_provider("p2", 2)});
    h.backend->set_reply("p1", throttled_reply(30000ms));
    h.backend->set_reply("p2", failed_reply(ReplyStatus::ServerError, "502"));

    const auto outcome = h.client->complete("hello");
    REQUIRE(outcome.failure == FailureKind::AllProvidersFailed);
}

TEST_CASE("LlmClient serves a request whose token charge exceeds the window budget") {
    ManualClock clock;
    auto limiter = std::make_shared<RateLimiter>(clock.source());
    RateLimitConfig limit;
    limit.max_tokens = 1000;
    limit.window = 60s;
    limiter->configure("p1", limit);

    auto h = make_harness({make_provider("p1", 1)}, 1.0, limiter);
    h.backend->set_reply("p1", ok_reply("answer"));

    // Default max_tokens alone is 1024
    const auto first = h.client->complete("hi");
    REQUIRE(first.success);

    const auto second = h.client->complete("hi");
    REQUIRE(second.failure == FailureKind::RateLimited);
    REQUIRE(second.retry_after == 60s);

    clock.advance(60s);
    REQUIRE(h.client->complete("hi").success);
    REQUIRE(h.backend->calls().size() == 2);
}

TEST_CASE("LlmClient surfaces a rejected request without trying others") {
    auto h = make_harness({make_provider("p1", 1), make_provider("p2", 2)});
    h.backend->set_reply("p1", failed_reply(ReplyStatus::Rejected, "context too long"));
    h.backend->set_reply("p2", ok_reply("would have worked"));

    const auto outcome = h.client->complete("hello");

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.failure == FailureKind::RequestRejected);
    REQUIRE_THAT(outcome.error_message, ContainsSubstring("context too long"));
    REQUIRE(h.backend->calls() == std::vector<std::string>{"p1"});
}

TEST_CASE("LlmClient reports Configuration when no provider serves the capability") {
    auto h = make_harness({make_provider("searcher", 1, ProviderCapability::Search)});

    const auto outcome = h.client->complete("hello");

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.failure == FailureKind::Configuration);
    REQUIRE_THAT(outcome.error_message, ContainsSubstring("completion"));
    REQUIRE(h.backend->calls().empty());
}

// =============================================================================
// Cost accounting
// =============================================================================

TEST_CASE("LlmClient records cost only for the successful call") {
    auto h = make_harness({
        make_provider("p1", 1, ProviderCapability::Completion, 0.10),
        make_provider("p2", 2, ProviderCapability::Completion, 0.20),
    });
    h.backend->set_reply("p1", failed_reply(ReplyStatus::ServerError));
    h.backend->set_reply("p2", ok_reply("ok"));

    InvocationRequest request;
    request.messages.push_back({MessageRole::User, "hello"});
    request.step = "summarize";
    const auto outcome = h.client->invoke(request);

    REQUIRE(outcome.success);
    REQUIRE_THAT(outcome.cost, WithinAbs(0.20, 1e-12));
    REQUIRE_THAT(h.tracker->running_total(), WithinAbs(0.20, 1e-12));

    const auto ledger = h.tracker->ledger();
    REQUIRE(ledger.size() == 1);
    REQUIRE(ledger[0].provider_id == "p2");
    REQUIRE(ledger[0].model == "p2-model");
    REQUIRE(ledger[0].step == "summarize");
}

TEST_CASE("LlmClient prefers the provider-reported cost") {
    auto h = make_harness({make_provider("p1", 1, ProviderCapability::Completion, 0.10)});
    auto reply = ok_reply("ok");
    reply.reported_cost = 0.0425;
    h.backend->set_reply("p1", reply);

    const auto outcome = h.client->complete("hello");
    REQUIRE_THAT(outcome.cost, WithinAbs(0.0425, 1e-12));
    REQUIRE_THAT(h.tracker->running_total(), WithinAbs(0.0425, 1e-12));
}

TEST_CASE("LlmClient prices reported token usage") {
    auto provider = make_provider("p1", 1);
    provider.cost.per_1k_input_tokens = 1.0;
    provider.cost.per_1k_output_tokens = 2.0;
    auto h = make_harness({provider});

    auto reply = ok_reply("ok");
    reply.usage.prompt_tokens = 500;
    reply.usage.completion_tokens = 250;
    h.backend->set_reply("p1", reply);

    const auto outcome = h.client->complete("hello");
    REQUIRE_THAT(outcome.cost, WithinAbs(1.0, 1e-12));
}

TEST_CASE("LlmClient honours the per-request budget cap") {
    auto h = make_harness({
        make_provider("premium", 1, ProviderCapability::Completion, 0.50),
        make_provider("cheap", 2, ProviderCapability::Completion, 0.01),
    });
    h.backend->set_reply("premium", ok_reply("premium"));
    h.backend->set_reply("cheap", ok_reply("cheap"));

    InvocationRequest request;
    request.messages.push_back({MessageRole::User, "hello"});
    request.budget_ceiling = 0.05;
    const auto outcome = h.client->invoke(request);

    REQUIRE(outcome.success);
    REQUIRE(outcome.provider_id == "cheap");
    REQUIRE(outcome.attempts[0].disposition == AttemptDisposition::BudgetSkipped);
    REQUIRE(h.backend->calls() == std::vector<std::string>{"cheap"});
}

TEST_CASE("LlmClient estimates cost from prompt size and max tokens") {
    auto provider = make_provider("p1", 1);
    provider.cost.per_1k_input_tokens = 1.0;
    provider.cost.per_1k_output_tokens = 1.0;

    InvocationRequest request;
    request.messages.push_back({MessageRole::User, std::string(4000, 'x')});
    request.max_tokens = 1000;

    REQUIRE_THAT(LlmClient::estimate_cost(provider, request), WithinAbs(2.0, 1e-12));

    request.capability = ProviderCapability::Embedding;
    request.embedding_inputs = {std::string(400, 'y')};
    REQUIRE_THAT(LlmClient::estimate_cost(provider, request), WithinAbs(0.1, 1e-12));
}

TEST_CASE("LlmClient concurrent requests sharing the budget exactly all succeed") {
    constexpr int kCallers = 20;
    constexpr double kCeiling = 1.0;
    auto h = make_harness({make_provider("p1", 1, ProviderCapability::Completion,
                                         kCeiling / kCallers)}, kCeiling);
    h.backend->set_reply("p1", ok_reply("ok"));

    std::atomic<int> served{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kCallers; ++t) {
        threads.emplace_back([&]() {
            if (h.client->complete("hello").success) {
                ++served;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(served.load() == kCallers);
    REQUIRE(h.tracker->ledger().size() == static_cast<std::size_t>(kCallers));
    REQUIRE_THAT(h.tracker->running_total(), WithinAbs(kCeiling, 1e-9));
}

TEST_CASE("LlmClient concurrent requests never overshoot the budget") {
    constexpr int kThreads = 16;
    constexpr int kPerThread = 10;
    auto h = make_harness({make_provider("p1", 1, ProviderCapability::Completion, 0.01)}, 1.0);
    h.backend->set_reply("p1", ok_reply("ok"));

    std::atomic<int> served{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kPerThread; ++i) {
                const auto outcome = h.client->complete("hello");
                if (outcome.success) {
                    ++served;
                } else if (outcome.failure == FailureKind::BudgetExceeded) {
                    ++refused;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(served.load() == 100);
    REQUIRE(refused.load() == kThreads * kPerThread - 100);
    REQUIRE_THAT(h.tracker->running_total(), WithinAbs(1.0, 1e-9));
}

// =============================================================================
// Request building
// =============================================================================

TEST_CASE("LlmClient complete builds system and user messages") {
    auto registry = std::make_shared<ProviderRegistry>(
        std::vector<ProviderConfig>{make_provider("p1", 1)});
    auto tracker = std::make_shared<CostTracker>(1.0);

    InvocationRequest seen;
    LlmClient client(registry, tracker, nullptr,
        [&seen](const ProviderConfig&, const InvocationRequest& request) {
            seen = request;
            return ok_reply("ok");
        });

    REQUIRE(client.complete("What changed?", "You are a policy analyst", "diff").success);
    REQUIRE(seen.messages.size() == 2);
    REQUIRE(seen.messages[0].role == MessageRole::System);
    REQUIRE(seen.messages[1].content == "What changed?");
    REQUIRE(seen.step == "diff");
    REQUIRE(seen.capability == ProviderCapability::Completion);
}

TEST_CASE("LlmClient embed routes to embedding providers") {
    auto h = make_harness({
        make_provider("chat", 1),
        make_provider("vectors", 2, ProviderCapability::Embedding),
    });
    auto reply = ok_reply("");
    reply.embeddings = {{0.1f, 0.2f}, {0.3f, 0.4f}};
    h.backend->set_reply("vectors", reply);

    const auto outcome = h.client->embed({"first", "second"});

    REQUIRE(outcome.success);
    REQUIRE(outcome.provider_id == "vectors");
    REQUIRE(outcome.reply.embeddings.size() == 2);
    REQUIRE(h.backend->calls() == std::vector<std::string>{"vectors"});
}

TEST_CASE("LlmClient requires its collaborators") {
    auto registry = std::make_shared<ProviderRegistry>(std::vector<ProviderConfig>{});
    auto tracker = std::make_shared<CostTracker>(1.0);

    REQUIRE_THROWS_AS(LlmClient(registry, tracker, nullptr, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(LlmClient(nullptr, tracker, nullptr,
                                [](const ProviderConfig&, const InvocationRequest&) {
                                    return ok_reply("");
                                }),
                      std::invalid_argument);
}
