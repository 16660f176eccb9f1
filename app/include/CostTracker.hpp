/*
 * Budget accounting for paid provider calls
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef COST_TRACKER_HPP
#define COST_TRACKER_HPP

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * One appended ledger line
 */
struct CostLedgerEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string provider_id;
    std::string model;
    std::string step;
    double amount{0.0};
    double running_total{0.0};   // Total after this entry
};

enum class CostGrouping {
    ByProvider,
    ByModel,
    ByStep,
};

/**
 * Running cost ledger against a fixed budget ceiling.
 *
 * One tracker covers one budget period (a day, an analysis job); create a
 * fresh tracker for the next period. All methods are thread-safe and the
 * running total is updated under a single mutex.
 *
 * record() never fails. Callers check can_afford() (or hold a Reservation)
 * before issuing a paid call and record the priced result afterwards.
 */
class CostTracker {
public:
    /**
     * Budget held for an in-flight call. Not part of the ledger: released on
     * destruction, or converted into a ledger entry by CostTracker::commit().
     */
    class Reservation {
    public:
        Reservation(Reservation&& other) noexcept;
        Reservation& operator=(Reservation&& other) noexcept;
        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;
        ~Reservation();

        double amount() const { return amount_; }
        bool active() const { return tracker_ != nullptr; }
        void release();

    private:
        friend class CostTracker;
        Reservation(CostTracker* tracker, double amount);

        CostTracker* tracker_;
        double amount_;
    };

    /**
     * @param budget_ceiling Maximum total spend (USD) for this period
     * @param alert_threshold Fraction of the ceiling that triggers a one-time warning
     */
    explicit CostTracker(double budget_ceiling, double alert_threshold = 0.8);

    CostTracker(const CostTracker&) = delete;
    CostTracker& operator=(const CostTracker&) = delete;

    /**
     * Append a ledger entry and return the new running total.
     * Negative amounts are recorded as zero.
     */
    double record(const std::string& provider_id,
                  double amount,
                  const std::string& model = "",
                  const std::string& step = "");

    /**
     * running_total + amount <= ceiling, without mutating state
     */
    bool can_afford(double amount) const;

    /**
     * Atomically hold `amount` against the ceiling, counting other
     * outstanding reservations. Returns nullopt when it does not fit.
     */
    std::optional<Reservation> try_reserve(double amount);

    /**
     * Release a reservation and record the actual cost in one step
     */
    double commit(Reservation& reservation,
                  const std::string& provider_id,
                  double amount,
                  const std::string& model = "",
                  const std::string& step = "");

    double remaining_budget() const;
    double running_total() const;
    double reserved() const;
    double budget_ceiling() const { return budget_ceiling_; }
    double alert_threshold() const { return alert_threshold_; }

    std::vector<CostLedgerEntry> ledger() const;
    std::map<std::string, double> cost_breakdown(CostGrouping grouping) const;

    /**
     * Snapshot for an external persistence layer
     */
    Json::Value summary_json() const;

private:
    double record_locked(const std::string& provider_id,
                         double amount,
                         const std::string& model,
                         const std::string& step);
    void release_reservation(double amount);

    const double budget_ceiling_;
    const double alert_threshold_;

    mutable std::mutex mutex_;
    double running_total_{0.0};
    double reserved_{0.0};
    bool alert_raised_{false};
    std::vector<CostLedgerEntry> ledger_;
};

#endif // COST_TRACKER_HPP
