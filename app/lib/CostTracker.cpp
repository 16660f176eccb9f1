/*
 * Budget accounting implementation
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "CostTracker.hpp"
#include "Logger.hpp"

#include <algorithm>

namespace {

// Absorbs floating point drift when the ceiling is reached exactly
constexpr double kBudgetEpsilon = 1e-9;

} // namespace

CostTracker::Reservation::Reservation(CostTracker* tracker, double amount)
    : tracker_(tracker)
    , amount_(amount)
{}

CostTracker::Reservation::Reservation(Reservation&& other) noexcept
    : tracker_(other.tracker_)
    , amount_(other.amount_)
{
    other.tracker_ = nullptr;
    other.amount_ = 0.0;
}

CostTracker::Reservation& CostTracker::Reservation::operator=(Reservation&& other) noexcept
{
    if (this != &other) {
        release();
        tracker_ = other.tracker_;
        amount_ = other.amount_;
        other.tracker_ = nullptr;
        other.amount_ = 0.0;
    }
    return *this;
}

CostTracker::Reservation::~Reservation()
{
    release();
}

void CostTracker::Reservation::release()
{
    if (tracker_) {
        tracker_->release_reservation(amount_);
        tracker_ = nullptr;
        amount_ = 0.0;
    }
}

CostTracker::CostTracker(double budget_ceiling, double alert_threshold)
    : budget_ceiling_(std::max(0.0, budget_ceiling))
    , alert_threshold_(std::clamp(alert_threshold, 0.0, 1.0))
{}

double CostTracker::record(const std::string& provider_id,
                           double amount,
                           const std::string& model,
                           const std::string& step)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return record_locked(provider_id, amount, model, step);
}

double CostTracker::record_locked(const std::string& provider_id,
                                  double amount,
                                  const std::string& model,
                                  const std::string& step)
{
    if (amount < 0.0) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Ignoring negative cost {} from provider {}", amount, provider_id);
        }
        amount = 0.0;
    }

    running_total_ += amount;

    CostLedgerEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.provider_id = provider_id;
    entry.model = model;
    entry.step = step;
    entry.amount = amount;
    entry.running_total = running_total_;
    ledger_.push_back(std::move(entry));

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Cost recorded: {} ${:.6f} (total ${:.6f} / ${:.6f})",
                      provider_id, amount, running_total_, budget_ceiling_);

        if (running_total_ > budget_ceiling_ + kBudgetEpsilon) {
            logger->warn("Budget ceiling overshot by a priced reply: ${:.6f} > ${:.6f}",
                         running_total_, budget_ceiling_);
        } else if (!alert_raised_ && budget_ceiling_ > 0.0 &&
                   running_total_ >= budget_ceiling_ * alert_threshold_) {
            logger->warn("Budget alert: ${:.4f} / ${:.4f} spent", running_total_, budget_ceiling_);
        }
    }

    if (budget_ceiling_ > 0.0 && running_total_ >= budget_ceiling_ * alert_threshold_) {
        alert_raised_ = true;
    }

    return running_total_;
}

bool CostTracker::can_afford(double amount) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return running_total_ + amount <= budget_ceiling_ + kBudgetEpsilon;
}

std::optional<CostTracker::Reservation> CostTracker::try_reserve(double amount)
{
    amount = std::max(0.0, amount);

    std::lock_guard<std::mutex> lock(mutex_);
    if (running_total_ + reserved_ + amount > budget_ceiling_ + kBudgetEpsilon) {
        return std::nullopt;
    }
    reserved_ += amount;
    return Reservation(this, amount);
}

double CostTracker::commit(Reservation& reservation,
                           const std::string& provider_id,
                           double amount,
                           const std::string& model,
                           const std::string& step)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (reservation.tracker_ == this) {
        reserved_ = std::max(0.0, reserved_ - reservation.amount_);
        reservation.tracker_ = nullptr;
        reservation.amount_ = 0.0;
    }
    return record_locked(provider_id, amount, model, step);
}

void CostTracker::release_reservation(double amount)
{
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_ = std::max(0.0, reserved_ - amount);
}

double CostTracker::remaining_budget() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::max(0.0, budget_ceiling_ - running_total_);
}

double CostTracker::running_total() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return running_total_;
}

double CostTracker::reserved() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_;
}

std::vector<CostLedgerEntry> CostTracker::ledger() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_;
}

std::map<std::string, double> CostTracker::cost_breakdown(CostGrouping grouping) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, double> totals;
    for (const auto& entry : ledger_) {
        switch (grouping) {
            case CostGrouping::ByProvider:
                totals[entry.provider_id] += entry.amount;
                break;
            case CostGrouping::ByModel:
                totals[entry.model] += entry.amount;
                break;
            case CostGrouping::ByStep:
                totals[entry.step.empty() ? "unlabelled" : entry.step] += entry.amount;
                break;
        }
    }
    return totals;
}

Json::Value CostTracker::summary_json() const
{
    Json::Value summary(Json::objectValue);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        summary["budget_ceiling_usd"] = budget_ceiling_;
        summary["running_total_usd"] = running_total_;
        summary["remaining_usd"] = std::max(0.0, budget_ceiling_ - running_total_);
        summary["entries"] = static_cast<Json::UInt64>(ledger_.size());
        summary["alert_raised"] = alert_raised_;
    }

    Json::Value by_provider(Json::objectValue);
    for (const auto& [provider, amount] : cost_breakdown(CostGrouping::ByProvider)) {
        by_provider[provider] = amount;
    }
    summary["by_provider"] = by_provider;

    Json::Value by_step(Json::objectValue);
    for (const auto& [step, amount] : cost_breakdown(CostGrouping::ByStep)) {
        by_step[step] = amount;
    }
    summary["by_step"] = by_step;

    return summary;
}
