#include "ledger_core/services/accounting_period_lifecycle.h"

#include <utility>

#include "ledger_core/core/structured_log.h"

namespace ledger_core {

namespace {

constexpr const char* kApp = "accounting_period_lifecycle";

int MonthsPerPeriod(PeriodFrequency frequency) {
    switch (frequency) {
        case PeriodFrequency::kMonthly:
            return 1;
        case PeriodFrequency::kQuarterly:
            return 3;
        case PeriodFrequency::kYearly:
            return 12;
    }
    return 1;
}

std::string PeriodName(PeriodFrequency frequency, int number, int fiscal_year, const CivilDate& start) {
    switch (frequency) {
        case PeriodFrequency::kMonthly:
            return "Period " + std::to_string(number) + " (" + MonthAbbreviation(start.month) + " " +
                   std::to_string(start.year) + ")";
        case PeriodFrequency::kQuarterly:
            return "Q" + std::to_string(number) + " " + std::to_string(start.year);
        case PeriodFrequency::kYearly:
            return "FY " + std::to_string(fiscal_year);
    }
    return std::to_string(number);
}

std::string PeriodLabel(int number) {
    return "Period " + std::to_string(number);
}

}  // namespace

AccountingPeriodLifecycle::AccountingPeriodLifecycle(std::string organization_id,
                                                     NowFn now,
                                                     const LedgerRuntimeConfig* runtime)
    : organization_id_(std::move(organization_id)), now_(std::move(now)), runtime_(runtime) {}

bool AccountingPeriodLifecycle::InitializeFiscalYear(int fiscal_year,
                                                     PeriodFrequency frequency,
                                                     int start_month,
                                                     const std::string& performed_by,
                                                     LedgerError* error) {
    if (initialized_) {
        return FailWith(error,
                        LedgerErrorCode::kAlreadyExists,
                        "Fiscal year " + std::to_string(fiscal_year_) + " is already initialized");
    }
    if (fiscal_year < 1 || fiscal_year > 9998) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Invalid fiscal year: " + std::to_string(fiscal_year));
    }
    if (start_month < 1 || start_month > 12) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Start month must be within 1..12: " + std::to_string(start_month));
    }

    const int span = MonthsPerPeriod(frequency);
    const int count = 12 / span;
    const CivilDate year_start = FirstDayOfMonth(fiscal_year, start_month);
    std::vector<AccountingPeriod> periods;
    periods.reserve(count);
    for (int i = 0; i < count; ++i) {
        AccountingPeriod period;
        period.number = i + 1;
        period.start_date = AddMonths(year_start, i * span);
        const CivilDate last_month = AddMonths(period.start_date, span - 1);
        period.end_date = LastDayOfMonth(last_month.year, last_month.month);
        period.name = PeriodName(frequency, period.number, fiscal_year, period.start_date);
        period.is_year_end = i + 1 == count;
        periods.push_back(std::move(period));
    }

    initialized_ = true;
    fiscal_year_ = fiscal_year;
    frequency_ = frequency;
    start_month_ = start_month;
    periods_ = std::move(periods);
    EmitStructuredLog(runtime_, kApp, "info", "fiscal_year_initialized",
                      {{"organization_id", organization_id_},
                       {"fiscal_year", std::to_string(fiscal_year_)},
                       {"frequency", ToString(frequency_)},
                       {"periods", std::to_string(periods_.size())},
                       {"performed_by", performed_by}});
    return true;
}

bool AccountingPeriodLifecycle::OpenPeriod(int number,
                                           const std::string& performed_by,
                                           LedgerError* error) {
    if (!RequireWritable(error)) {
        return false;
    }
    AccountingPeriod* period = FindPeriod(number, error);
    if (period == nullptr) {
        return false;
    }
    if (period->status == PeriodStatus::kOpen) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        PeriodLabel(number) + " is already open");
    }
    if (period->status == PeriodStatus::kLocked) {
        return FailWith(error, LedgerErrorCode::kInvalidState, PeriodLabel(number) + " is locked");
    }
    if (number > 1 && periods_[number - 2].status == PeriodStatus::kNotStarted) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Cannot open " + PeriodLabel(number) + ": previous period has not been started");
    }
    if (period->status == PeriodStatus::kClosed) {
        const int locked = FirstLockedAfter(number);
        if (locked != 0) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidState,
                            "Cannot reopen " + PeriodLabel(number) + ": later period " +
                                std::to_string(locked) + " is locked");
        }
    }
    period->status = PeriodStatus::kOpen;
    period->opened_by = performed_by;
    period->opened_at_ns = ResolveNow(now_);
    Log("period_opened", *period, performed_by);
    return true;
}

bool AccountingPeriodLifecycle::ClosePeriod(int number,
                                            const std::string& performed_by,
                                            bool force,
                                            LedgerError* error) {
    if (!RequireWritable(error)) {
        return false;
    }
    AccountingPeriod* period = FindPeriod(number, error);
    if (period == nullptr) {
        return false;
    }
    switch (period->status) {
        case PeriodStatus::kClosed:
            return FailWith(error,
                            LedgerErrorCode::kInvalidState,
                            PeriodLabel(number) + " is already closed");
        case PeriodStatus::kLocked:
            return FailWith(error,
                            LedgerErrorCode::kInvalidState,
                            PeriodLabel(number) + " is locked");
        case PeriodStatus::kNotStarted:
            if (!force) {
                return FailWith(error,
                                LedgerErrorCode::kInvalidState,
                                PeriodLabel(number) + " was never opened");
            }
            break;
        case PeriodStatus::kOpen:
            break;
    }
    period->status = PeriodStatus::kClosed;
    period->closed_by = performed_by;
    period->closed_at_ns = ResolveNow(now_);
    Log("period_closed", *period, performed_by);
    return true;
}

bool AccountingPeriodLifecycle::LockPeriod(int number,
                                           const std::string& performed_by,
                                           LedgerError* error) {
    if (!RequireWritable(error)) {
        return false;
    }
    AccountingPeriod* period = FindPeriod(number, error);
    if (period == nullptr) {
        return false;
    }
    if (period->status == PeriodStatus::kLocked) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        PeriodLabel(number) + " is already locked");
    }
    if (period->status != PeriodStatus::kClosed) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        PeriodLabel(number) + " must be closed first");
    }
    for (int prior = 1; prior < number; ++prior) {
        const auto status = periods_[prior - 1].status;
        if (status != PeriodStatus::kClosed && status != PeriodStatus::kLocked) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidState,
                            "Cannot lock " + PeriodLabel(number) + ": prior period " +
                                std::to_string(prior) + " still closing");
        }
    }
    period->status = PeriodStatus::kLocked;
    period->locked_by = performed_by;
    period->locked_at_ns = ResolveNow(now_);
    Log("period_locked", *period, performed_by);
    return true;
}

bool AccountingPeriodLifecycle::ReopenPeriod(int number,
                                             const std::string& reason,
                                             const std::string& performed_by,
                                             LedgerError* error) {
    if (!RequireWritable(error)) {
        return false;
    }
    AccountingPeriod* period = FindPeriod(number, error);
    if (period == nullptr) {
        return false;
    }
    if (period->status == PeriodStatus::kLocked) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Locked " + PeriodLabel(number) + " cannot be reopened");
    }
    if (period->status != PeriodStatus::kClosed) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        PeriodLabel(number) + " is not closed");
    }
    const int locked = FirstLockedAfter(number);
    if (locked != 0) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Cannot reopen " + PeriodLabel(number) + ": later period " +
                            std::to_string(locked) + " is locked");
    }
    period->status = PeriodStatus::kOpen;
    period->opened_by = performed_by;
    period->opened_at_ns = ResolveNow(now_);
    if (!reason.empty()) {
        period->notes = "Reopened: " + reason;
    }
    Log("period_reopened", *period, performed_by);
    return true;
}

bool AccountingPeriodLifecycle::YearEndClose(const std::string& performed_by,
                                             const std::string& retained_earnings_account_code,
                                             LedgerError* error) {
    if (!initialized_) {
        return FailWith(error, LedgerErrorCode::kInvalidState, "Fiscal year is not initialized");
    }
    if (year_closed_) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Fiscal year " + std::to_string(fiscal_year_) + " is already closed");
    }
    if (retained_earnings_account_code.empty()) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Retained earnings account code is required");
    }
    std::string unclosed;
    for (const auto& period : periods_) {
        if (period.status != PeriodStatus::kClosed && period.status != PeriodStatus::kLocked) {
            unclosed += unclosed.empty() ? "" : ", ";
            unclosed += std::to_string(period.number);
        }
    }
    if (!unclosed.empty()) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Cannot close fiscal year " + std::to_string(fiscal_year_) +
                            ": periods not closed: " + unclosed);
    }

    const EpochNanos now = ResolveNow(now_);
    for (auto& period : periods_) {
        if (period.status != PeriodStatus::kLocked) {
            period.status = PeriodStatus::kLocked;
            period.locked_by = performed_by;
            period.locked_at_ns = now;
        }
    }
    year_closed_ = true;
    year_closed_by_ = performed_by;
    year_closed_at_ns_ = now;
    retained_earnings_account_code_ = retained_earnings_account_code;
    EmitStructuredLog(runtime_, kApp, "info", "year_closed",
                      {{"organization_id", organization_id_},
                       {"fiscal_year", std::to_string(fiscal_year_)},
                       {"retained_earnings_account", retained_earnings_account_code},
                       {"performed_by", performed_by}});
    return true;
}

bool AccountingPeriodLifecycle::CanPostToDate(const CivilDate& date) const {
    if (!initialized_ || year_closed_) {
        return false;
    }
    const auto period = GetPeriodForDate(date);
    return period.has_value() && period->status == PeriodStatus::kOpen;
}

std::optional<AccountingPeriod> AccountingPeriodLifecycle::GetPeriodForDate(
    const CivilDate& date) const {
    for (const auto& period : periods_) {
        if (period.start_date <= date && date <= period.end_date) {
            return period;
        }
    }
    return std::nullopt;
}

std::optional<AccountingPeriod> AccountingPeriodLifecycle::GetPeriod(int number) const {
    if (number < 1 || number > static_cast<int>(periods_.size())) {
        return std::nullopt;
    }
    return periods_[number - 1];
}

std::optional<AccountingPeriod> AccountingPeriodLifecycle::GetCurrentOpenPeriod() const {
    for (const auto& period : periods_) {
        if (period.status == PeriodStatus::kOpen) {
            return period;
        }
    }
    return std::nullopt;
}

FiscalYearSummary AccountingPeriodLifecycle::GetSummary() const {
    FiscalYearSummary summary;
    summary.fiscal_year = fiscal_year_;
    summary.frequency = frequency_;
    summary.start_month = start_month_;
    summary.total_periods = static_cast<int>(periods_.size());
    if (!periods_.empty()) {
        summary.start_date = periods_.front().start_date;
        summary.end_date = periods_.back().end_date;
    }
    for (const auto& period : periods_) {
        switch (period.status) {
            case PeriodStatus::kNotStarted:
                ++summary.not_started_periods;
                break;
            case PeriodStatus::kOpen:
                ++summary.open_periods;
                break;
            case PeriodStatus::kClosed:
                ++summary.closed_periods;
                break;
            case PeriodStatus::kLocked:
                ++summary.locked_periods;
                break;
        }
    }
    summary.is_year_closed = year_closed_;
    summary.year_closed_by = year_closed_by_;
    summary.year_closed_at_ns = year_closed_at_ns_;
    summary.retained_earnings_account_code = retained_earnings_account_code_;
    return summary;
}

bool AccountingPeriodLifecycle::RequireWritable(LedgerError* error) const {
    if (!initialized_) {
        return FailWith(error, LedgerErrorCode::kInvalidState, "Fiscal year is not initialized");
    }
    if (year_closed_) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Fiscal year " + std::to_string(fiscal_year_) + " is already closed");
    }
    return true;
}

AccountingPeriod* AccountingPeriodLifecycle::FindPeriod(int number, LedgerError* error) {
    if (number < 1 || number > static_cast<int>(periods_.size())) {
        FailWith(error, LedgerErrorCode::kNotFound, PeriodLabel(number) + " not found");
        return nullptr;
    }
    return &periods_[number - 1];
}

int AccountingPeriodLifecycle::FirstLockedAfter(int number) const {
    for (int later = number + 1; later <= static_cast<int>(periods_.size()); ++later) {
        if (periods_[later - 1].status == PeriodStatus::kLocked) {
            return later;
        }
    }
    return 0;
}

void AccountingPeriodLifecycle::Log(const std::string& event,
                                    const AccountingPeriod& period,
                                    const std::string& by) const {
    EmitStructuredLog(runtime_, kApp, "info", event,
                      {{"organization_id", organization_id_},
                       {"fiscal_year", std::to_string(fiscal_year_)},
                       {"period", std::to_string(period.number)},
                       {"status", ToString(period.status)},
                       {"performed_by", by}});
}

}  // namespace ledger_core
