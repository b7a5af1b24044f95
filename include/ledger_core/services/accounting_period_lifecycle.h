#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ledger_core/common/timestamp.h"
#include "ledger_core/contracts/types.h"
#include "ledger_core/core/ledger_config.h"
#include "ledger_core/interfaces/posting_gate.h"

namespace ledger_core {

struct AccountingPeriod {
    int number{0};
    std::string name;
    CivilDate start_date;
    CivilDate end_date;
    PeriodStatus status{PeriodStatus::kNotStarted};
    std::string opened_by;
    EpochNanos opened_at_ns{0};
    std::string closed_by;
    EpochNanos closed_at_ns{0};
    std::string locked_by;
    EpochNanos locked_at_ns{0};
    std::string notes;
    bool is_year_end{false};
};

struct FiscalYearSummary {
    int fiscal_year{0};
    PeriodFrequency frequency{PeriodFrequency::kMonthly};
    int start_month{1};
    CivilDate start_date;
    CivilDate end_date;
    int total_periods{0};
    int not_started_periods{0};
    int open_periods{0};
    int closed_periods{0};
    int locked_periods{0};
    bool is_year_closed{false};
    std::string year_closed_by;
    EpochNanos year_closed_at_ns{0};
    std::string retained_earnings_account_code;
};

// Period state machine of one organization's fiscal year.
//
//   NotStarted -> Open -> Closed -> Locked
//                  ^        |
//                  +--------+  (reopen, blocked by any later Locked period)
//
// Locking is a sequential ratchet: period n locks only after 1..n-1 are closed or locked.
// Once the year is closed every period is locked and no date of the year is postable.
class AccountingPeriodLifecycle : public IPostingGate {
public:
    explicit AccountingPeriodLifecycle(std::string organization_id = {},
                                       NowFn now = {},
                                       const LedgerRuntimeConfig* runtime = nullptr);

    bool InitializeFiscalYear(int fiscal_year,
                              PeriodFrequency frequency,
                              int start_month,
                              const std::string& performed_by,
                              LedgerError* error);
    bool OpenPeriod(int number, const std::string& performed_by, LedgerError* error);
    bool ClosePeriod(int number, const std::string& performed_by, bool force, LedgerError* error);
    bool LockPeriod(int number, const std::string& performed_by, LedgerError* error);
    bool ReopenPeriod(int number,
                      const std::string& reason,
                      const std::string& performed_by,
                      LedgerError* error);
    // Closing entries against the retained-earnings account are posted by the caller first.
    bool YearEndClose(const std::string& performed_by,
                      const std::string& retained_earnings_account_code,
                      LedgerError* error);

    bool CanPostToDate(const CivilDate& date) const override;
    std::optional<AccountingPeriod> GetPeriodForDate(const CivilDate& date) const;
    std::optional<AccountingPeriod> GetPeriod(int number) const;
    const std::vector<AccountingPeriod>& GetAllPeriods() const { return periods_; }
    // Lowest-numbered Open period.
    std::optional<AccountingPeriod> GetCurrentOpenPeriod() const;
    FiscalYearSummary GetSummary() const;

    bool IsInitialized() const { return initialized_; }
    bool IsYearClosed() const { return year_closed_; }
    int fiscal_year() const { return fiscal_year_; }
    PeriodFrequency frequency() const { return frequency_; }
    const std::string& organization_id() const { return organization_id_; }

private:
    bool RequireWritable(LedgerError* error) const;
    AccountingPeriod* FindPeriod(int number, LedgerError* error);
    // Number of the first Locked period after `number`, or 0.
    int FirstLockedAfter(int number) const;
    void Log(const std::string& event, const AccountingPeriod& period, const std::string& by) const;

    const std::string organization_id_;
    NowFn now_;
    const LedgerRuntimeConfig* runtime_{nullptr};

    bool initialized_{false};
    int fiscal_year_{0};
    PeriodFrequency frequency_{PeriodFrequency::kMonthly};
    int start_month_{1};
    std::vector<AccountingPeriod> periods_;
    bool year_closed_{false};
    std::string year_closed_by_;
    EpochNanos year_closed_at_ns_{0};
    std::string retained_earnings_account_code_;
};

}  // namespace ledger_core
