#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "ledger_core/common/timestamp.h"
#include "ledger_core/core/ledger_config.h"
#include "ledger_core/interfaces/account_posting_directory.h"
#include "ledger_core/interfaces/chart_of_accounts.h"
#include "ledger_core/services/accounting_period_lifecycle.h"

namespace ledger_core {

struct YearEndCloseRequest {
    std::string organization_id;
    // Defaults to "YEC-<fiscal year>".
    std::string closing_journal_id;
    // Defaults to the last day of the fiscal year.
    std::optional<CivilDate> closing_date;
    std::string retained_earnings_account_code;
    std::string performed_by;
};

struct YearEndCloseResult {
    bool closing_entry_posted{false};
    std::string closing_journal_id;
    std::size_t accounts_closed{0};
    // Revenue minus expenses moved into retained earnings.
    Amount net_income;
};

// Zeroes every active revenue and expense account into retained earnings with one
// balanced closing journal, then closes the fiscal year.
class YearEndCloseOrchestrator {
public:
    YearEndCloseOrchestrator(const IChartOfAccounts& chart,
                             IAccountPostingDirectory& directory,
                             AccountingPeriodLifecycle& periods,
                             NowFn now = {},
                             const LedgerRuntimeConfig* runtime = nullptr);

    bool Run(const YearEndCloseRequest& request, YearEndCloseResult* result, LedgerError* error);

private:
    const IChartOfAccounts& chart_;
    IAccountPostingDirectory& directory_;
    AccountingPeriodLifecycle& periods_;
    NowFn now_;
    const LedgerRuntimeConfig* runtime_{nullptr};
};

}  // namespace ledger_core
