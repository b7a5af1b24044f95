#include "ledger_core/services/year_end_close_orchestrator.h"

#include <utility>
#include <vector>

#include "ledger_core/core/structured_log.h"
#include "ledger_core/services/journal_entry_workflow.h"

namespace ledger_core {

namespace {

constexpr const char* kApp = "year_end_close";

}  // namespace

YearEndCloseOrchestrator::YearEndCloseOrchestrator(const IChartOfAccounts& chart,
                                                   IAccountPostingDirectory& directory,
                                                   AccountingPeriodLifecycle& periods,
                                                   NowFn now,
                                                   const LedgerRuntimeConfig* runtime)
    : chart_(chart),
      directory_(directory),
      periods_(periods),
      now_(std::move(now)),
      runtime_(runtime) {}

bool YearEndCloseOrchestrator::Run(const YearEndCloseRequest& request,
                                   YearEndCloseResult* result,
                                   LedgerError* error) {
    if (!periods_.IsInitialized()) {
        return FailWith(error, LedgerErrorCode::kInvalidState, "Fiscal year is not initialized");
    }
    const int fiscal_year = periods_.fiscal_year();
    if (periods_.IsYearClosed()) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Fiscal year " + std::to_string(fiscal_year) + " is already closed");
    }
    std::string unclosed;
    for (const auto& period : periods_.GetAllPeriods()) {
        if (period.status != PeriodStatus::kClosed && period.status != PeriodStatus::kLocked) {
            unclosed += unclosed.empty() ? "" : ", ";
            unclosed += std::to_string(period.number);
        }
    }
    if (!unclosed.empty()) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Cannot close fiscal year " + std::to_string(fiscal_year) +
                            ": periods not closed: " + unclosed);
    }
    const auto& retained = request.retained_earnings_account_code;
    if (retained.empty()) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Retained earnings account code is required");
    }
    if (!chart_.ValidateAccount(retained)) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Account " + retained + " not found or inactive");
    }
    if (!directory_.HasAccount(retained)) {
        return FailWith(error,
                        LedgerErrorCode::kNotFound,
                        "Account " + retained + " does not exist");
    }

    std::vector<JournalLine> lines;
    Amount debits;
    Amount credits;
    for (const auto& account : chart_.ListActiveAccounts()) {
        if (account.type != AccountType::kRevenue && account.type != AccountType::kExpense) {
            continue;
        }
        if (!directory_.HasAccount(account.code)) {
            continue;
        }
        Amount balance;
        if (!directory_.GetBalance(account.code, &balance, error)) {
            return false;
        }
        if (balance.IsZero()) {
            continue;
        }
        // Post against the normal side to bring the balance to zero.
        const bool zero_with_debit =
            (NormalBalanceSide(account.type) == BalanceSide::kCredit) == balance.IsPositive();
        JournalLine line;
        line.account_code = account.code;
        line.description = "Year-end close " + std::to_string(fiscal_year);
        if (zero_with_debit) {
            line.debit = balance.Abs();
        } else {
            line.credit = balance.Abs();
        }
        if (!Amount::CheckedAdd(debits, line.debit, &debits) ||
            !Amount::CheckedAdd(credits, line.credit, &credits)) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidArgument,
                            "Closing entry totals are out of range");
        }
        lines.push_back(std::move(line));
    }

    Amount net_income;
    if (!Amount::CheckedSub(debits, credits, &net_income)) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Closing entry totals are out of range");
    }
    if (!net_income.IsZero()) {
        JournalLine line;
        line.account_code = retained;
        line.description = "Net income " + std::to_string(fiscal_year);
        if (net_income.IsPositive()) {
            line.credit = net_income;
        } else {
            line.debit = net_income.Abs();
        }
        lines.push_back(std::move(line));
    }

    YearEndCloseResult out;
    out.accounts_closed = lines.size() - (net_income.IsZero() ? 0 : 1);
    out.net_income = net_income;
    out.closing_journal_id = request.closing_journal_id.empty()
                                 ? "YEC-" + std::to_string(fiscal_year)
                                 : request.closing_journal_id;
    if (!lines.empty()) {
        CreateJournalEntryRequest journal_request;
        journal_request.organization_id = request.organization_id;
        journal_request.journal_entry_id = out.closing_journal_id;
        journal_request.posting_date =
            request.closing_date.value_or(periods_.GetSummary().end_date);
        journal_request.lines = std::move(lines);
        journal_request.memo = "Year-end close " + std::to_string(fiscal_year);
        journal_request.reference = retained;
        journal_request.performed_by = request.performed_by;

        JournalEntryWorkflow journal(now_, runtime_);
        // Every period is closed by now; the closing entry bypasses the posting gate.
        if (!journal.Create(journal_request, &chart_, error) ||
            !journal.Approve(request.performed_by, error) ||
            !journal.Post(request.performed_by, directory_, nullptr, error)) {
            EmitStructuredLog(runtime_, kApp, "error", "closing_entry_failed",
                              {{"fiscal_year", std::to_string(fiscal_year)},
                               {"journal_entry_id", out.closing_journal_id},
                               {"error", error != nullptr ? error->message : ""}});
            return false;
        }
        out.closing_entry_posted = true;
    }

    if (!periods_.YearEndClose(request.performed_by, retained, error)) {
        return false;
    }
    EmitStructuredLog(runtime_, kApp, "info", "year_end_close_completed",
                      {{"fiscal_year", std::to_string(fiscal_year)},
                       {"accounts_closed", std::to_string(out.accounts_closed)},
                       {"net_income", out.net_income.ToString()}});
    if (result != nullptr) {
        *result = std::move(out);
    }
    return true;
}

}  // namespace ledger_core
