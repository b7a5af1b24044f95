#include <cstdint>
#include <string>

#include <gtest/gtest.h>

#include "ledger_core/services/account_book.h"
#include "ledger_core/services/in_memory_chart_of_accounts.h"
#include "ledger_core/services/journal_entry_workflow.h"
#include "ledger_core/services/year_end_close_orchestrator.h"

namespace ledger_core {

namespace {

class YearEndCloseOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        AddAccount("1000", AccountType::kAsset);
        AddAccount("3200", AccountType::kEquity);
        AddAccount("4000", AccountType::kRevenue);
        AddAccount("5000", AccountType::kExpense);
        LedgerError error;
        ASSERT_TRUE(periods_.InitializeFiscalYear(2024, PeriodFrequency::kQuarterly, 1, "a", &error));
        ASSERT_TRUE(periods_.OpenPeriod(1, "a", &error));
    }

    void AddAccount(const std::string& code, AccountType type) {
        LedgerError error;
        ASSERT_TRUE(chart_.AddAccount({code, "Account " + code, type, "", true}, &error));
        CreateAccountRequest request;
        request.account_id = "acct-" + code;
        request.account_code = code;
        request.name = "Account " + code;
        request.account_type = type;
        ASSERT_TRUE(book_.CreateAccount(request, &error)) << error.message;
    }

    void PostJournal(const std::string& id,
                     const std::string& debit_code,
                     const std::string& credit_code,
                     std::int64_t whole) {
        JournalLine debit;
        debit.account_code = debit_code;
        debit.debit = Amount::FromInteger(whole);
        JournalLine credit;
        credit.account_code = credit_code;
        credit.credit = Amount::FromInteger(whole);

        CreateJournalEntryRequest request;
        request.organization_id = "org-1";
        request.journal_entry_id = id;
        request.posting_date = CivilDate{2024, 2, 10};
        request.lines = {debit, credit};
        request.performed_by = "alice";

        JournalEntryWorkflow journal;
        LedgerError error;
        ASSERT_TRUE(journal.Create(request, &chart_, &error)) << error.message;
        ASSERT_TRUE(journal.Approve("bob", &error));
        ASSERT_TRUE(journal.Post("bob", book_, &periods_, &error)) << error.message;
    }

    void CloseAllPeriods() {
        LedgerError error;
        for (const auto& period : periods_.GetAllPeriods()) {
            ASSERT_TRUE(periods_.ClosePeriod(period.number, "a", true, &error)) << error.message;
        }
    }

    Amount BalanceOf(const std::string& code) const {
        Amount balance;
        LedgerError error;
        EXPECT_TRUE(book_.GetBalance(code, &balance, &error)) << error.message;
        return balance;
    }

    YearEndCloseRequest Request() const {
        YearEndCloseRequest request;
        request.organization_id = "org-1";
        request.retained_earnings_account_code = "3200";
        request.performed_by = "cfo";
        return request;
    }

    InMemoryChartOfAccounts chart_;
    AccountBook book_{"org-1"};
    AccountingPeriodLifecycle periods_{"org-1"};
};

}  // namespace

TEST_F(YearEndCloseOrchestratorTest, MovesNetIncomeIntoRetainedEarnings) {
    PostJournal("JE-SALES", "1000", "4000", 500);
    PostJournal("JE-FOOD", "5000", "1000", 200);
    CloseAllPeriods();

    YearEndCloseOrchestrator orchestrator(chart_, book_, periods_);
    YearEndCloseResult result;
    LedgerError error;
    ASSERT_TRUE(orchestrator.Run(Request(), &result, &error)) << error.message;

    EXPECT_TRUE(result.closing_entry_posted);
    EXPECT_EQ(result.closing_journal_id, "YEC-2024");
    EXPECT_EQ(result.accounts_closed, 2U);
    EXPECT_EQ(result.net_income, Amount::FromInteger(300));
    EXPECT_EQ(BalanceOf("4000"), Amount());
    EXPECT_EQ(BalanceOf("5000"), Amount());
    EXPECT_EQ(BalanceOf("3200"), Amount::FromInteger(300));
    EXPECT_EQ(BalanceOf("1000"), Amount::FromInteger(300));

    const auto closing = book_.FindEntriesByReference("3200", "YEC-2024");
    ASSERT_EQ(closing.size(), 1U);
    EXPECT_EQ(closing.front().type, LedgerEntryType::kCredit);
    EXPECT_EQ(closing.front().reference_type, "JournalEntry");

    EXPECT_TRUE(periods_.IsYearClosed());
    EXPECT_EQ(periods_.GetSummary().retained_earnings_account_code, "3200");
    EXPECT_FALSE(orchestrator.Run(Request(), &result, &error));
    EXPECT_EQ(error.message, "Fiscal year 2024 is already closed");
}

TEST_F(YearEndCloseOrchestratorTest, NetLossDebitsRetainedEarnings) {
    PostJournal("JE-SALES", "1000", "4000", 100);
    PostJournal("JE-RENT", "5000", "1000", 250);
    CloseAllPeriods();

    YearEndCloseOrchestrator orchestrator(chart_, book_, periods_);
    YearEndCloseResult result;
    LedgerError error;
    ASSERT_TRUE(orchestrator.Run(Request(), &result, &error)) << error.message;
    EXPECT_EQ(result.net_income, Amount::FromInteger(-150));
    EXPECT_EQ(BalanceOf("3200"), Amount::FromInteger(-150));
}

TEST_F(YearEndCloseOrchestratorTest, RequiresClosedPeriodsAndValidRetainedEarnings) {
    YearEndCloseOrchestrator orchestrator(chart_, book_, periods_);
    YearEndCloseResult result;
    LedgerError error;
    EXPECT_FALSE(orchestrator.Run(Request(), &result, &error));
    EXPECT_EQ(error.message, "Cannot close fiscal year 2024: periods not closed: 1, 2, 3, 4");

    CloseAllPeriods();
    auto request = Request();
    request.retained_earnings_account_code = "";
    EXPECT_FALSE(orchestrator.Run(request, &result, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kInvalidArgument);

    request.retained_earnings_account_code = "3900";
    EXPECT_FALSE(orchestrator.Run(request, &result, &error));
    EXPECT_EQ(error.message, "Account 3900 not found or inactive");
    EXPECT_FALSE(periods_.IsYearClosed());
}

TEST_F(YearEndCloseOrchestratorTest, QuietYearClosesWithoutJournal) {
    CloseAllPeriods();
    YearEndCloseOrchestrator orchestrator(chart_, book_, periods_);
    YearEndCloseResult result;
    LedgerError error;
    ASSERT_TRUE(orchestrator.Run(Request(), &result, &error)) << error.message;
    EXPECT_FALSE(result.closing_entry_posted);
    EXPECT_EQ(result.accounts_closed, 0U);
    EXPECT_TRUE(result.net_income.IsZero());
    EXPECT_TRUE(periods_.IsYearClosed());
}

}  // namespace ledger_core
