#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "ledger_core/common/timestamp.h"
#include "ledger_core/services/account_ledger.h"

namespace ledger_core {

namespace {

class RecordingSink : public IAccountEventSink {
public:
    bool Append(const AccountEvent& event) override {
        if (fail_appends) {
            return false;
        }
        events.push_back(event);
        return true;
    }
    bool Flush() override { return true; }

    std::vector<AccountEvent> events;
    bool fail_appends{false};
};

class FakeClock {
public:
    explicit FakeClock(CivilDate date) : now_(StartOfDayNanos(date)) {}

    NowFn Fn() {
        return [this]() { return now_; };
    }
    void Advance(EpochNanos delta) { now_ += delta; }
    EpochNanos now() const { return now_; }

private:
    EpochNanos now_;
};

CreateAccountRequest BuildRequest(AccountType type, const std::string& code) {
    CreateAccountRequest request;
    request.organization_id = "org-1";
    request.account_id = "acct-" + code;
    request.account_code = code;
    request.name = "Account " + code;
    request.account_type = type;
    request.performed_by = "alice";
    return request;
}

PostingRequest Posting(std::int64_t whole, const std::string& reference_id = "") {
    PostingRequest request;
    request.amount = Amount::FromInteger(whole);
    request.performed_by = "alice";
    request.reference_id = reference_id;
    return request;
}

}  // namespace

TEST(AccountLedgerTest, AssetDebitIncreasesAndCreditDecreasesBalance) {
    FakeClock clock(CivilDate{2024, 3, 10});
    AccountLedger ledger(clock.Fn());
    LedgerError error;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error)) << error.message;

    PostingResult result;
    ASSERT_TRUE(ledger.PostDebit(Posting(500), &result, &error)) << error.message;
    EXPECT_EQ(result.balance_before, Amount());
    EXPECT_EQ(result.new_balance, Amount::FromInteger(500));
    ASSERT_TRUE(ledger.PostCredit(Posting(300), &result, &error)) << error.message;
    EXPECT_EQ(result.type, LedgerEntryType::kCredit);
    EXPECT_EQ(ledger.GetBalance(), Amount::FromInteger(200));
    EXPECT_EQ(ledger.entries().size(), 2U);
    EXPECT_EQ(ledger.entries().back().balance_after, Amount::FromInteger(200));
}

TEST(AccountLedgerTest, RevenueCreditIncreasesBalance) {
    AccountLedger ledger;
    LedgerError error;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kRevenue, "4000"), &error));
    EXPECT_EQ(ledger.normal_side(), BalanceSide::kCredit);

    ASSERT_TRUE(ledger.PostCredit(Posting(120), nullptr, &error));
    ASSERT_TRUE(ledger.PostDebit(Posting(20), nullptr, &error));
    EXPECT_EQ(ledger.GetBalance(), Amount::FromInteger(100));
    EXPECT_EQ(ledger.entries().back().balance_effect, Amount::FromInteger(-20));
}

TEST(AccountLedgerTest, OpeningBalanceIsRecordedAsEntry) {
    AccountLedger ledger;
    LedgerError error;
    auto request = BuildRequest(AccountType::kLiability, "2000");
    request.opening_balance = Amount::FromInteger(-50);
    ASSERT_TRUE(ledger.Create(request, &error)) << error.message;

    ASSERT_EQ(ledger.entries().size(), 1U);
    const auto& opening = ledger.entries().front();
    EXPECT_EQ(opening.type, LedgerEntryType::kOpening);
    EXPECT_EQ(opening.amount, Amount::FromInteger(50));
    EXPECT_EQ(opening.balance_effect, Amount::FromInteger(-50));
    EXPECT_EQ(ledger.GetBalance(), Amount::FromInteger(-50));
}

TEST(AccountLedgerTest, CreateValidatesRequest) {
    LedgerError error;
    AccountLedger missing_code;
    EXPECT_FALSE(missing_code.Create(BuildRequest(AccountType::kAsset, ""), &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kInvalidArgument);

    AccountLedger bad_currency;
    auto request = BuildRequest(AccountType::kAsset, "1000");
    request.currency = "usd";
    EXPECT_FALSE(bad_currency.Create(request, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kInvalidArgument);

    AccountLedger ledger;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error));
    EXPECT_FALSE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kAlreadyExists);
}

TEST(AccountLedgerTest, PostRejectsNonPositiveAmountAndUnknownAccount) {
    LedgerError error;
    AccountLedger uncreated;
    EXPECT_FALSE(uncreated.PostDebit(Posting(10), nullptr, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kNotFound);

    AccountLedger ledger;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error));
    EXPECT_FALSE(ledger.PostDebit(Posting(0), nullptr, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kInvalidArgument);
    EXPECT_EQ(error.message, "Amount must be positive");
    EXPECT_FALSE(ledger.PostCredit(Posting(-5), nullptr, &error));
    EXPECT_TRUE(ledger.entries().empty());
}

TEST(AccountLedgerTest, InactiveAccountRejectsPostings) {
    AccountLedger ledger;
    LedgerError error;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kExpense, "5000"), &error));
    ASSERT_TRUE(ledger.Deactivate("alice", &error));
    EXPECT_FALSE(ledger.Deactivate("alice", &error));

    EXPECT_FALSE(ledger.PostDebit(Posting(10), nullptr, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kInvalidState);
    EXPECT_EQ(error.message, "Account is not active");

    ASSERT_TRUE(ledger.Activate("alice", &error));
    EXPECT_TRUE(ledger.PostDebit(Posting(10), nullptr, &error));
}

TEST(AccountLedgerTest, SystemAccountCannotBeDeactivated) {
    AccountLedger ledger;
    LedgerError error;
    auto request = BuildRequest(AccountType::kEquity, "3100");
    request.is_system_account = true;
    ASSERT_TRUE(ledger.Create(request, &error));
    EXPECT_FALSE(ledger.Deactivate("alice", &error));
    EXPECT_EQ(error.message, "System accounts cannot be deactivated");
    EXPECT_TRUE(ledger.is_active());
}

TEST(AccountLedgerTest, ReverseEntryOffsetsAndLinksBothEntries) {
    AccountLedger ledger;
    LedgerError error;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error));
    PostingResult debit;
    ASSERT_TRUE(ledger.PostDebit(Posting(500), &debit, &error));
    ASSERT_TRUE(ledger.PostCredit(Posting(300), nullptr, &error));

    PostingResult reversal;
    ASSERT_TRUE(ledger.ReverseEntry(debit.entry_id, "", "bob", &reversal, &error))
        << error.message;
    EXPECT_EQ(ledger.GetBalance(), Amount::FromInteger(-300));
    EXPECT_EQ(reversal.type, LedgerEntryType::kReversal);

    const auto original = ledger.GetEntry(debit.entry_id);
    ASSERT_TRUE(original.has_value());
    EXPECT_EQ(original->status, LedgerEntryStatus::kReversed);
    EXPECT_EQ(original->reversal_entry_id, reversal.entry_id);

    const auto offset = ledger.GetEntry(reversal.entry_id);
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(offset->reversed_entry_id, debit.entry_id);
    EXPECT_EQ(offset->reference_type, "Reversal");
    EXPECT_EQ(offset->description, "Reversal of " + debit.entry_id);
}

TEST(AccountLedgerTest, ReverseEntryAcceptsIdHeldByLedgerEntries) {
    AccountLedger ledger;
    LedgerError error;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error));
    ASSERT_TRUE(ledger.PostDebit(Posting(500), nullptr, &error));
    ASSERT_TRUE(ledger.PostCredit(Posting(300), nullptr, &error));
    ASSERT_EQ(ledger.entries().size(), ledger.entries().capacity());

    testing::internal::CaptureStderr();
    PostingResult reversal;
    const bool reversed =
        ledger.ReverseEntry(ledger.entries()[0].entry_id, "", "bob", &reversal, &error);
    const auto log = testing::internal::GetCapturedStderr();
    ASSERT_TRUE(reversed) << error.message;

    EXPECT_NE(log.find("event=entry_reversed"), std::string::npos) << log;
    EXPECT_NE(log.find("entry_id=\"acct-1000-000001\""), std::string::npos) << log;
    EXPECT_EQ(ledger.GetBalance(), Amount::FromInteger(-300));
    const auto offset = ledger.GetEntry(reversal.entry_id);
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(offset->reversed_entry_id, "acct-1000-000001");
    EXPECT_EQ(ledger.entries()[0].status, LedgerEntryStatus::kReversed);
}

TEST(AccountLedgerTest, ReverseEntryRejectsRepeatsAndReversals) {
    AccountLedger ledger;
    LedgerError error;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error));
    PostingResult debit;
    ASSERT_TRUE(ledger.PostDebit(Posting(75), &debit, &error));
    PostingResult reversal;
    ASSERT_TRUE(ledger.ReverseEntry(debit.entry_id, "duplicate", "bob", &reversal, &error));

    EXPECT_FALSE(ledger.ReverseEntry(debit.entry_id, "again", "bob", nullptr, &error));
    EXPECT_EQ(error.message, "Entry has already been reversed");
    EXPECT_FALSE(ledger.ReverseEntry(reversal.entry_id, "undo", "bob", nullptr, &error));
    EXPECT_EQ(error.message, "Cannot reverse a reversal entry");
    EXPECT_FALSE(ledger.ReverseEntry("missing", "", "bob", nullptr, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kNotFound);
    EXPECT_EQ(ledger.GetBalance(), Amount());
}

TEST(AccountLedgerTest, AdjustBalancePostsDifference) {
    AccountLedger ledger;
    LedgerError error;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error));
    ASSERT_TRUE(ledger.PostDebit(Posting(100), nullptr, &error));

    PostingResult result;
    ASSERT_TRUE(ledger.AdjustBalance(Amount::FromInteger(80), "count", "bob", &result, &error));
    EXPECT_EQ(result.type, LedgerEntryType::kAdjustment);
    EXPECT_EQ(result.amount, Amount::FromInteger(20));
    EXPECT_EQ(ledger.GetBalance(), Amount::FromInteger(80));

    EXPECT_FALSE(ledger.AdjustBalance(Amount::FromInteger(80), "noop", "bob", nullptr, &error));
    EXPECT_EQ(error.message, "New balance is the same as current balance");
}

TEST(AccountLedgerTest, ClosePeriodSummarizesAndAdvancesMonth) {
    FakeClock clock(CivilDate{2024, 12, 5});
    AccountLedger ledger(clock.Fn());
    LedgerError error;
    auto request = BuildRequest(AccountType::kAsset, "1000");
    request.opening_balance = Amount::FromInteger(1000);
    ASSERT_TRUE(ledger.Create(request, &error));
    ASSERT_TRUE(ledger.PostDebit(Posting(500), nullptr, &error));
    ASSERT_TRUE(ledger.PostCredit(Posting(200), nullptr, &error));

    PeriodSummary summary;
    ASSERT_TRUE(ledger.ClosePeriod(2024, 12, "bob", &summary, &error)) << error.message;
    EXPECT_EQ(summary.total_debits, Amount::FromInteger(500));
    EXPECT_EQ(summary.total_credits, Amount::FromInteger(200));
    EXPECT_EQ(summary.closing_balance, Amount::FromInteger(1300));
    EXPECT_EQ(summary.entry_count, 2);
    EXPECT_EQ(ledger.current_period_year(), 2025);
    EXPECT_EQ(ledger.current_period_month(), 1);

    EXPECT_FALSE(ledger.ClosePeriod(2024, 12, "bob", nullptr, &error));
    EXPECT_EQ(error.message, "Period 2024-12 is already closed");
    EXPECT_FALSE(ledger.ClosePeriod(2025, 2, "bob", nullptr, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kInvalidState);
    EXPECT_FALSE(ledger.ClosePeriod(2025, 13, "bob", nullptr, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kInvalidArgument);
}

TEST(AccountLedgerTest, HistoricalQueriesUseEntryTimestamps) {
    FakeClock clock(CivilDate{2024, 3, 1});
    AccountLedger ledger(clock.Fn());
    LedgerError error;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error));
    ASSERT_TRUE(ledger.PostDebit(Posting(100, "inv-1"), nullptr, &error));
    const auto first_ts = clock.now();
    clock.Advance(kNanosPerDay);
    ASSERT_TRUE(ledger.PostDebit(Posting(50, "inv-2"), nullptr, &error));
    clock.Advance(kNanosPerDay);
    ASSERT_TRUE(ledger.PostCredit(Posting(30, "inv-1"), nullptr, &error));

    EXPECT_EQ(ledger.GetBalanceAt(first_ts), Amount::FromInteger(100));
    EXPECT_EQ(ledger.GetBalanceAt(clock.now()), Amount::FromInteger(120));
    EXPECT_EQ(ledger.GetEntriesInRange(first_ts, first_ts + kNanosPerDay).size(), 2U);
    EXPECT_EQ(ledger.GetEntriesByReference("inv-1").size(), 2U);
    EXPECT_TRUE(ledger.GetEntriesByReference("").empty());

    const auto recent = ledger.GetRecentEntries(2);
    ASSERT_EQ(recent.size(), 2U);
    EXPECT_EQ(recent.front().type, LedgerEntryType::kCredit);

    const auto summary = ledger.GetSummary();
    EXPECT_EQ(summary.entry_count, 3U);
    EXPECT_EQ(summary.total_debits, Amount::FromInteger(150));
    EXPECT_EQ(summary.total_credits, Amount::FromInteger(30));
    EXPECT_EQ(summary.last_entry_ns, clock.now());
}

TEST(AccountLedgerTest, UpdateDetailsChangesOnlyGivenFields) {
    AccountLedger ledger;
    LedgerError error;
    auto request = BuildRequest(AccountType::kAsset, "1000");
    request.description = "Cash drawer";
    ASSERT_TRUE(ledger.Create(request, &error));

    AccountDetailsUpdate update;
    update.name = "Front register";
    ASSERT_TRUE(ledger.UpdateDetails(update, &error));
    EXPECT_EQ(ledger.name(), "Front register");
    EXPECT_EQ(ledger.description(), "Cash drawer");

    EXPECT_FALSE(ledger.UpdateDetails(AccountDetailsUpdate{}, &error));
    update.name = "";
    EXPECT_FALSE(ledger.UpdateDetails(update, &error));
    EXPECT_EQ(error.message, "Account name must not be empty");
}

TEST(AccountLedgerTest, FailedSinkAppendLeavesStateUntouched) {
    RecordingSink sink;
    AccountLedger ledger({}, &sink);
    LedgerError error;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error));
    ASSERT_EQ(sink.events.size(), 1U);

    sink.fail_appends = true;
    EXPECT_FALSE(ledger.PostDebit(Posting(10), nullptr, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kInvalidState);
    EXPECT_TRUE(ledger.entries().empty());
    EXPECT_EQ(ledger.GetBalance(), Amount());
}

TEST(AccountLedgerTest, ApplyingRecordedEventsRebuildsLedger) {
    RecordingSink sink;
    AccountLedger ledger({}, &sink);
    LedgerError error;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error));
    PostingResult debit;
    ASSERT_TRUE(ledger.PostDebit(Posting(500), &debit, &error));
    ASSERT_TRUE(ledger.PostCredit(Posting(300), nullptr, &error));
    ASSERT_TRUE(ledger.ReverseEntry(debit.entry_id, "", "bob", nullptr, &error));

    AccountLedger replayed;
    for (const auto& event : sink.events) {
        ASSERT_TRUE(replayed.Apply(event, &error)) << error.message;
    }
    EXPECT_EQ(replayed.GetBalance(), ledger.GetBalance());
    EXPECT_EQ(replayed.entries().size(), ledger.entries().size());
    EXPECT_EQ(replayed.GetEntry(debit.entry_id)->status, LedgerEntryStatus::kReversed);
}

TEST(AccountLedgerTest, ApplyRejectsMismatchedBalanceAfter) {
    RecordingSink sink;
    AccountLedger ledger({}, &sink);
    LedgerError error;
    ASSERT_TRUE(ledger.Create(BuildRequest(AccountType::kAsset, "1000"), &error));
    ASSERT_TRUE(ledger.PostDebit(Posting(40), nullptr, &error));

    AccountLedger replayed;
    ASSERT_TRUE(replayed.Apply(sink.events[0], &error));
    auto tampered = sink.events[1];
    tampered.entry.balance_after = Amount::FromInteger(41);
    EXPECT_FALSE(replayed.Apply(tampered, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kInvalidState);
    EXPECT_TRUE(replayed.entries().empty());
}

}  // namespace ledger_core
