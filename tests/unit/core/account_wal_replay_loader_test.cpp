#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "ledger_core/core/account_wal_replay_loader.h"
#include "ledger_core/core/local_wal_account_event_sink.h"

namespace ledger_core {

namespace {

std::filesystem::path NewTempWalPath(const std::string& tag) {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           ("ledger_core_" + tag + "_" + std::to_string(now) + ".wal");
}

AccountEvent CreatedEvent(const std::string& organization_id) {
    AccountEvent event;
    event.kind = AccountEventKind::kCreated;
    event.organization_id = organization_id;
    event.account_id = "acct-1000";
    event.account_code = "1000";
    event.name = "Cash";
    event.account_type = AccountType::kAsset;
    event.ts_ns = 1;
    return event;
}

AccountEvent DebitEvent(const std::string& entry_id, std::int64_t whole, std::int64_t after) {
    AccountEvent event;
    event.kind = AccountEventKind::kEntryAppended;
    event.organization_id = "org-1";
    event.account_id = "acct-1000";
    event.ts_ns = 2;
    event.entry.entry_id = entry_id;
    event.entry.type = LedgerEntryType::kDebit;
    event.entry.amount = Amount::FromInteger(whole);
    event.entry.balance_effect = Amount::FromInteger(whole);
    event.entry.balance_after = Amount::FromInteger(after);
    return event;
}

PostingRequest Posting(std::int64_t whole) {
    PostingRequest request;
    request.amount = Amount::FromInteger(whole);
    request.description = "Service";
    request.performed_by = "alice";
    return request;
}

}  // namespace

TEST(AccountWalReplayLoaderTest, RebuildsBalancesAndStatusFromSinkOutput) {
    const auto wal_path = NewTempWalPath("account_replay");
    std::string reversed_id;
    {
        LocalWalAccountEventSink sink(wal_path.string());
        AccountBook book("org-1", {}, &sink);
        CreateAccountRequest request;
        request.account_id = "acct-1000";
        request.account_code = "1000";
        request.name = "Cash";
        request.account_type = AccountType::kAsset;
        LedgerError error;
        ASSERT_TRUE(book.CreateAccount(request, &error)) << error.message;

        PostingResult result;
        ASSERT_TRUE(book.Post("1000", BalanceSide::kDebit, Posting(500), &result, &error));
        ASSERT_TRUE(book.Post("1000", BalanceSide::kCredit, Posting(200), &result, &error));
        reversed_id = result.entry_id;
        AccountLedger* ledger = book.FindByCode("1000");
        ASSERT_NE(ledger, nullptr);
        ASSERT_TRUE(ledger->ReverseEntry(reversed_id, "void ticket", "bob", &result, &error))
            << error.message;
        ASSERT_TRUE(ledger->Deactivate("bob", &error)) << error.message;
        ASSERT_TRUE(sink.Flush());
    }

    AccountBook replayed("org-1");
    const AccountWalReplayLoader loader;
    const auto stats = loader.Replay(wal_path.string(), &replayed);
    EXPECT_TRUE(stats.file_opened);
    EXPECT_EQ(stats.lines_total, 5U);
    EXPECT_EQ(stats.events_loaded, 5U);
    EXPECT_EQ(stats.parse_errors, 0U);
    EXPECT_EQ(stats.state_rejected, 0U);

    const AccountLedger* ledger = replayed.FindByCode("1000");
    ASSERT_NE(ledger, nullptr);
    EXPECT_EQ(ledger->GetBalance(), Amount::FromInteger(500));
    EXPECT_EQ(ledger->entries().size(), 3U);
    EXPECT_FALSE(ledger->is_active());
    const auto reversed = ledger->GetEntry(reversed_id);
    ASSERT_TRUE(reversed.has_value());
    EXPECT_EQ(reversed->status, LedgerEntryStatus::kReversed);
    EXPECT_EQ(ledger->entries().back().reversed_entry_id, reversed_id);
    std::filesystem::remove(wal_path);
}

TEST(AccountWalReplayLoaderTest, ClassifiesRejectedIgnoredAndMalformedLines) {
    const auto wal_path = NewTempWalPath("account_replay_mixed");
    {
        std::ofstream out(wal_path);
        out << LocalWalAccountEventSink::FormatEventLine(0, CreatedEvent("org-1"));
        out << LocalWalAccountEventSink::FormatEventLine(1, DebitEvent("e-1", 100, 999));
        out << LocalWalAccountEventSink::FormatEventLine(2, DebitEvent("e-2", 100, 100));
        out << LocalWalAccountEventSink::FormatEventLine(3, CreatedEvent("org-2"));
        out << "{\"seq\":4,\"kind\":\"account_merged\",\"organization_id\":\"org-1\","
               "\"account_id\":\"acct-1000\",\"ts_ns\":5}\n";
        out << "\n";
        out << "not a wal line\n";
    }

    AccountBook book("org-1");
    const AccountWalReplayLoader loader;
    const auto stats = loader.Replay(wal_path.string(), &book);
    EXPECT_EQ(stats.lines_total, 6U);
    EXPECT_EQ(stats.events_loaded, 3U);
    EXPECT_EQ(stats.state_rejected, 1U);
    EXPECT_EQ(stats.ignored_lines, 2U);
    EXPECT_EQ(stats.parse_errors, 1U);

    Amount balance;
    LedgerError error;
    ASSERT_TRUE(book.GetBalance("1000", &balance, &error)) << error.message;
    EXPECT_EQ(balance, Amount::FromInteger(100));
    std::filesystem::remove(wal_path);
}

TEST(AccountWalReplayLoaderTest, ParseEventLineFlagsUnknownKinds) {
    AccountEvent event;
    bool known_kind = true;
    ASSERT_TRUE(AccountWalReplayLoader::ParseEventLine(
        "{\"seq\":1,\"kind\":\"future_kind\",\"organization_id\":\"org-1\","
        "\"account_id\":\"a\",\"ts_ns\":3}",
        &event,
        &known_kind));
    EXPECT_FALSE(known_kind);

    EXPECT_FALSE(AccountWalReplayLoader::ParseEventLine(
        "{\"seq\":1,\"kind\":\"entry_appended\",\"organization_id\":\"org-1\","
        "\"account_id\":\"a\",\"ts_ns\":3,\"entry_id\":\"e\",\"entry_type\":\"debit\","
        "\"amount\":\"1.23456\",\"balance_effect\":\"1\",\"balance_after\":\"1\"}",
        &event,
        &known_kind));
}

TEST(AccountWalReplayLoaderTest, ParseEventLineDecodesEscapedControlCharacters) {
    auto original = DebitEvent("e-1", 5, 5);
    original.entry.description = std::string("tab\there\x01\x1f\"q\"\\", 14);
    const auto line = LocalWalAccountEventSink::FormatEventLine(1, original);

    AccountEvent parsed;
    bool known_kind = false;
    ASSERT_TRUE(AccountWalReplayLoader::ParseEventLine(line, &parsed, &known_kind));
    EXPECT_TRUE(known_kind);
    EXPECT_EQ(parsed.entry.description, original.entry.description);

    ASSERT_TRUE(AccountWalReplayLoader::ParseEventLine(
        "{\"seq\":1,\"kind\":\"account_created\",\"organization_id\":\"org-1\","
        "\"account_id\":\"a\",\"ts_ns\":3,\"account_code\":\"1000\","
        "\"name\":\"Caf\\u00e9\",\"account_type\":\"asset\"}",
        &parsed,
        &known_kind));
    EXPECT_EQ(parsed.name, "Caf\xc3\xa9");
}

TEST(AccountWalReplayLoaderTest, MissingFileReportsNotOpened) {
    AccountBook book("org-1");
    const AccountWalReplayLoader loader;
    const auto stats = loader.Replay("/nonexistent/ledger_core/accounts.wal", &book);
    EXPECT_FALSE(stats.file_opened);
    EXPECT_EQ(stats.lines_total, 0U);
    EXPECT_EQ(book.AccountCount(), 0U);
}

}  // namespace ledger_core
