#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "ledger_core/core/local_wal_account_event_sink.h"

namespace ledger_core {

namespace {

std::filesystem::path NewTempWalPath(const std::string& tag) {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           ("ledger_core_" + tag + "_" + std::to_string(now) + ".wal");
}

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

AccountEvent EntryEvent(const std::string& entry_id) {
    AccountEvent event;
    event.kind = AccountEventKind::kEntryAppended;
    event.organization_id = "org-1";
    event.account_id = "acct-1000";
    event.ts_ns = 42;
    event.performed_by = "alice";
    event.entry.entry_id = entry_id;
    event.entry.type = LedgerEntryType::kDebit;
    event.entry.amount = Amount::FromInteger(25);
    event.entry.balance_effect = Amount::FromInteger(25);
    event.entry.balance_after = Amount::FromInteger(25);
    event.entry.description = "Table \"7\" tab";
    event.entry.period_year = 2024;
    event.entry.period_month = 3;
    return event;
}

}  // namespace

TEST(LocalWalAccountEventSinkTest, FormatsEntryEventAsSingleJsonLine) {
    const auto line = LocalWalAccountEventSink::FormatEventLine(7, EntryEvent("e-1"));
    EXPECT_EQ(line.rfind("{\"seq\":7,\"kind\":\"entry_appended\",", 0), 0U);
    EXPECT_NE(line.find("\"organization_id\":\"org-1\""), std::string::npos);
    EXPECT_NE(line.find("\"entry_type\":\"debit\""), std::string::npos);
    EXPECT_NE(line.find("\"amount\":\"25.00\""), std::string::npos);
    EXPECT_NE(line.find("\"balance_after\":\"25.00\""), std::string::npos);
    EXPECT_NE(line.find("\"description\":\"Table \\\"7\\\" tab\""), std::string::npos);
    EXPECT_NE(line.find("\"period_month\":3"), std::string::npos);
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);
}

TEST(LocalWalAccountEventSinkTest, EscapesEveryControlCharacter) {
    EXPECT_EQ(LocalWalAccountEventSink::EscapeJsonString(std::string("a\x01" "b\x1f\bc")),
              "a\\u0001b\\u001f\\u0008c");
    EXPECT_EQ(LocalWalAccountEventSink::EscapeJsonString(std::string("\0\x0c", 2)),
              "\\u0000\\u000c");
    EXPECT_EQ(LocalWalAccountEventSink::EscapeJsonString("x\ny\tz"), "x\\ny\\tz");

    auto event = EntryEvent("e-1");
    event.entry.description = std::string("bell\x07here", 9);
    const auto line = LocalWalAccountEventSink::FormatEventLine(1, event);
    EXPECT_NE(line.find("\"description\":\"bell\\u0007here\""), std::string::npos);
    for (std::size_t i = 0; i + 1 < line.size(); ++i) {
        EXPECT_GE(static_cast<unsigned char>(line[i]), 0x20U) << "raw control byte at " << i;
    }
}

TEST(LocalWalAccountEventSinkTest, FormatsCreatedEventWithAccountFields) {
    AccountEvent event;
    event.kind = AccountEventKind::kCreated;
    event.organization_id = "org-1";
    event.account_id = "acct-3200";
    event.account_code = "3200";
    event.name = "Retained Earnings";
    event.account_type = AccountType::kEquity;
    event.is_system_account = true;

    const auto line = LocalWalAccountEventSink::FormatEventLine(0, event);
    EXPECT_NE(line.find("\"kind\":\"account_created\""), std::string::npos);
    EXPECT_NE(line.find("\"account_code\":\"3200\""), std::string::npos);
    EXPECT_NE(line.find("\"account_type\":\"" + ToString(AccountType::kEquity) + "\""),
              std::string::npos);
    EXPECT_NE(line.find("\"is_system_account\":true"), std::string::npos);
    EXPECT_EQ(line.find("entry_id"), std::string::npos);
}

TEST(LocalWalAccountEventSinkTest, SequenceContinuesAcrossReopen) {
    const auto wal_path = NewTempWalPath("sink_seq");
    {
        LocalWalAccountEventSink sink(wal_path.string());
        ASSERT_TRUE(sink.IsOpen());
        EXPECT_EQ(sink.next_seq(), 0U);
        ASSERT_TRUE(sink.Append(EntryEvent("e-1")));
        ASSERT_TRUE(sink.Append(EntryEvent("e-2")));
        EXPECT_EQ(sink.next_seq(), 2U);
    }
    {
        LocalWalAccountEventSink sink(wal_path.string());
        EXPECT_EQ(sink.next_seq(), 2U);
        ASSERT_TRUE(sink.Append(EntryEvent("e-3")));
        ASSERT_TRUE(sink.Flush());
    }

    const auto lines = ReadLines(wal_path);
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[2].rfind("{\"seq\":2,", 0), 0U);
    EXPECT_NE(lines[2].find("\"entry_id\":\"e-3\""), std::string::npos);
    std::filesystem::remove(wal_path);
}

TEST(LocalWalAccountEventSinkTest, UnwritablePathRejectsAppends) {
    LocalWalAccountEventSink sink("/nonexistent-dir/ledger_core/accounts.wal");
    EXPECT_FALSE(sink.IsOpen());
    EXPECT_FALSE(sink.Append(EntryEvent("e-1")));
    EXPECT_FALSE(sink.Flush());
}

}  // namespace ledger_core
