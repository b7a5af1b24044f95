#include "ledger_core/core/ledger_entry_parquet_writer.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#if LEDGER_CORE_ENABLE_ARROW_PARQUET
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#endif

namespace ledger_core {
namespace {

std::filesystem::path UniqueExportPath(const std::string& stem) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           (stem + "_" + std::to_string(stamp) + ".parquet");
}

LedgerEntryExportRow CashRow(const std::string& entry_id, std::int64_t whole) {
    LedgerEntryExportRow row;
    row.organization_id = "org-1";
    row.account_id = "acct-1000";
    row.account_code = "1000";
    row.entry.entry_id = entry_id;
    row.entry.type = LedgerEntryType::kDebit;
    row.entry.amount = Amount::FromInteger(whole);
    row.entry.balance_effect = Amount::FromInteger(whole);
    row.entry.balance_after = Amount::FromInteger(whole);
    row.entry.ts_ns = 1'710'460'800'000'000'000LL;
    row.entry.period_year = 2024;
    row.entry.period_month = 3;
    row.entry.description = "Dinner service";
    row.entry.performed_by = "alice";
    return row;
}

#if LEDGER_CORE_ENABLE_ARROW_PARQUET
template <typename ReaderPtr>
auto OpenParquetReaderCompat(const std::shared_ptr<arrow::io::RandomAccessFile>& input,
                             ReaderPtr* reader, int)
    -> decltype(parquet::arrow::OpenFile(input, arrow::default_memory_pool()), bool()) {
    auto reader_result = parquet::arrow::OpenFile(input, arrow::default_memory_pool());
    if (!reader_result.ok()) {
        return false;
    }
    *reader = std::move(reader_result).ValueOrDie();
    return *reader != nullptr;
}

template <typename ReaderPtr>
auto OpenParquetReaderCompat(const std::shared_ptr<arrow::io::RandomAccessFile>& input,
                             ReaderPtr* reader, long)
    -> decltype(parquet::arrow::OpenFile(input, arrow::default_memory_pool(), reader), bool()) {
    auto reader_status = parquet::arrow::OpenFile(input, arrow::default_memory_pool(), reader);
    return reader_status.ok() && *reader != nullptr;
}
#endif

TEST(LedgerEntryParquetWriterTest, AppendRequiresOpenWriterAndIdentifiers) {
    LedgerEntryParquetWriter writer;
    std::string error;
    EXPECT_FALSE(writer.Append(CashRow("e-1", 10), &error));
    EXPECT_EQ(error, "ledger entry parquet writer is not open");
    EXPECT_TRUE(writer.Close(&error));
    EXPECT_FALSE(writer.Open("", &error));
    EXPECT_EQ(error, "ledger entry parquet output path is empty");
}

TEST(LedgerEntryParquetWriterTest, OpenFailsWhenArrowWriterDisabled) {
#if LEDGER_CORE_ENABLE_ARROW_PARQUET
    GTEST_SKIP() << "Arrow parquet writer is enabled in this build";
#else
    LedgerEntryParquetWriter writer;
    std::string error;
    const std::filesystem::path path = UniqueExportPath("ledger_entries_disabled");
    EXPECT_FALSE(writer.Open(path.string(), &error));
    EXPECT_NE(error.find("LEDGER_CORE_ENABLE_ARROW_PARQUET=ON"), std::string::npos);
    EXPECT_FALSE(writer.is_open());
    EXPECT_FALSE(std::filesystem::exists(path));
#endif
}

TEST(LedgerEntryParquetWriterTest, OpenFailsWhenOutputAlreadyExists) {
#if !LEDGER_CORE_ENABLE_ARROW_PARQUET
    GTEST_SKIP() << "Arrow parquet writer is disabled in this build";
#else
    const std::filesystem::path path = UniqueExportPath("ledger_entries_existing");
    std::ofstream existing(path);
    existing << "occupied";
    existing.close();

    LedgerEntryParquetWriter writer;
    std::string error;
    EXPECT_FALSE(writer.Open(path.string(), &error));
    EXPECT_NE(error.find("already exists"), std::string::npos);

    std::error_code ec;
    std::filesystem::remove(path, ec);
#endif
}

TEST(LedgerEntryParquetWriterTest, WritesEntriesWithScaledAmountsWhenEnabled) {
#if !LEDGER_CORE_ENABLE_ARROW_PARQUET
    GTEST_SKIP() << "Arrow parquet writer is disabled in this build";
#else
    const std::filesystem::path path = UniqueExportPath("ledger_entries_enabled");
    LedgerEntryParquetWriter writer;
    std::string error;
    ASSERT_TRUE(writer.Open(path.string(), &error)) << error;

    ASSERT_TRUE(writer.Append(CashRow("e-1", 125), &error)) << error;
    auto reversal = CashRow("e-2", 125);
    reversal.entry.type = LedgerEntryType::kReversal;
    reversal.entry.balance_effect = Amount::FromInteger(-125);
    reversal.entry.balance_after = Amount();
    reversal.entry.reference_type = "Reversal";
    reversal.entry.reversed_entry_id = "e-1";
    ASSERT_TRUE(writer.Append(reversal, &error)) << error;

    EXPECT_EQ(writer.rows_written(), 2);
    ASSERT_TRUE(writer.Close(&error)) << error;
    ASSERT_TRUE(std::filesystem::exists(path));

    auto input_result = arrow::io::ReadableFile::Open(path.string());
    ASSERT_TRUE(input_result.ok()) << input_result.status().ToString();
    std::shared_ptr<arrow::io::ReadableFile> input = input_result.ValueOrDie();

    std::unique_ptr<parquet::arrow::FileReader> parquet_reader;
    ASSERT_TRUE(OpenParquetReaderCompat(input, &parquet_reader, 0));
    std::shared_ptr<arrow::Table> table;
    ASSERT_TRUE(parquet_reader->ReadTable(&table).ok());
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->num_rows(), 2);
    EXPECT_EQ(table->num_columns(), 19);

    const auto amount_units = std::static_pointer_cast<arrow::Int64Array>(
        table->GetColumnByName("amount_units")->chunk(0));
    const auto effect_units = std::static_pointer_cast<arrow::Int64Array>(
        table->GetColumnByName("balance_effect_units")->chunk(0));
    const auto reversed = std::static_pointer_cast<arrow::StringArray>(
        table->GetColumnByName("reversed_entry_id")->chunk(0));
    const auto posted_on = std::static_pointer_cast<arrow::StringArray>(
        table->GetColumnByName("posted_on")->chunk(0));

    EXPECT_EQ(amount_units->Value(0), 1'250'000);
    EXPECT_EQ(effect_units->Value(1), -1'250'000);
    EXPECT_TRUE(reversed->IsNull(0));
    EXPECT_EQ(reversed->GetString(1), "e-1");
    EXPECT_EQ(posted_on->GetString(0), "2024-03-15");

    std::error_code ec;
    std::filesystem::remove(path, ec);
#endif
}

}  // namespace
}  // namespace ledger_core
