#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ledger_core/contracts/account_event.h"

namespace ledger_core {

struct LedgerEntryExportRow {
    std::string organization_id;
    std::string account_id;
    std::string account_code;
    std::string currency;
    LedgerEntry entry;
};

// Buffers ledger entries and writes them as one Parquet file on Close(). Amount columns
// hold scaled units (Amount::kScale fractional digits). The file is written to
// "<path>.tmp" and renamed into place.
class LedgerEntryParquetWriter {
public:
    LedgerEntryParquetWriter() = default;
    ~LedgerEntryParquetWriter() = default;

    bool Open(const std::string& output_path, std::string* error);
    bool Append(const LedgerEntryExportRow& row, std::string* error);
    bool Close(std::string* error);

    std::int64_t rows_written() const noexcept { return rows_written_; }
    const std::string& output_path() const noexcept { return output_path_; }
    bool is_open() const noexcept { return is_open_; }

private:
    bool is_open_{false};
    std::int64_t rows_written_{0};
    std::string output_path_;

#if LEDGER_CORE_ENABLE_ARROW_PARQUET
    std::vector<LedgerEntryExportRow> rows_;
#endif
};

}  // namespace ledger_core
