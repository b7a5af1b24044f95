#include "ledger_core/core/ledger_entry_parquet_writer.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

#include "ledger_core/common/timestamp.h"

#if LEDGER_CORE_ENABLE_ARROW_PARQUET
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#endif

namespace ledger_core {
namespace {

constexpr const char* kDisabledMessage =
    "ledger entry parquet export requires LEDGER_CORE_ENABLE_ARROW_PARQUET=ON";

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

#if LEDGER_CORE_ENABLE_ARROW_PARQUET
bool ExpectArrowStatus(const arrow::Status& status, const std::string& prefix, std::string* error) {
    if (status.ok()) {
        return true;
    }
    return SetError(prefix + ": " + status.ToString(), error);
}

template <typename BuilderT>
bool FinishArray(BuilderT* builder, const std::string& name, std::shared_ptr<arrow::Array>* out,
                 std::string* error) {
    return ExpectArrowStatus(builder->Finish(out),
                             "failed to finalize ledger entry field '" + name + "'", error);
}

bool AppendOptionalString(const std::string& value,
                          arrow::StringBuilder* builder,
                          const std::string& field_name,
                          std::string* error) {
    if (value.empty()) {
        return ExpectArrowStatus(builder->AppendNull(), "failed appending null for " + field_name,
                                 error);
    }
    return ExpectArrowStatus(builder->Append(value), "failed appending " + field_name, error);
}
#endif

}  // namespace

bool LedgerEntryParquetWriter::Open(const std::string& output_path, std::string* error) {
    if (is_open_) {
        return SetError("ledger entry parquet writer is already open", error);
    }
    if (output_path.empty()) {
        return SetError("ledger entry parquet output path is empty", error);
    }

#if !LEDGER_CORE_ENABLE_ARROW_PARQUET
    return SetError(kDisabledMessage, error);
#else
    try {
        const std::filesystem::path path(output_path);
        if (std::filesystem::exists(path)) {
            return SetError("ledger entry parquet output already exists: " + path.string(), error);
        }
        if (!path.parent_path().empty()) {
            std::filesystem::create_directories(path.parent_path());
        }
    } catch (const std::exception& ex) {
        return SetError(std::string("failed to prepare ledger entry parquet path: ") + ex.what(),
                        error);
    }

    output_path_ = output_path;
    rows_written_ = 0;
    rows_.clear();
    is_open_ = true;
    return true;
#endif
}

bool LedgerEntryParquetWriter::Append(const LedgerEntryExportRow& row, std::string* error) {
    if (!is_open_) {
        return SetError("ledger entry parquet writer is not open", error);
    }
    if (row.account_code.empty()) {
        return SetError("ledger entry row account_code is empty", error);
    }
    if (row.entry.entry_id.empty()) {
        return SetError("ledger entry row entry_id is empty", error);
    }

#if !LEDGER_CORE_ENABLE_ARROW_PARQUET
    return SetError(kDisabledMessage, error);
#else
    rows_.push_back(row);
    ++rows_written_;
    return true;
#endif
}

bool LedgerEntryParquetWriter::Close(std::string* error) {
    if (!is_open_) {
        return true;
    }

#if !LEDGER_CORE_ENABLE_ARROW_PARQUET
    return SetError(kDisabledMessage, error);
#else
    arrow::StringBuilder organization_id_builder;
    arrow::StringBuilder account_id_builder;
    arrow::StringBuilder account_code_builder;
    arrow::StringBuilder currency_builder;
    arrow::StringBuilder entry_id_builder;
    arrow::StringBuilder entry_type_builder;
    arrow::StringBuilder status_builder;
    arrow::Int64Builder amount_units_builder;
    arrow::Int64Builder balance_effect_units_builder;
    arrow::Int64Builder balance_after_units_builder;
    arrow::Int64Builder ts_ns_builder;
    arrow::StringBuilder posted_on_builder;
    arrow::Int32Builder period_year_builder;
    arrow::Int32Builder period_month_builder;
    arrow::StringBuilder description_builder;
    arrow::StringBuilder performed_by_builder;
    arrow::StringBuilder reference_type_builder;
    arrow::StringBuilder reference_id_builder;
    arrow::StringBuilder reversed_entry_id_builder;

    for (const auto& row : rows_) {
        const auto& entry = row.entry;
        if (!ExpectArrowStatus(organization_id_builder.Append(row.organization_id),
                               "failed appending organization_id", error) ||
            !ExpectArrowStatus(account_id_builder.Append(row.account_id),
                               "failed appending account_id", error) ||
            !ExpectArrowStatus(account_code_builder.Append(row.account_code),
                               "failed appending account_code", error) ||
            !ExpectArrowStatus(currency_builder.Append(row.currency.empty() ? "USD" : row.currency),
                               "failed appending currency", error) ||
            !ExpectArrowStatus(entry_id_builder.Append(entry.entry_id),
                               "failed appending entry_id", error) ||
            !ExpectArrowStatus(entry_type_builder.Append(ToString(entry.type)),
                               "failed appending entry_type", error) ||
            !ExpectArrowStatus(status_builder.Append(ToString(entry.status)),
                               "failed appending status", error) ||
            !ExpectArrowStatus(amount_units_builder.Append(entry.amount.units()),
                               "failed appending amount_units", error) ||
            !ExpectArrowStatus(balance_effect_units_builder.Append(entry.balance_effect.units()),
                               "failed appending balance_effect_units", error) ||
            !ExpectArrowStatus(balance_after_units_builder.Append(entry.balance_after.units()),
                               "failed appending balance_after_units", error) ||
            !ExpectArrowStatus(ts_ns_builder.Append(entry.ts_ns), "failed appending ts_ns",
                               error) ||
            !ExpectArrowStatus(posted_on_builder.Append(ToCivilDate(entry.ts_ns).ToString()),
                               "failed appending posted_on", error) ||
            !ExpectArrowStatus(period_year_builder.Append(entry.period_year),
                               "failed appending period_year", error) ||
            !ExpectArrowStatus(period_month_builder.Append(entry.period_month),
                               "failed appending period_month", error) ||
            !ExpectArrowStatus(description_builder.Append(entry.description),
                               "failed appending description", error) ||
            !ExpectArrowStatus(performed_by_builder.Append(entry.performed_by),
                               "failed appending performed_by", error) ||
            !AppendOptionalString(entry.reference_type, &reference_type_builder,
                                  "reference_type", error) ||
            !AppendOptionalString(entry.reference_id, &reference_id_builder, "reference_id",
                                  error) ||
            !AppendOptionalString(entry.reversed_entry_id, &reversed_entry_id_builder,
                                  "reversed_entry_id", error)) {
            return false;
        }
    }

    std::shared_ptr<arrow::Array> organization_id_array;
    std::shared_ptr<arrow::Array> account_id_array;
    std::shared_ptr<arrow::Array> account_code_array;
    std::shared_ptr<arrow::Array> currency_array;
    std::shared_ptr<arrow::Array> entry_id_array;
    std::shared_ptr<arrow::Array> entry_type_array;
    std::shared_ptr<arrow::Array> status_array;
    std::shared_ptr<arrow::Array> amount_units_array;
    std::shared_ptr<arrow::Array> balance_effect_units_array;
    std::shared_ptr<arrow::Array> balance_after_units_array;
    std::shared_ptr<arrow::Array> ts_ns_array;
    std::shared_ptr<arrow::Array> posted_on_array;
    std::shared_ptr<arrow::Array> period_year_array;
    std::shared_ptr<arrow::Array> period_month_array;
    std::shared_ptr<arrow::Array> description_array;
    std::shared_ptr<arrow::Array> performed_by_array;
    std::shared_ptr<arrow::Array> reference_type_array;
    std::shared_ptr<arrow::Array> reference_id_array;
    std::shared_ptr<arrow::Array> reversed_entry_id_array;

    if (!FinishArray(&organization_id_builder, "organization_id", &organization_id_array, error) ||
        !FinishArray(&account_id_builder, "account_id", &account_id_array, error) ||
        !FinishArray(&account_code_builder, "account_code", &account_code_array, error) ||
        !FinishArray(&currency_builder, "currency", &currency_array, error) ||
        !FinishArray(&entry_id_builder, "entry_id", &entry_id_array, error) ||
        !FinishArray(&entry_type_builder, "entry_type", &entry_type_array, error) ||
        !FinishArray(&status_builder, "status", &status_array, error) ||
        !FinishArray(&amount_units_builder, "amount_units", &amount_units_array, error) ||
        !FinishArray(&balance_effect_units_builder, "balance_effect_units",
                     &balance_effect_units_array, error) ||
        !FinishArray(&balance_after_units_builder, "balance_after_units",
                     &balance_after_units_array, error) ||
        !FinishArray(&ts_ns_builder, "ts_ns", &ts_ns_array, error) ||
        !FinishArray(&posted_on_builder, "posted_on", &posted_on_array, error) ||
        !FinishArray(&period_year_builder, "period_year", &period_year_array, error) ||
        !FinishArray(&period_month_builder, "period_month", &period_month_array, error) ||
        !FinishArray(&description_builder, "description", &description_array, error) ||
        !FinishArray(&performed_by_builder, "performed_by", &performed_by_array, error) ||
        !FinishArray(&reference_type_builder, "reference_type", &reference_type_array, error) ||
        !FinishArray(&reference_id_builder, "reference_id", &reference_id_array, error) ||
        !FinishArray(&reversed_entry_id_builder, "reversed_entry_id", &reversed_entry_id_array,
                     error)) {
        return false;
    }

    auto schema = arrow::schema({
        arrow::field("organization_id", arrow::utf8(), false),
        arrow::field("account_id", arrow::utf8(), false),
        arrow::field("account_code", arrow::utf8(), false),
        arrow::field("currency", arrow::utf8(), false),
        arrow::field("entry_id", arrow::utf8(), false),
        arrow::field("entry_type", arrow::utf8(), false),
        arrow::field("status", arrow::utf8(), false),
        arrow::field("amount_units", arrow::int64(), false),
        arrow::field("balance_effect_units", arrow::int64(), false),
        arrow::field("balance_after_units", arrow::int64(), false),
        arrow::field("ts_ns", arrow::int64(), false),
        arrow::field("posted_on", arrow::utf8(), false),
        arrow::field("period_year", arrow::int32(), false),
        arrow::field("period_month", arrow::int32(), false),
        arrow::field("description", arrow::utf8(), false),
        arrow::field("performed_by", arrow::utf8(), false),
        arrow::field("reference_type", arrow::utf8(), true),
        arrow::field("reference_id", arrow::utf8(), true),
        arrow::field("reversed_entry_id", arrow::utf8(), true),
    });

    auto table = arrow::Table::Make(schema,
                                    {organization_id_array,
                                     account_id_array,
                                     account_code_array,
                                     currency_array,
                                     entry_id_array,
                                     entry_type_array,
                                     status_array,
                                     amount_units_array,
                                     balance_effect_units_array,
                                     balance_after_units_array,
                                     ts_ns_array,
                                     posted_on_array,
                                     period_year_array,
                                     period_month_array,
                                     description_array,
                                     performed_by_array,
                                     reference_type_array,
                                     reference_id_array,
                                     reversed_entry_id_array});

    const std::filesystem::path output_path(output_path_);
    const std::filesystem::path tmp_path(output_path_ + ".tmp");

    auto file_result = arrow::io::FileOutputStream::Open(tmp_path.string());
    if (!file_result.ok()) {
        return SetError("failed to open ledger entry parquet output: " +
                            file_result.status().ToString(),
                        error);
    }
    std::shared_ptr<arrow::io::FileOutputStream> output_stream = file_result.ValueOrDie();

    parquet::WriterProperties::Builder writer_props_builder;
    writer_props_builder.compression(parquet::Compression::SNAPPY);
    std::shared_ptr<parquet::WriterProperties> writer_props = writer_props_builder.build();
    parquet::ArrowWriterProperties::Builder arrow_props_builder;
    std::shared_ptr<parquet::ArrowWriterProperties> arrow_props = arrow_props_builder.build();

    const auto write_status = parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), output_stream,
        std::max<std::int64_t>(1, rows_written_), writer_props, arrow_props);
    if (!write_status.ok()) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError("failed to write ledger entry parquet: " + write_status.ToString(), error);
    }

    const auto close_status = output_stream->Close();
    if (!close_status.ok()) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError("failed to close ledger entry parquet file: " + close_status.ToString(),
                        error);
    }

    try {
        std::error_code ec;
        std::filesystem::remove(output_path, ec);
        std::filesystem::rename(tmp_path, output_path);
    } catch (const std::exception& ex) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError(std::string("failed to finalize ledger entry parquet: ") + ex.what(),
                        error);
    }

    rows_.clear();
    is_open_ = false;
    return true;
#endif
}

}  // namespace ledger_core
