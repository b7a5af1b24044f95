#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "ledger_core/apps/cli_support.h"
#include "ledger_core/core/account_wal_replay_loader.h"
#include "ledger_core/core/ledger_config_loader.h"
#include "ledger_core/core/ledger_entry_parquet_writer.h"
#include "ledger_core/core/local_wal_account_event_sink.h"
#include "ledger_core/core/structured_log.h"
#include "ledger_core/monitoring/exporter.h"
#include "ledger_core/services/account_book.h"
#include "ledger_core/services/ledger_service_host.h"

namespace {

using ledger_core::AccountBook;
using ledger_core::AccountWalReplayStats;

std::atomic<bool> g_stop_requested{false};

void OnSignal(int /*signal*/) {
    g_stop_requested.store(true);
}

std::string EscapeJson(const std::string& text) {
    return ledger_core::LocalWalAccountEventSink::EscapeJsonString(text);
}

std::string RenderText(const std::string& wal_path,
                       const AccountWalReplayStats& stats,
                       const AccountBook& book) {
    std::ostringstream out;
    out << "WAL replay completed path=" << wal_path << " org=" << book.organization_id()
        << " lines=" << stats.lines_total << " events=" << stats.events_loaded
        << " ignored=" << stats.ignored_lines << " parse_errors=" << stats.parse_errors
        << " state_rejected=" << stats.state_rejected << '\n';
    for (const auto& code : book.AccountCodes()) {
        const auto* ledger = book.FindByCode(code);
        if (ledger == nullptr) {
            continue;
        }
        out << "account code=" << code << " id=" << ledger->account_id()
            << " type=" << ledger_core::ToString(ledger->account_type())
            << " balance=" << ledger->GetBalance().ToString() << ' ' << ledger->currency()
            << " entries=" << ledger->entries().size()
            << " active=" << (ledger->is_active() ? "true" : "false") << '\n';
    }
    return out.str();
}

std::string RenderJson(const std::string& wal_path,
                       const AccountWalReplayStats& stats,
                       const AccountBook& book) {
    std::ostringstream out;
    out << "{\n"
        << "  \"wal_path\": \"" << EscapeJson(wal_path) << "\",\n"
        << "  \"organization_id\": \"" << EscapeJson(book.organization_id()) << "\",\n"
        << "  \"lines_total\": " << stats.lines_total << ",\n"
        << "  \"events_loaded\": " << stats.events_loaded << ",\n"
        << "  \"ignored_lines\": " << stats.ignored_lines << ",\n"
        << "  \"parse_errors\": " << stats.parse_errors << ",\n"
        << "  \"state_rejected\": " << stats.state_rejected << ",\n"
        << "  \"accounts\": [";
    bool first = true;
    for (const auto& code : book.AccountCodes()) {
        const auto* ledger = book.FindByCode(code);
        if (ledger == nullptr) {
            continue;
        }
        out << (first ? "\n" : ",\n");
        first = false;
        out << "    {\"account_code\": \"" << EscapeJson(code) << "\", \"account_id\": \""
            << EscapeJson(ledger->account_id()) << "\", \"type\": \""
            << ledger_core::ToString(ledger->account_type()) << "\", \"balance\": \""
            << ledger->GetBalance().ToString() << "\", \"currency\": \""
            << EscapeJson(ledger->currency()) << "\", \"entries\": " << ledger->entries().size()
            << ", \"active\": " << (ledger->is_active() ? "true" : "false") << "}";
    }
    out << (first ? "]\n" : "\n  ]\n") << "}\n";
    return out.str();
}

bool ExportEntries(const AccountBook& book, const std::string& path, std::string* error) {
    ledger_core::LedgerEntryParquetWriter writer;
    if (!writer.Open(path, error)) {
        return false;
    }
    for (const auto& code : book.AccountCodes()) {
        const auto* ledger = book.FindByCode(code);
        if (ledger == nullptr) {
            continue;
        }
        for (const auto& entry : ledger->entries()) {
            ledger_core::LedgerEntryExportRow row;
            row.organization_id = book.organization_id();
            row.account_id = ledger->account_id();
            row.account_code = code;
            row.currency = ledger->currency();
            row.entry = entry;
            if (!writer.Append(row, error)) {
                return false;
            }
        }
    }
    return writer.Close(error);
}

}  // namespace

int main(int argc, char** argv) {
    using namespace ledger_core;

    const auto args = apps::ParseArgs(argc, argv);
    if (apps::HasArg(args, "help")) {
        std::cout << "usage: ledger_wal_replay --wal <path> [--config <path>] [--org <id>]"
                     " [--json] [--output <path>] [--export-parquet <path>]"
                     " [--serve-metrics]\n";
        return 0;
    }

    LedgerFileConfig config;
    std::string error;
    const auto config_path = apps::GetArg(args, "config");
    const bool loaded = config_path.empty()
                            ? LedgerConfigLoader::LoadFromEnvironment(&config, &error)
                            : LedgerConfigLoader::LoadFromYaml(config_path, &config, &error);
    if (!loaded) {
        std::cerr << "ledger_wal_replay: config error: " << error << '\n';
        return 2;
    }

    const auto wal_path = apps::GetArg(args, "wal", config.runtime.wal_path);
    if (wal_path.empty()) {
        std::cerr << "ledger_wal_replay: --wal is required (or set wal_path in config)\n";
        return 2;
    }
    config.organization_id = apps::GetArg(args, "org", config.organization_id);

    const bool serve_metrics = apps::HasArg(args, "serve-metrics");
    if (serve_metrics && config.runtime.metrics_port <= 0) {
        std::cerr << "ledger_wal_replay: --serve-metrics requires metrics_port in config\n";
        return 2;
    }

    LedgerServiceHost host(config);
    host.Start();
    AccountBook& book = host.book();
    AccountWalReplayLoader loader(&host.config().runtime);
    const auto stats = loader.Replay(wal_path, &book);
    if (!stats.file_opened) {
        std::cerr << "ledger_wal_replay: unable to open wal: " << wal_path << '\n';
        return 1;
    }

    const auto parquet_path = apps::GetArg(args, "export-parquet");
    if (!parquet_path.empty() && !ExportEntries(book, parquet_path, &error)) {
        std::cerr << "ledger_wal_replay: parquet export failed: " << error << '\n';
        return 1;
    }

    const auto report = apps::HasArg(args, "json") ? RenderJson(wal_path, stats, book)
                                                   : RenderText(wal_path, stats, book);
    const auto output_path = apps::GetArg(args, "output");
    if (!output_path.empty()) {
        if (!apps::WriteTextFile(output_path, report, &error)) {
            std::cerr << "ledger_wal_replay: " << error << '\n';
            return 1;
        }
    } else {
        std::cout << report << std::flush;
    }

    if (serve_metrics) {
        MetricsExporter exporter(&host.config().runtime);
        if (!exporter.Start(config.runtime.metrics_port, &error)) {
            std::cerr << "ledger_wal_replay: metrics exporter failed: " << error << '\n';
            return 1;
        }
        std::signal(SIGINT, OnSignal);
        std::signal(SIGTERM, OnSignal);
        EmitStructuredLog(&host.config().runtime, "ledger_wal_replay", "info", "metrics_serving",
                          {{"port", std::to_string(config.runtime.metrics_port)}});
        while (!g_stop_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        exporter.Stop();
    }
    return stats.parse_errors == 0 && stats.state_rejected == 0 ? 0 : 3;
}
