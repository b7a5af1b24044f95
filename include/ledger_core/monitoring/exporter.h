#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "ledger_core/core/ledger_config.h"

#if LEDGER_CORE_WITH_METRICS
#include <prometheus/exposer.h>
#endif

namespace ledger_core {

// Serves MetricRegistry on http://<bind>:<port>/metrics from a background thread.
class MetricsExporter {
public:
    explicit MetricsExporter(const LedgerRuntimeConfig* runtime = nullptr);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    bool Start(int port, std::string* error);
    void Stop();
    bool IsRunning() const;

private:
    const LedgerRuntimeConfig* runtime_{nullptr};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
    std::thread worker_;
    mutable std::mutex error_mutex_;
    std::string start_error_;

#if LEDGER_CORE_WITH_METRICS
    std::unique_ptr<prometheus::Exposer> exposer_;
#endif
};

}  // namespace ledger_core
