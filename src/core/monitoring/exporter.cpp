#include "ledger_core/monitoring/exporter.h"

#include <chrono>
#include <exception>

#include "ledger_core/core/structured_log.h"
#include "ledger_core/monitoring/metric_registry.h"

namespace ledger_core {

MetricsExporter::MetricsExporter(const LedgerRuntimeConfig* runtime) : runtime_(runtime) {}

MetricsExporter::~MetricsExporter() {
    Stop();
}

bool MetricsExporter::Start(int port, std::string* error) {
    if (running_.load()) {
        return true;
    }
    if (port <= 0 || port > 65535) {
        if (error != nullptr) {
            *error = "invalid metrics port: " + std::to_string(port);
        }
        return false;
    }
#if !LEDGER_CORE_WITH_METRICS
    if (error != nullptr) {
        *error = "metrics support not enabled at build time";
    }
    return false;
#else
    stop_requested_.store(false);
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        start_error_.clear();
    }

    worker_ = std::thread([this, port]() {
        try {
            auto exposer = std::make_unique<prometheus::Exposer>(
                "0.0.0.0:" + std::to_string(port));
            exposer->RegisterCollectable(MetricRegistry::Instance().GetPrometheusRegistry());
            exposer_ = std::move(exposer);
        } catch (const std::exception& ex) {
            std::lock_guard<std::mutex> lock(error_mutex_);
            start_error_ = ex.what();
            return;
        }
        running_.store(true);
        while (!stop_requested_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        exposer_.reset();
        running_.store(false);
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (running_.load()) {
            EmitStructuredLog(runtime_, "metrics_exporter", "info", "started",
                              {{"port", std::to_string(port)}});
            if (error != nullptr) {
                error->clear();
            }
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    stop_requested_.store(true);
    if (worker_.joinable()) {
        worker_.join();
    }
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        reason = start_error_.empty() ? "metrics exporter failed to start" : start_error_;
    }
    EmitStructuredLog(runtime_, "metrics_exporter", "error", "start_failed",
                      {{"port", std::to_string(port)}, {"reason", reason}});
    if (error != nullptr) {
        *error = reason;
    }
    return false;
#endif
}

void MetricsExporter::Stop() {
    stop_requested_.store(true);
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false);
}

bool MetricsExporter::IsRunning() const {
    return running_.load();
}

}  // namespace ledger_core
