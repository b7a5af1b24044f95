#include "ledger_core/core/circuit_breaker.h"

#include <algorithm>
#include <utility>

#include "ledger_core/common/timestamp.h"
#include "ledger_core/core/structured_log.h"
#include "ledger_core/monitoring/metric_registry.h"

namespace ledger_core {

namespace {

constexpr EpochNanos kNanosPerMilli = 1'000'000;

std::shared_ptr<MonitoringCounter> CircuitOpenedCounter() {
    static const auto counter = MetricRegistry::Instance().BuildCounter(
        "ledger_core_circuit_opened_total", "Total payment processor circuit openings");
    return counter;
}

}  // namespace

std::string ToString(CircuitState state) {
    switch (state) {
        case CircuitState::kClosed:
            return "closed";
        case CircuitState::kOpen:
            return "open";
        case CircuitState::kHalfOpen:
            return "half_open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(std::string key, CircuitBreakerConfig config)
    : key_(std::move(key)), config_(config) {
    config_.failure_threshold = std::max(1, config_.failure_threshold);
    config_.open_duration_ms = std::max<std::int64_t>(1, config_.open_duration_ms);
}

bool CircuitBreaker::IsOpen(EpochNanos now_ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CircuitState::kOpen) {
        return false;
    }
    if (now_ns >= open_until_ns_) {
        state_ = CircuitState::kHalfOpen;
        return false;
    }
    return true;
}

void CircuitBreaker::RecordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_count_ = 0;
    state_ = CircuitState::kClosed;
    open_until_ns_ = 0;
}

bool CircuitBreaker::RecordFailure(EpochNanos now_ns,
                                   std::optional<std::int64_t> open_duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failure_count_;
    last_failure_ns_ = now_ns;
    if (state_ == CircuitState::kHalfOpen) {
        OpenLocked(now_ns, open_duration_ms);
        return true;
    }
    if (state_ == CircuitState::kOpen) {
        OpenLocked(now_ns, open_duration_ms);
        return false;
    }
    if (failure_count_ >= config_.failure_threshold) {
        OpenLocked(now_ns, open_duration_ms);
        return true;
    }
    return false;
}

CircuitBreakerSnapshot CircuitBreaker::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerSnapshot snapshot;
    snapshot.key = key_;
    snapshot.failure_count = failure_count_;
    snapshot.state = state_;
    snapshot.last_failure_ns = last_failure_ns_;
    snapshot.open_until_ns = open_until_ns_;
    return snapshot;
}

void CircuitBreaker::OpenLocked(EpochNanos now_ns, std::optional<std::int64_t> open_duration_ms) {
    const auto duration_ms =
        std::max<std::int64_t>(1, open_duration_ms.value_or(config_.open_duration_ms));
    state_ = CircuitState::kOpen;
    open_until_ns_ = now_ns + duration_ms * kNanosPerMilli;
}

CircuitBreakerRegistry& CircuitBreakerRegistry::Instance() {
    static CircuitBreakerRegistry instance;
    return instance;
}

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerConfig config, NowFn now)
    : now_(std::move(now)), config_(config) {}

void CircuitBreakerRegistry::Configure(const CircuitBreakerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

bool CircuitBreakerRegistry::IsCircuitOpen(const std::string& processor_key) {
    const auto breaker = Get(processor_key);
    if (breaker == nullptr) {
        return false;
    }
    return breaker->IsOpen(ResolveNow(now_));
}

void CircuitBreakerRegistry::RecordSuccess(const std::string& processor_key) {
    const auto breaker = Get(processor_key);
    if (breaker != nullptr) {
        breaker->RecordSuccess();
    }
}

void CircuitBreakerRegistry::RecordFailure(const std::string& processor_key,
                                           std::optional<std::int64_t> open_duration_ms) {
    const auto breaker = GetOrCreate(processor_key);
    if (!breaker->RecordFailure(ResolveNow(now_), open_duration_ms)) {
        return;
    }
    CircuitOpenedCounter()->Increment();
    const auto snapshot = breaker->Snapshot();
    EmitStructuredLog(nullptr,
                      "circuit_breaker",
                      "warn",
                      "circuit_opened",
                      {{"processor", processor_key},
                       {"failure_count", std::to_string(snapshot.failure_count)},
                       {"open_until_ns", std::to_string(snapshot.open_until_ns)}});
}

std::optional<CircuitBreakerSnapshot> CircuitBreakerRegistry::GetCircuitState(
    const std::string& processor_key) const {
    const auto breaker = Get(processor_key);
    if (breaker == nullptr) {
        return std::nullopt;
    }
    return breaker->Snapshot();
}

void CircuitBreakerRegistry::ResetCircuit(const std::string& processor_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    breakers_.erase(processor_key);
}

void CircuitBreakerRegistry::ResetAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    breakers_.clear();
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::GetOrCreate(
    const std::string& processor_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = breakers_.find(processor_key); it != breakers_.end()) {
        return it->second;
    }
    auto breaker = std::make_shared<CircuitBreaker>(processor_key, config_);
    breakers_.emplace(processor_key, breaker);
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::Get(const std::string& processor_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = breakers_.find(processor_key);
    if (it == breakers_.end()) {
        return {};
    }
    return it->second;
}

}  // namespace ledger_core
