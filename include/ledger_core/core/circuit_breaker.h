#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "ledger_core/contracts/types.h"

namespace ledger_core {

struct CircuitBreakerConfig {
    // The circuit opens on this consecutive failure.
    int failure_threshold{6};
    std::int64_t open_duration_ms{60'000};
};

enum class CircuitState {
    kClosed = 0,
    kOpen = 1,
    kHalfOpen = 2,
};

std::string ToString(CircuitState state);

struct CircuitBreakerSnapshot {
    std::string key;
    int failure_count{0};
    CircuitState state{CircuitState::kClosed};
    EpochNanos last_failure_ns{0};
    EpochNanos open_until_ns{0};
};

class CircuitBreaker {
public:
    explicit CircuitBreaker(std::string key, CircuitBreakerConfig config = {});

    // Moves Open -> HalfOpen once the open window has elapsed.
    bool IsOpen(EpochNanos now_ns);
    void RecordSuccess();
    // Returns true when this failure opened (or re-opened) the circuit.
    bool RecordFailure(EpochNanos now_ns, std::optional<std::int64_t> open_duration_ms);
    CircuitBreakerSnapshot Snapshot() const;

private:
    void OpenLocked(EpochNanos now_ns, std::optional<std::int64_t> open_duration_ms);

    const std::string key_;
    CircuitBreakerConfig config_;
    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::kClosed};
    int failure_count_{0};
    EpochNanos last_failure_ns_{0};
    EpochNanos open_until_ns_{0};
};

// Process-wide per-processor breakers. Tests construct their own registry.
class CircuitBreakerRegistry {
public:
    static CircuitBreakerRegistry& Instance();

    explicit CircuitBreakerRegistry(CircuitBreakerConfig config = {}, NowFn now = {});

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    // Applies to breakers created after the call.
    void Configure(const CircuitBreakerConfig& config);

    bool IsCircuitOpen(const std::string& processor_key);
    void RecordSuccess(const std::string& processor_key);
    void RecordFailure(const std::string& processor_key,
                       std::optional<std::int64_t> open_duration_ms = std::nullopt);
    std::optional<CircuitBreakerSnapshot> GetCircuitState(const std::string& processor_key) const;
    void ResetCircuit(const std::string& processor_key);
    void ResetAll();

private:
    std::shared_ptr<CircuitBreaker> GetOrCreate(const std::string& processor_key);
    std::shared_ptr<CircuitBreaker> Get(const std::string& processor_key) const;

    NowFn now_;
    mutable std::mutex mutex_;
    CircuitBreakerConfig config_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

}  // namespace ledger_core
