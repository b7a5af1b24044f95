#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>

#include "ledger_core/contracts/types.h"

namespace ledger_core {

struct RetryPolicyConfig {
    int max_retries{5};
    int base_delay_ms{1'000};
    // Delay base is base_delay_ms * 2^min(attempt, max_backoff_exponent).
    int max_backoff_exponent{4};
    double jitter_ratio{0.25};
};

// Retry decisions for calls to external payment processors. Breaker state lives in
// CircuitBreakerRegistry.
class PaymentRetryPolicy {
public:
    // jitter_source returns a value in [-1, 1]; empty means uniform random.
    explicit PaymentRetryPolicy(RetryPolicyConfig config = {},
                                std::function<double()> jitter_source = {});

    std::chrono::milliseconds GetRetryDelay(int attempt) const;
    bool ShouldRetry(int attempt, const std::string& error_code) const;
    EpochNanos GetNextRetryTime(int attempt, EpochNanos now_ns) const;

    const RetryPolicyConfig& config() const { return config_; }

    static bool IsTerminalError(const std::string& error_code);
    static bool IsRetryableError(const std::string& error_code);
    // Lowercases and maps spaces and dashes to underscores.
    static std::string NormalizeErrorCode(const std::string& error_code);

private:
    double NextJitter() const;

    RetryPolicyConfig config_;
    std::function<double()> jitter_source_;
    mutable std::mutex rng_mutex_;
    mutable std::mt19937_64 rng_;
};

}  // namespace ledger_core
