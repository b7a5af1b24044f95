#include "ledger_core/services/payment_retry_policy.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace ledger_core {

namespace {

// Card-decline family across Stripe-style and Adyen-style codes, normalized.
constexpr const char* kTerminalPatterns[] = {
    "declined",
    "insufficient_funds",
    "not_enough_balance",
    "expired_card",
    "incorrect_cvc",
    "incorrect_number",
    "invalid_card",
    "invalid_cvc",
    "invalid_expiry",
    "invalid_number",
    "invalid_pin",
    "invalid_amount",
    "pin_tries_exceeded",
    "stolen_card",
    "lost_card",
    "fraud",
    "blocked",
    "refused",
    "restricted_card",
    "revocation_of_auth",
    "shopper_cancelled",
    "card_not_supported",
    "currency_not_supported",
    "duplicate_transaction",
    "postal_code_invalid",
};

constexpr const char* kRetryablePatterns[] = {
    "processing_error",
    "rate_limit",
    "too_many_requests",
    "api_connection_error",
    "api_error",
    "connection",
    "timeout",
    "timed_out",
    "service_unavailable",
    "temporarily_unavailable",
    "acquirer_error",
    "issuer_unavailable",
};

template <std::size_t N>
bool MatchesAny(const std::string& normalized, const char* const (&patterns)[N]) {
    if (normalized.empty()) {
        return false;
    }
    for (const char* pattern : patterns) {
        if (normalized.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

PaymentRetryPolicy::PaymentRetryPolicy(RetryPolicyConfig config,
                                       std::function<double()> jitter_source)
    : config_(config), jitter_source_(std::move(jitter_source)), rng_(std::random_device{}()) {
    config_.max_retries = std::max(0, config_.max_retries);
    config_.base_delay_ms = std::max(1, config_.base_delay_ms);
    config_.max_backoff_exponent = std::clamp(config_.max_backoff_exponent, 0, 30);
    config_.jitter_ratio = std::clamp(config_.jitter_ratio, 0.0, 1.0);
}

std::chrono::milliseconds PaymentRetryPolicy::GetRetryDelay(int attempt) const {
    const int exponent = std::min(std::max(attempt, 0), config_.max_backoff_exponent);
    const double base_ms =
        static_cast<double>(config_.base_delay_ms) * std::ldexp(1.0, exponent);
    const double jitter = std::clamp(NextJitter(), -1.0, 1.0) * config_.jitter_ratio;
    const auto delay_ms = static_cast<std::int64_t>(std::llround(base_ms * (1.0 + jitter)));
    return std::chrono::milliseconds(std::max<std::int64_t>(0, delay_ms));
}

bool PaymentRetryPolicy::ShouldRetry(int attempt, const std::string& error_code) const {
    if (attempt >= config_.max_retries) {
        return false;
    }
    return !IsTerminalError(error_code);
}

EpochNanos PaymentRetryPolicy::GetNextRetryTime(int attempt, EpochNanos now_ns) const {
    const auto delay = std::chrono::duration_cast<std::chrono::nanoseconds>(GetRetryDelay(attempt));
    return now_ns + delay.count();
}

bool PaymentRetryPolicy::IsTerminalError(const std::string& error_code) {
    return MatchesAny(NormalizeErrorCode(error_code), kTerminalPatterns);
}

bool PaymentRetryPolicy::IsRetryableError(const std::string& error_code) {
    const auto normalized = NormalizeErrorCode(error_code);
    if (MatchesAny(normalized, kTerminalPatterns)) {
        return false;
    }
    return MatchesAny(normalized, kRetryablePatterns);
}

std::string PaymentRetryPolicy::NormalizeErrorCode(const std::string& error_code) {
    std::string normalized;
    normalized.reserve(error_code.size());
    for (const char ch : error_code) {
        if (ch == ' ' || ch == '-') {
            normalized.push_back('_');
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    const auto first = normalized.find_first_not_of('_');
    if (first == std::string::npos) {
        return "";
    }
    const auto last = normalized.find_last_not_of('_');
    return normalized.substr(first, last - first + 1);
}

double PaymentRetryPolicy::NextJitter() const {
    if (jitter_source_) {
        return jitter_source_();
    }
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<double> distribution(-1.0, 1.0);
    return distribution(rng_);
}

}  // namespace ledger_core
