#include "ledger_core/services/idempotency_key_store.h"

#include <algorithm>
#include <cstdio>
#include <limits>
#include <utility>

#include "ledger_core/common/timestamp.h"
#include "ledger_core/core/structured_log.h"
#include "ledger_core/monitoring/metric_registry.h"

namespace ledger_core {

namespace {

constexpr const char* kApp = "idempotency_key_store";

std::shared_ptr<MonitoringCounter> RefusedReplayCounter() {
    static const auto counter = MetricRegistry::Instance().BuildCounter(
        "ledger_core_idempotency_refused_total",
        "Operations refused because their key already succeeded");
    return counter;
}

std::string ToHex64(std::uint64_t value) {
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(value));
    return buffer;
}

}  // namespace

IdempotencyKeyStore::IdempotencyKeyStore(std::string organization_id,
                                         IdempotencyStoreConfig config,
                                         NowFn now,
                                         const LedgerRuntimeConfig* runtime)
    : organization_id_(std::move(organization_id)),
      config_(config),
      now_(std::move(now)),
      runtime_(runtime),
      rng_(std::random_device{}()) {}

std::string IdempotencyKeyStore::GenerateKey(const std::string& operation,
                                             const std::string& entity_id,
                                             std::optional<std::int64_t> ttl_seconds,
                                             LedgerError* error) {
    const EpochNanos now = ResolveNow(now_);
    EpochNanos expires_at = 0;
    if (!ComputeExpiry(now, ttl_seconds.value_or(config_.default_ttl_seconds), &expires_at,
                       error)) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string key;
    do {
        key = std::string(kKeyPrefix) + operation + "_" + RandomSuffix();
    } while (keys_.count(key) > 0);

    IdempotencyKeyRecord record;
    record.key = key;
    record.operation = operation;
    record.entity_id = entity_id;
    record.created_at_ns = now;
    record.expires_at_ns = expires_at;
    keys_.emplace(key, std::move(record));
    return key;
}

IdempotencyCheckResult IdempotencyKeyStore::CheckKey(const std::string& key) const {
    const EpochNanos now = ResolveNow(now_);
    IdempotencyCheckResult result;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = keys_.find(key);
    if (it == keys_.end() || !IsLive(it->second, now)) {
        return result;
    }
    result.exists = true;
    result.already_used = it->second.used;
    if (it->second.used) {
        result.previous_success = it->second.successful;
        result.previous_result_hash = it->second.result_hash;
    }
    return result;
}

bool IdempotencyKeyStore::MarkKeyUsed(const std::string& key,
                                      bool successful,
                                      const std::optional<std::string>& result_hash,
                                      LedgerError* error) {
    if (key.empty()) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "Idempotency key is required");
    }
    const EpochNanos now = ResolveNow(now_);
    EpochNanos expires_at = 0;
    if (!ComputeExpiry(now, config_.default_ttl_seconds, &expires_at, error)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(key);
    if (it == keys_.end() || !IsLive(it->second, now)) {
        IdempotencyKeyRecord record;
        record.key = key;
        record.created_at_ns = now;
        record.expires_at_ns = expires_at;
        it = keys_.insert_or_assign(key, std::move(record)).first;
    }
    auto& record = it->second;
    record.used = true;
    record.used_at_ns = now;
    record.successful = successful;
    record.result_hash = result_hash;
    return true;
}

bool IdempotencyKeyStore::TryAcquire(const std::string& key,
                                     const std::string& operation,
                                     const std::string& entity_id,
                                     LedgerError* error) {
    if (key.empty()) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "Idempotency key is required");
    }
    const EpochNanos now = ResolveNow(now_);
    EpochNanos expires_at = 0;
    if (!ComputeExpiry(now, config_.default_ttl_seconds, &expires_at, error)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = keys_.find(key);
    if (it != keys_.end() && IsLive(it->second, now)) {
        if (it->second.used && it->second.successful) {
            RefusedReplayCounter()->Increment();
            EmitStructuredLog(runtime_, kApp, "warn", "replay_refused",
                              {{"organization_id", organization_id_},
                               {"key", key},
                               {"operation", operation}});
            return FailWith(error,
                            LedgerErrorCode::kInvalidState,
                            "Idempotency key already used successfully");
        }
        return true;
    }

    IdempotencyKeyRecord record;
    record.key = key;
    record.operation = operation;
    record.entity_id = entity_id;
    record.created_at_ns = now;
    record.expires_at_ns = expires_at;
    keys_.insert_or_assign(key, std::move(record));
    return true;
}

std::size_t IdempotencyKeyStore::CleanupExpiredKeys() {
    const EpochNanos now = ResolveNow(now_);
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = keys_.begin(); it != keys_.end();) {
            if (!IsLive(it->second, now)) {
                it = keys_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        EmitStructuredLog(runtime_, kApp, "debug", "expired_keys_removed",
                          {{"organization_id", organization_id_},
                           {"removed", std::to_string(removed)}});
    }
    return removed;
}

std::optional<IdempotencyKeyRecord> IdempotencyKeyStore::GetKeyStatus(const std::string& key) const {
    const EpochNanos now = ResolveNow(now_);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = keys_.find(key);
    if (it == keys_.end() || !IsLive(it->second, now)) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t IdempotencyKeyStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

std::string IdempotencyKeyStore::ComputeResultHash(const std::optional<std::string>& result) {
    if (!result.has_value()) {
        return "null";
    }
    std::uint64_t hash = 1469598103934665603ULL;
    for (const unsigned char ch : *result) {
        hash ^= ch;
        hash *= 1099511628211ULL;
    }
    return ToHex64(hash);
}

bool IdempotencyKeyStore::IsLive(const IdempotencyKeyRecord& record, EpochNanos now) const {
    return record.expires_at_ns >= now;
}

bool IdempotencyKeyStore::ComputeExpiry(EpochNanos now,
                                        std::int64_t ttl_seconds,
                                        EpochNanos* expires_at,
                                        LedgerError* error) {
    if (ttl_seconds <= 0) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Idempotency key TTL must be positive: " + std::to_string(ttl_seconds));
    }
    const EpochNanos headroom =
        std::numeric_limits<EpochNanos>::max() - std::max<EpochNanos>(now, 0);
    if (ttl_seconds > headroom / kNanosPerSecond) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Idempotency key TTL is out of range: " + std::to_string(ttl_seconds));
    }
    *expires_at = now + ttl_seconds * kNanosPerSecond;
    return true;
}

std::string IdempotencyKeyStore::RandomSuffix() {
    return ToHex64(rng_()) + ToHex64(rng_());
}

}  // namespace ledger_core
