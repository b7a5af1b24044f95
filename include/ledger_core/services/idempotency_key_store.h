#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

#include "ledger_core/contracts/types.h"
#include "ledger_core/core/ledger_config.h"

namespace ledger_core {

struct IdempotencyStoreConfig {
    std::int64_t default_ttl_seconds{86'400};
};

struct IdempotencyKeyRecord {
    std::string key;
    std::string operation;
    std::string entity_id;
    EpochNanos created_at_ns{0};
    EpochNanos expires_at_ns{0};
    bool used{false};
    EpochNanos used_at_ns{0};
    bool successful{false};
    std::optional<std::string> result_hash;
};

struct IdempotencyCheckResult {
    bool exists{false};
    bool already_used{false};
    // Set only once the key was used.
    std::optional<bool> previous_success;
    std::optional<std::string> previous_result_hash;
};

// Operation keys of one organization. Shared between command handlers and the expiry
// sweep, so every call takes the internal lock. Expired keys behave as unknown until
// CleanupExpiredKeys() removes them.
class IdempotencyKeyStore {
public:
    static constexpr const char* kKeyPrefix = "idem_";

    explicit IdempotencyKeyStore(std::string organization_id = {},
                                 IdempotencyStoreConfig config = {},
                                 NowFn now = {},
                                 const LedgerRuntimeConfig* runtime = nullptr);

    // Returns "idem_{operation}_{32 hex}"; the key is recorded unused. Returns an empty
    // string when the TTL is not positive or the expiry is not representable.
    std::string GenerateKey(const std::string& operation,
                            const std::string& entity_id,
                            std::optional<std::int64_t> ttl_seconds = std::nullopt,
                            LedgerError* error = nullptr);
    IdempotencyCheckResult CheckKey(const std::string& key) const;
    // Upsert: an unknown key is created directly in the used state.
    bool MarkKeyUsed(const std::string& key,
                     bool successful,
                     const std::optional<std::string>& result_hash,
                     LedgerError* error);
    // False only when the key already recorded a successful outcome (or is empty).
    bool TryAcquire(const std::string& key,
                    const std::string& operation,
                    const std::string& entity_id,
                    LedgerError* error = nullptr);
    std::size_t CleanupExpiredKeys();

    // Live keys only, like CheckKey().
    std::optional<IdempotencyKeyRecord> GetKeyStatus(const std::string& key) const;
    std::size_t Size() const;
    const std::string& organization_id() const { return organization_id_; }

    // FNV-1a of the serialized result as 16 lowercase hex chars; "null" when absent.
    static std::string ComputeResultHash(const std::optional<std::string>& result);

private:
    bool IsLive(const IdempotencyKeyRecord& record, EpochNanos now) const;
    static bool ComputeExpiry(EpochNanos now,
                              std::int64_t ttl_seconds,
                              EpochNanos* expires_at,
                              LedgerError* error);
    std::string RandomSuffix();

    const std::string organization_id_;
    const IdempotencyStoreConfig config_;
    NowFn now_;
    const LedgerRuntimeConfig* runtime_{nullptr};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, IdempotencyKeyRecord> keys_;
    std::mt19937_64 rng_;
};

}  // namespace ledger_core
