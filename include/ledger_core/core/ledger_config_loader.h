#pragma once

#include <string>

#include "ledger_core/core/circuit_breaker.h"
#include "ledger_core/core/ledger_config.h"
#include "ledger_core/services/payment_retry_policy.h"

namespace ledger_core {

struct LedgerFileConfig {
    LedgerRuntimeConfig runtime;
    std::string organization_id;
    int idempotency_default_ttl_seconds{86'400};
    RetryPolicyConfig retry;
    CircuitBreakerConfig breaker;
};

// Replaces ${NAME} with the environment value (empty when unset).
std::string ResolveEnvVars(const std::string& value);
std::string GetEnvOrDefault(const char* key, const std::string& fallback);

class LedgerConfigLoader {
public:
    static constexpr const char* kConfigPathEnv = "LEDGER_CORE_CONFIG_PATH";

    static bool LoadFromYaml(const std::string& path, LedgerFileConfig* config, std::string* error);
    // Uses LEDGER_CORE_CONFIG_PATH when set, otherwise returns defaults.
    static bool LoadFromEnvironment(LedgerFileConfig* config, std::string* error);
};

}  // namespace ledger_core
