#include "ledger_core/services/ledger_service_host.h"

#include <cstddef>
#include <string>
#include <utility>

#include "ledger_core/core/structured_log.h"

namespace ledger_core {

namespace {

CircuitBreakerRegistry* ConfiguredRegistry(CircuitBreakerRegistry* breakers,
                                           const CircuitBreakerConfig& config) {
    CircuitBreakerRegistry* registry =
        breakers != nullptr ? breakers : &CircuitBreakerRegistry::Instance();
    registry->Configure(config);
    return registry;
}

}  // namespace

LedgerServiceHost::LedgerServiceHost(const LedgerFileConfig& config,
                                     CircuitBreakerRegistry* breakers,
                                     NowFn now)
    : config_(config),
      breakers_(ConfiguredRegistry(breakers, config_.breaker)),
      executor_(static_cast<std::size_t>(config_.runtime.executor_worker_threads)),
      book_(config_.organization_id, now, nullptr, &config_.runtime),
      periods_(config_.organization_id, now, &config_.runtime),
      keys_(config_.organization_id,
            IdempotencyStoreConfig{config_.idempotency_default_ttl_seconds},
            now,
            &config_.runtime),
      retry_policy_(config_.retry),
      commands_(config_.organization_id,
                keys_,
                periods_,
                book_,
                nullptr,
                executor_,
                std::move(now),
                &config_.runtime) {}

LedgerServiceHost::~LedgerServiceHost() { Stop(); }

void LedgerServiceHost::Start() {
    executor_.Start();
    EmitStructuredLog(&config_.runtime, "ledger_service_host", "info", "services_started",
                      {{"organization_id", config_.organization_id},
                       {"worker_threads", std::to_string(config_.runtime.executor_worker_threads)},
                       {"idempotency_ttl_seconds",
                        std::to_string(config_.idempotency_default_ttl_seconds)},
                       {"breaker_failure_threshold",
                        std::to_string(config_.breaker.failure_threshold)},
                       {"retry_max_attempts", std::to_string(config_.retry.max_retries)}});
}

void LedgerServiceHost::Stop() { executor_.Stop(); }

}  // namespace ledger_core
