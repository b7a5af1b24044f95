#pragma once

#include "ledger_core/common/timestamp.h"
#include "ledger_core/core/circuit_breaker.h"
#include "ledger_core/core/entity_strand_executor.h"
#include "ledger_core/core/ledger_config_loader.h"
#include "ledger_core/services/account_book.h"
#include "ledger_core/services/accounting_period_lifecycle.h"
#include "ledger_core/services/financial_command_service.h"
#include "ledger_core/services/idempotency_key_store.h"
#include "ledger_core/services/payment_retry_policy.h"

namespace ledger_core {

// Services of one organization wired from a loaded LedgerFileConfig. The breaker
// registry defaults to the process-wide one and is reconfigured on construction.
class LedgerServiceHost {
public:
    explicit LedgerServiceHost(const LedgerFileConfig& config,
                               CircuitBreakerRegistry* breakers = nullptr,
                               NowFn now = {});
    ~LedgerServiceHost();

    LedgerServiceHost(const LedgerServiceHost&) = delete;
    LedgerServiceHost& operator=(const LedgerServiceHost&) = delete;

    void Start();
    void Stop();

    const LedgerFileConfig& config() const { return config_; }
    AccountBook& book() { return book_; }
    AccountingPeriodLifecycle& periods() { return periods_; }
    IdempotencyKeyStore& keys() { return keys_; }
    EntityStrandExecutor& executor() { return executor_; }
    const PaymentRetryPolicy& retry_policy() const { return retry_policy_; }
    CircuitBreakerRegistry& breakers() { return *breakers_; }
    FinancialCommandService& commands() { return commands_; }

private:
    const LedgerFileConfig config_;
    CircuitBreakerRegistry* breakers_{nullptr};
    EntityStrandExecutor executor_;
    AccountBook book_;
    AccountingPeriodLifecycle periods_;
    IdempotencyKeyStore keys_;
    PaymentRetryPolicy retry_policy_;
    FinancialCommandService commands_;
};

}  // namespace ledger_core
