#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "ledger_core/core/entity_strand_executor.h"
#include "ledger_core/core/ledger_config.h"
#include "ledger_core/interfaces/chart_of_accounts.h"
#include "ledger_core/services/account_book.h"
#include "ledger_core/services/accounting_period_lifecycle.h"
#include "ledger_core/services/idempotency_key_store.h"
#include "ledger_core/services/journal_entry_workflow.h"

namespace ledger_core {

struct JournalPostingOutcome {
    std::string journal_entry_id;
    JournalEntryStatus status{JournalEntryStatus::kDraft};
    std::size_t posted_lines{0};
    std::string result_hash;
};

// Command entry point of one organization: idempotency gate, fiscal-period gate and
// journal fan-out, with account and period commands serialized on executor strands.
class FinancialCommandService {
public:
    using PeriodCommand = std::function<bool(AccountingPeriodLifecycle&, LedgerError*)>;

    static constexpr const char* kPostJournalOperation = "post_journal_entry";

    FinancialCommandService(std::string organization_id,
                            IdempotencyKeyStore& keys,
                            AccountingPeriodLifecycle& periods,
                            AccountBook& book,
                            const IChartOfAccounts* chart,
                            EntityStrandExecutor& executor,
                            NowFn now = {},
                            const LedgerRuntimeConfig* runtime = nullptr);

    // Creates (or resumes), approves and posts the journal entry at most once per
    // successful idempotency key.
    bool PostJournalEntry(const std::string& idempotency_key,
                          const CreateJournalEntryRequest& request,
                          const std::string& performed_by,
                          JournalPostingOutcome* outcome,
                          LedgerError* error);
    // Runs a period command on the organization's period strand.
    bool RunPeriodCommand(const PeriodCommand& command, LedgerError* error);

    const JournalEntryWorkflow* GetJournalEntry(const std::string& journal_entry_id) const;
    // Waits for an in-flight post of the same journal entry before reading it.
    bool ReconcileJournalEntry(const std::string& journal_entry_id,
                               JournalReconciliation* reconciliation,
                               LedgerError* error);

private:
    bool ClaimJournal(const std::string& journal_entry_id, LedgerError* error);
    void ReleaseJournal(const std::string& journal_entry_id);
    JournalEntryWorkflow* FindOrCreateJournal(const CreateJournalEntryRequest& request,
                                              LedgerError* error);
    bool PostClaimed(const CreateJournalEntryRequest& request,
                     const std::string& performed_by,
                     JournalPostingOutcome* outcome,
                     LedgerError* error);

    const std::string organization_id_;
    IdempotencyKeyStore& keys_;
    AccountingPeriodLifecycle& periods_;
    AccountBook& book_;
    const IChartOfAccounts* chart_{nullptr};
    EntityStrandExecutor& executor_;
    NowFn now_;
    const LedgerRuntimeConfig* runtime_{nullptr};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<JournalEntryWorkflow>> journals_;
    std::unordered_set<std::string> in_flight_;
    std::condition_variable released_;
};

}  // namespace ledger_core
