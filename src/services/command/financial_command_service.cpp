#include "ledger_core/services/financial_command_service.h"

#include <future>
#include <optional>
#include <utility>

#include "ledger_core/core/structured_log.h"
#include "ledger_core/services/serialized_directory.h"

namespace ledger_core {

namespace {

constexpr const char* kApp = "financial_command_service";

struct CommandOutcome {
    bool ok{false};
    LedgerError error;
};

std::string OutcomeDigest(const JournalPostingOutcome& outcome) {
    return outcome.journal_entry_id + "|" + ToString(outcome.status) + "|" +
           std::to_string(outcome.posted_lines);
}

}  // namespace

FinancialCommandService::FinancialCommandService(std::string organization_id,
                                                 IdempotencyKeyStore& keys,
                                                 AccountingPeriodLifecycle& periods,
                                                 AccountBook& book,
                                                 const IChartOfAccounts* chart,
                                                 EntityStrandExecutor& executor,
                                                 NowFn now,
                                                 const LedgerRuntimeConfig* runtime)
    : organization_id_(std::move(organization_id)),
      keys_(keys),
      periods_(periods),
      book_(book),
      chart_(chart),
      executor_(executor),
      now_(std::move(now)),
      runtime_(runtime) {}

bool FinancialCommandService::PostJournalEntry(const std::string& idempotency_key,
                                               const CreateJournalEntryRequest& request,
                                               const std::string& performed_by,
                                               JournalPostingOutcome* outcome,
                                               LedgerError* error) {
    if (!keys_.TryAcquire(idempotency_key, kPostJournalOperation, request.journal_entry_id, error)) {
        return false;
    }
    if (!ClaimJournal(request.journal_entry_id, error)) {
        return false;
    }

    JournalPostingOutcome result;
    const bool ok = PostClaimed(request, performed_by, &result, error);
    ReleaseJournal(request.journal_entry_id);

    std::optional<std::string> hash;
    if (ok) {
        result.result_hash = IdempotencyKeyStore::ComputeResultHash(OutcomeDigest(result));
        hash = result.result_hash;
    }
    LedgerError mark_error;
    if (!keys_.MarkKeyUsed(idempotency_key, ok, hash, &mark_error)) {
        EmitStructuredLog(runtime_, kApp, "error", "idempotency_mark_failed",
                          {{"key", idempotency_key}, {"error", mark_error.message}});
        if (ok) {
            return FailWith(error, mark_error.code, mark_error.message);
        }
    }
    if (!ok) {
        return false;
    }
    if (outcome != nullptr) {
        *outcome = std::move(result);
    }
    return true;
}

bool FinancialCommandService::RunPeriodCommand(const PeriodCommand& command, LedgerError* error) {
    if (!command) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "Period command is empty");
    }
    std::future<CommandOutcome> future;
    const bool submitted = executor_.Submit(
        PeriodStrandKey(organization_id_),
        [this, command]() {
            CommandOutcome outcome;
            outcome.ok = command(periods_, &outcome.error);
            return outcome;
        },
        &future);
    if (!submitted) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Period executor is not accepting work");
    }
    const CommandOutcome outcome = future.get();
    if (!outcome.ok) {
        return FailWith(error, outcome.error.code, outcome.error.message);
    }
    return true;
}

const JournalEntryWorkflow* FinancialCommandService::GetJournalEntry(
    const std::string& journal_entry_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = journals_.find(journal_entry_id);
    return it == journals_.end() ? nullptr : it->second.get();
}

bool FinancialCommandService::ReconcileJournalEntry(const std::string& journal_entry_id,
                                                    JournalReconciliation* reconciliation,
                                                    LedgerError* error) {
    const JournalEntryWorkflow* journal = nullptr;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        released_.wait(lock, [this, &journal_entry_id] {
            return in_flight_.count(journal_entry_id) == 0;
        });
        const auto it = journals_.find(journal_entry_id);
        if (it == journals_.end()) {
            return FailWith(error,
                            LedgerErrorCode::kNotFound,
                            "Journal entry " + journal_entry_id + " not found");
        }
        journal = it->second.get();
        in_flight_.insert(journal_entry_id);
    }
    SerializedAccountDirectory directory(book_, executor_);
    const auto report = journal->Reconcile(directory);
    ReleaseJournal(journal_entry_id);
    if (!report.consistent) {
        EmitStructuredLog(runtime_, kApp, "warn", "journal_inconsistent",
                          {{"journal_entry_id", journal_entry_id},
                           {"status", ToString(report.status)},
                           {"posted_lines", std::to_string(report.posted_lines)},
                           {"total_lines", std::to_string(report.total_lines)}});
    }
    if (reconciliation != nullptr) {
        *reconciliation = report;
    }
    return true;
}

bool FinancialCommandService::ClaimJournal(const std::string& journal_entry_id,
                                           LedgerError* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_flight_.insert(journal_entry_id).second) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Journal entry " + journal_entry_id + " is in use by another command");
    }
    return true;
}

void FinancialCommandService::ReleaseJournal(const std::string& journal_entry_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(journal_entry_id);
    }
    released_.notify_all();
}

JournalEntryWorkflow* FinancialCommandService::FindOrCreateJournal(
    const CreateJournalEntryRequest& request,
    LedgerError* error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = journals_.find(request.journal_entry_id);
        if (it != journals_.end()) {
            return it->second.get();
        }
    }
    CreateJournalEntryRequest scoped = request;
    if (scoped.organization_id.empty()) {
        scoped.organization_id = organization_id_;
    }
    auto journal = std::make_unique<JournalEntryWorkflow>(now_, runtime_);
    if (!journal->Create(scoped, chart_, error)) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = journals_[request.journal_entry_id];
    slot = std::move(journal);
    return slot.get();
}

bool FinancialCommandService::PostClaimed(const CreateJournalEntryRequest& request,
                                          const std::string& performed_by,
                                          JournalPostingOutcome* outcome,
                                          LedgerError* error) {
    if (!request.organization_id.empty() && request.organization_id != organization_id_) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Journal entry belongs to organization " + request.organization_id);
    }
    JournalEntryWorkflow* journal = FindOrCreateJournal(request, error);
    if (journal == nullptr) {
        return false;
    }
    if (journal->status() == JournalEntryStatus::kPosted) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Journal entry " + request.journal_entry_id + " is already posted");
    }
    if (journal->status() == JournalEntryStatus::kDraft &&
        !journal->Approve(performed_by, error)) {
        return false;
    }

    SerializedAccountDirectory directory(book_, executor_);
    SerializedPostingGate gate(organization_id_, periods_, executor_);
    const bool posted = journal->Post(performed_by, directory, &gate, error);
    outcome->journal_entry_id = journal->journal_entry_id();
    outcome->status = journal->status();
    outcome->posted_lines = journal->PostedLineCount();
    EmitStructuredLog(runtime_, kApp, posted ? "info" : "warn", "journal_command_completed",
                      {{"organization_id", organization_id_},
                       {"journal_entry_id", outcome->journal_entry_id},
                       {"status", ToString(outcome->status)},
                       {"posted_lines", std::to_string(outcome->posted_lines)}});
    return posted;
}

}  // namespace ledger_core
