#pragma once

#include <string>
#include <vector>

#include "ledger_core/core/entity_strand_executor.h"
#include "ledger_core/interfaces/account_posting_directory.h"
#include "ledger_core/interfaces/posting_gate.h"
#include "ledger_core/services/account_book.h"

namespace ledger_core {

std::string AccountStrandKey(const std::string& organization_id, const std::string& account_code);
std::string PeriodStrandKey(const std::string& organization_id);

// Routes every account command through the account's strand, so a ledger only ever runs
// one command at a time. Callers block on the result: never call from inside a strand task.
class SerializedAccountDirectory : public IAccountPostingDirectory {
public:
    SerializedAccountDirectory(AccountBook& book, EntityStrandExecutor& executor);

    bool HasAccount(const std::string& account_code) const override;
    bool Post(const std::string& account_code,
              BalanceSide side,
              const PostingRequest& request,
              PostingResult* result,
              LedgerError* error) override;
    bool GetBalance(const std::string& account_code,
                    Amount* balance,
                    LedgerError* error) const override;
    std::vector<LedgerEntry> FindEntriesByReference(const std::string& account_code,
                                                    const std::string& reference_id) const override;

private:
    AccountBook& book_;
    EntityStrandExecutor& executor_;
};

// Evaluates the fiscal-year gate on the organization's period strand.
class SerializedPostingGate : public IPostingGate {
public:
    SerializedPostingGate(std::string organization_id,
                          const IPostingGate& gate,
                          EntityStrandExecutor& executor);

    bool CanPostToDate(const CivilDate& date) const override;

private:
    const std::string organization_id_;
    const IPostingGate& gate_;
    EntityStrandExecutor& executor_;
};

}  // namespace ledger_core
