#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ledger_core/interfaces/chart_of_accounts.h"

namespace ledger_core {

// Account-code registry with a parent/child hierarchy. A child must share its parent's type.
class InMemoryChartOfAccounts : public IChartOfAccounts {
public:
    bool AddAccount(const ChartAccount& account, LedgerError* error);
    // Refused while any child is still active.
    bool DeactivateAccount(const std::string& code, LedgerError* error);
    // Refused while the parent is inactive.
    bool ReactivateAccount(const std::string& code, LedgerError* error);

    std::optional<ChartAccount> GetAccount(const std::string& code) const;
    std::vector<ChartAccount> GetChildren(const std::string& code) const;

    bool ValidateAccount(const std::string& code) const override;
    // Ordered by account code.
    std::vector<ChartAccount> ListActiveAccounts() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ChartAccount> accounts_;
};

}  // namespace ledger_core
