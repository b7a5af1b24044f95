#pragma once

#include <string>
#include <vector>

#include "ledger_core/contracts/types.h"

namespace ledger_core {

struct ChartAccount {
    std::string code;
    std::string name;
    AccountType type{AccountType::kAsset};
    std::string parent_code;
    bool active{true};
};

class IChartOfAccounts {
public:
    virtual ~IChartOfAccounts() = default;
    // True only for a known, active account code.
    virtual bool ValidateAccount(const std::string& code) const = 0;
    virtual std::vector<ChartAccount> ListActiveAccounts() const = 0;
};

}  // namespace ledger_core
