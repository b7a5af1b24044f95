#pragma once

#include <string>
#include <vector>

#include "ledger_core/contracts/account_event.h"

namespace ledger_core {

// How multi-account workflows reach individual account ledgers by account code.
class IAccountPostingDirectory {
public:
    virtual ~IAccountPostingDirectory() = default;
    virtual bool HasAccount(const std::string& account_code) const = 0;
    virtual bool Post(const std::string& account_code,
                      BalanceSide side,
                      const PostingRequest& request,
                      PostingResult* result,
                      LedgerError* error) = 0;
    virtual bool GetBalance(const std::string& account_code,
                            Amount* balance,
                            LedgerError* error) const = 0;
    virtual std::vector<LedgerEntry> FindEntriesByReference(const std::string& account_code,
                                                            const std::string& reference_id) const = 0;
};

}  // namespace ledger_core
