#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ledger_core/core/ledger_config.h"
#include "ledger_core/interfaces/account_event_sink.h"
#include "ledger_core/interfaces/account_posting_directory.h"
#include "ledger_core/services/account_ledger.h"

namespace ledger_core {

// All account ledgers of one organization, addressable by account id and by code.
// The lock guards the indexes only; commands against a single ledger must still be
// serialized by the caller (see SerializedAccountDirectory).
class AccountBook : public IAccountPostingDirectory {
public:
    explicit AccountBook(std::string organization_id,
                         NowFn now = {},
                         IAccountEventSink* sink = nullptr,
                         const LedgerRuntimeConfig* runtime = nullptr);

    bool CreateAccount(const CreateAccountRequest& request, LedgerError* error);
    // Replay path: kCreated events instantiate the ledger, the rest are applied to it.
    bool ApplyEvent(const AccountEvent& event, LedgerError* error);

    AccountLedger* FindById(const std::string& account_id);
    const AccountLedger* FindById(const std::string& account_id) const;
    AccountLedger* FindByCode(const std::string& account_code);
    const AccountLedger* FindByCode(const std::string& account_code) const;
    std::vector<std::string> AccountCodes() const;
    std::size_t AccountCount() const;
    const std::string& organization_id() const { return organization_id_; }

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
    AccountLedger* LookupById(const std::string& account_id) const;
    AccountLedger* LookupByCode(const std::string& account_code) const;

    const std::string organization_id_;
    NowFn now_;
    IAccountEventSink* sink_{nullptr};
    const LedgerRuntimeConfig* runtime_{nullptr};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<AccountLedger>> accounts_;
    std::unordered_map<std::string, std::string> id_by_code_;
};

}  // namespace ledger_core
