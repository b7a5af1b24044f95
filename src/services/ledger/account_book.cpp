#include "ledger_core/services/account_book.h"

#include <algorithm>
#include <utility>

namespace ledger_core {

AccountBook::AccountBook(std::string organization_id,
                         NowFn now,
                         IAccountEventSink* sink,
                         const LedgerRuntimeConfig* runtime)
    : organization_id_(std::move(organization_id)),
      now_(std::move(now)),
      sink_(sink),
      runtime_(runtime) {}

bool AccountBook::CreateAccount(const CreateAccountRequest& request, LedgerError* error) {
    CreateAccountRequest scoped = request;
    if (scoped.organization_id.empty()) {
        scoped.organization_id = organization_id_;
    }
    if (scoped.organization_id != organization_id_) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Account belongs to organization " + scoped.organization_id +
                            ", not " + organization_id_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (accounts_.count(scoped.account_id) > 0) {
        return FailWith(error, LedgerErrorCode::kAlreadyExists, "Account already exists");
    }
    if (id_by_code_.count(scoped.account_code) > 0) {
        return FailWith(error,
                        LedgerErrorCode::kAlreadyExists,
                        "Account code " + scoped.account_code + " is already in use");
    }
    auto ledger = std::make_unique<AccountLedger>(now_, sink_, runtime_);
    if (!ledger->Create(scoped, error)) {
        return false;
    }
    id_by_code_[scoped.account_code] = scoped.account_id;
    accounts_[scoped.account_id] = std::move(ledger);
    return true;
}

bool AccountBook::ApplyEvent(const AccountEvent& event, LedgerError* error) {
    if (event.organization_id != organization_id_) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Event for organization " + event.organization_id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (event.kind == AccountEventKind::kCreated) {
        if (accounts_.count(event.account_id) > 0 || id_by_code_.count(event.account_code) > 0) {
            return FailWith(error, LedgerErrorCode::kAlreadyExists, "Account already exists");
        }
        auto ledger = std::make_unique<AccountLedger>(now_, sink_, runtime_);
        if (!ledger->Apply(event, error)) {
            return false;
        }
        id_by_code_[event.account_code] = event.account_id;
        accounts_[event.account_id] = std::move(ledger);
        return true;
    }
    const auto it = accounts_.find(event.account_id);
    if (it == accounts_.end()) {
        return FailWith(error,
                        LedgerErrorCode::kNotFound,
                        "Account " + event.account_id + " does not exist");
    }
    return it->second->Apply(event, error);
}

AccountLedger* AccountBook::FindById(const std::string& account_id) {
    return LookupById(account_id);
}

const AccountLedger* AccountBook::FindById(const std::string& account_id) const {
    return LookupById(account_id);
}

AccountLedger* AccountBook::FindByCode(const std::string& account_code) {
    return LookupByCode(account_code);
}

const AccountLedger* AccountBook::FindByCode(const std::string& account_code) const {
    return LookupByCode(account_code);
}

std::vector<std::string> AccountBook::AccountCodes() const {
    std::vector<std::string> codes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        codes.reserve(id_by_code_.size());
        for (const auto& [code, id] : id_by_code_) {
            (void)id;
            codes.push_back(code);
        }
    }
    std::sort(codes.begin(), codes.end());
    return codes;
}

std::size_t AccountBook::AccountCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

bool AccountBook::HasAccount(const std::string& account_code) const {
    return LookupByCode(account_code) != nullptr;
}

bool AccountBook::Post(const std::string& account_code,
                       BalanceSide side,
                       const PostingRequest& request,
                       PostingResult* result,
                       LedgerError* error) {
    AccountLedger* ledger = LookupByCode(account_code);
    if (ledger == nullptr) {
        return FailWith(error,
                        LedgerErrorCode::kNotFound,
                        "Account " + account_code + " does not exist");
    }
    return ledger->Post(side, request, result, error);
}

bool AccountBook::GetBalance(const std::string& account_code,
                             Amount* balance,
                             LedgerError* error) const {
    const AccountLedger* ledger = LookupByCode(account_code);
    if (ledger == nullptr) {
        return FailWith(error,
                        LedgerErrorCode::kNotFound,
                        "Account " + account_code + " does not exist");
    }
    if (balance != nullptr) {
        *balance = ledger->GetBalance();
    }
    return true;
}

std::vector<LedgerEntry> AccountBook::FindEntriesByReference(const std::string& account_code,
                                                             const std::string& reference_id) const {
    const AccountLedger* ledger = LookupByCode(account_code);
    if (ledger == nullptr) {
        return {};
    }
    return ledger->GetEntriesByReference(reference_id);
}

AccountLedger* AccountBook::LookupById(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = accounts_.find(account_id);
    return it == accounts_.end() ? nullptr : it->second.get();
}

AccountLedger* AccountBook::LookupByCode(const std::string& account_code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto code_it = id_by_code_.find(account_code);
    if (code_it == id_by_code_.end()) {
        return nullptr;
    }
    const auto it = accounts_.find(code_it->second);
    return it == accounts_.end() ? nullptr : it->second.get();
}

}  // namespace ledger_core
