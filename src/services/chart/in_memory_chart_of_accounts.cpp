#include "ledger_core/services/in_memory_chart_of_accounts.h"

namespace ledger_core {

bool InMemoryChartOfAccounts::AddAccount(const ChartAccount& account, LedgerError* error) {
    if (account.code.empty()) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "Account code is required");
    }
    if (account.name.empty()) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "Account name is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (accounts_.count(account.code) > 0) {
        return FailWith(error,
                        LedgerErrorCode::kAlreadyExists,
                        "Account code " + account.code + " already exists");
    }
    if (!account.parent_code.empty()) {
        const auto parent = accounts_.find(account.parent_code);
        if (parent == accounts_.end()) {
            return FailWith(error,
                            LedgerErrorCode::kNotFound,
                            "Parent account " + account.parent_code + " not found");
        }
        if (parent->second.type != account.type) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidArgument,
                            "Account " + account.code + " must have the same type as parent " +
                                account.parent_code);
        }
        if (account.active && !parent->second.active) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidState,
                            "Parent account " + account.parent_code + " is inactive");
        }
    }
    accounts_.emplace(account.code, account);
    return true;
}

bool InMemoryChartOfAccounts::DeactivateAccount(const std::string& code, LedgerError* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = accounts_.find(code);
    if (it == accounts_.end()) {
        return FailWith(error, LedgerErrorCode::kNotFound, "Account " + code + " not found");
    }
    if (!it->second.active) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Account " + code + " is already inactive");
    }
    for (const auto& [child_code, child] : accounts_) {
        if (child.parent_code == code && child.active) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidState,
                            "Account " + code + " has active child account " + child_code);
        }
    }
    it->second.active = false;
    return true;
}

bool InMemoryChartOfAccounts::ReactivateAccount(const std::string& code, LedgerError* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = accounts_.find(code);
    if (it == accounts_.end()) {
        return FailWith(error, LedgerErrorCode::kNotFound, "Account " + code + " not found");
    }
    if (it->second.active) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Account " + code + " is already active");
    }
    if (!it->second.parent_code.empty()) {
        const auto parent = accounts_.find(it->second.parent_code);
        if (parent != accounts_.end() && !parent->second.active) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidState,
                            "Parent account " + it->second.parent_code + " is inactive");
        }
    }
    it->second.active = true;
    return true;
}

std::optional<ChartAccount> InMemoryChartOfAccounts::GetAccount(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = accounts_.find(code);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ChartAccount> InMemoryChartOfAccounts::GetChildren(const std::string& code) const {
    std::vector<ChartAccount> children;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [child_code, child] : accounts_) {
        (void)child_code;
        if (child.parent_code == code) {
            children.push_back(child);
        }
    }
    return children;
}

bool InMemoryChartOfAccounts::ValidateAccount(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = accounts_.find(code);
    return it != accounts_.end() && it->second.active;
}

std::vector<ChartAccount> InMemoryChartOfAccounts::ListActiveAccounts() const {
    std::vector<ChartAccount> active;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [code, account] : accounts_) {
        (void)code;
        if (account.active) {
            active.push_back(account);
        }
    }
    return active;
}

}  // namespace ledger_core
