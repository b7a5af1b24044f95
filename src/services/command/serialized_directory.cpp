#include "ledger_core/services/serialized_directory.h"

#include <future>
#include <utility>

namespace ledger_core {

namespace {

struct PostOutcome {
    bool ok{false};
    PostingResult result;
    LedgerError error;
};

struct BalanceOutcome {
    bool ok{false};
    Amount balance;
    LedgerError error;
};

constexpr const char* kExecutorStopped = "Account executor is not accepting work";

}  // namespace

std::string AccountStrandKey(const std::string& organization_id, const std::string& account_code) {
    return "account:" + organization_id + ":" + account_code;
}

std::string PeriodStrandKey(const std::string& organization_id) {
    return "period:" + organization_id;
}

SerializedAccountDirectory::SerializedAccountDirectory(AccountBook& book,
                                                       EntityStrandExecutor& executor)
    : book_(book), executor_(executor) {}

bool SerializedAccountDirectory::HasAccount(const std::string& account_code) const {
    return book_.HasAccount(account_code);
}

bool SerializedAccountDirectory::Post(const std::string& account_code,
                                      BalanceSide side,
                                      const PostingRequest& request,
                                      PostingResult* result,
                                      LedgerError* error) {
    std::future<PostOutcome> future;
    const bool submitted = executor_.Submit(
        AccountStrandKey(book_.organization_id(), account_code),
        [this, account_code, side, request]() {
            PostOutcome outcome;
            outcome.ok = book_.Post(account_code, side, request, &outcome.result, &outcome.error);
            return outcome;
        },
        &future);
    if (!submitted) {
        return FailWith(error, LedgerErrorCode::kInvalidState, kExecutorStopped);
    }
    PostOutcome outcome = future.get();
    if (!outcome.ok) {
        return FailWith(error, outcome.error.code, outcome.error.message);
    }
    if (result != nullptr) {
        *result = std::move(outcome.result);
    }
    return true;
}

bool SerializedAccountDirectory::GetBalance(const std::string& account_code,
                                            Amount* balance,
                                            LedgerError* error) const {
    std::future<BalanceOutcome> future;
    const bool submitted = executor_.Submit(
        AccountStrandKey(book_.organization_id(), account_code),
        [this, account_code]() {
            BalanceOutcome outcome;
            outcome.ok = book_.GetBalance(account_code, &outcome.balance, &outcome.error);
            return outcome;
        },
        &future);
    if (!submitted) {
        return FailWith(error, LedgerErrorCode::kInvalidState, kExecutorStopped);
    }
    const BalanceOutcome outcome = future.get();
    if (!outcome.ok) {
        return FailWith(error, outcome.error.code, outcome.error.message);
    }
    if (balance != nullptr) {
        *balance = outcome.balance;
    }
    return true;
}

std::vector<LedgerEntry> SerializedAccountDirectory::FindEntriesByReference(
    const std::string& account_code,
    const std::string& reference_id) const {
    std::future<std::vector<LedgerEntry>> future;
    const bool submitted = executor_.Submit(
        AccountStrandKey(book_.organization_id(), account_code),
        [this, account_code, reference_id]() {
            return book_.FindEntriesByReference(account_code, reference_id);
        },
        &future);
    if (!submitted) {
        return {};
    }
    return future.get();
}

SerializedPostingGate::SerializedPostingGate(std::string organization_id,
                                             const IPostingGate& gate,
                                             EntityStrandExecutor& executor)
    : organization_id_(std::move(organization_id)), gate_(gate), executor_(executor) {}

bool SerializedPostingGate::CanPostToDate(const CivilDate& date) const {
    std::future<bool> future;
    const bool submitted = executor_.Submit(
        PeriodStrandKey(organization_id_),
        [this, date]() { return gate_.CanPostToDate(date); },
        &future);
    if (!submitted) {
        return false;
    }
    return future.get();
}

}  // namespace ledger_core
