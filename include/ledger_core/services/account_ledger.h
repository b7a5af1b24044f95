#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ledger_core/contracts/account_event.h"
#include "ledger_core/contracts/types.h"
#include "ledger_core/core/ledger_config.h"
#include "ledger_core/interfaces/account_event_sink.h"

namespace ledger_core {

struct CreateAccountRequest {
    std::string organization_id;
    std::string account_id;
    std::string account_code;
    std::string name;
    std::string description;
    std::string tax_code;
    AccountType account_type{AccountType::kAsset};
    std::string currency{"USD"};
    Amount opening_balance;
    bool is_system_account{false};
    std::string performed_by;
};

struct AccountDetailsUpdate {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> tax_code;
    std::string performed_by;
};

struct AccountSummary {
    std::string account_id;
    std::string account_code;
    std::string name;
    AccountType account_type{AccountType::kAsset};
    BalanceSide normal_side{BalanceSide::kDebit};
    std::string currency;
    Amount balance;
    Amount total_debits;
    Amount total_credits;
    std::size_t entry_count{0};
    bool is_active{false};
    bool is_system_account{false};
    int current_period_year{0};
    int current_period_month{0};
    EpochNanos last_entry_ns{0};
};

// One account of one organization: balance plus its append-only entry history.
//
// Every mutation validates, builds an AccountEvent, hands it to the optional event sink
// (write-ahead) and then applies it. Apply() is also the replay path, so the balance is
// always the sum of the entries' balance effects. Not thread-safe; callers serialize
// commands per account.
class AccountLedger {
public:
    explicit AccountLedger(NowFn now = {},
                           IAccountEventSink* sink = nullptr,
                           const LedgerRuntimeConfig* runtime = nullptr);

    bool Create(const CreateAccountRequest& request, LedgerError* error);
    bool PostDebit(const PostingRequest& request, PostingResult* result, LedgerError* error);
    bool PostCredit(const PostingRequest& request, PostingResult* result, LedgerError* error);
    bool Post(BalanceSide side,
              const PostingRequest& request,
              PostingResult* result,
              LedgerError* error);
    bool AdjustBalance(const Amount& new_balance,
                       const std::string& reason,
                       const std::string& performed_by,
                       PostingResult* result,
                       LedgerError* error);
    bool ReverseEntry(const std::string& entry_id,
                      const std::string& reason,
                      const std::string& performed_by,
                      PostingResult* result,
                      LedgerError* error);
    bool ClosePeriod(int year,
                     int month,
                     const std::string& performed_by,
                     PeriodSummary* summary,
                     LedgerError* error);
    bool Activate(const std::string& performed_by, LedgerError* error);
    bool Deactivate(const std::string& performed_by, LedgerError* error);
    bool UpdateDetails(const AccountDetailsUpdate& update, LedgerError* error);

    // Applies an already-validated event without writing it to the sink.
    bool Apply(const AccountEvent& event, LedgerError* error);

    bool Exists() const { return initialized_; }
    Amount GetBalance() const { return balance_; }
    Amount GetBalanceAt(EpochNanos cutoff_ns) const;
    std::vector<LedgerEntry> GetEntriesInRange(EpochNanos from_ns, EpochNanos to_ns) const;
    std::vector<LedgerEntry> GetEntriesByReference(const std::string& reference_id) const;
    // Most recent first.
    std::vector<LedgerEntry> GetRecentEntries(std::size_t count) const;
    std::optional<LedgerEntry> GetEntry(const std::string& entry_id) const;
    const std::vector<PeriodSummary>& GetPeriodSummaries() const { return period_summaries_; }
    AccountSummary GetSummary() const;

    const std::string& organization_id() const { return organization_id_; }
    const std::string& account_id() const { return account_id_; }
    const std::string& account_code() const { return account_code_; }
    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const std::string& tax_code() const { return tax_code_; }
    AccountType account_type() const { return account_type_; }
    BalanceSide normal_side() const { return NormalBalanceSide(account_type_); }
    const std::string& currency() const { return currency_; }
    bool is_active() const { return is_active_; }
    bool is_system_account() const { return is_system_account_; }
    int current_period_year() const { return current_period_year_; }
    int current_period_month() const { return current_period_month_; }
    EpochNanos created_at_ns() const { return created_at_ns_; }
    const std::string& created_by() const { return created_by_; }
    EpochNanos last_modified_ns() const { return last_modified_ns_; }
    const std::vector<LedgerEntry>& entries() const { return entries_; }

private:
    bool RequireInitialized(LedgerError* error) const;
    bool RequireActive(LedgerError* error) const;
    // Sink first, then Apply.
    bool Record(const AccountEvent& event, LedgerError* error);
    bool AppendEntry(LedgerEntry entry,
                     const std::string& performed_by,
                     PostingResult* result,
                     LedgerError* error);
    AccountEvent NewEvent(AccountEventKind kind, const std::string& performed_by) const;
    std::string NextEntryId() const;
    bool IsDebitSide(const LedgerEntry& entry) const;
    LedgerEntry* FindEntry(const std::string& entry_id);

    bool ApplyCreated(const AccountEvent& event, LedgerError* error);
    bool ApplyEntry(const AccountEvent& event, LedgerError* error);
    bool ApplyPeriodClosed(const AccountEvent& event, LedgerError* error);

    NowFn now_;
    IAccountEventSink* sink_{nullptr};
    const LedgerRuntimeConfig* runtime_{nullptr};

    bool initialized_{false};
    std::string organization_id_;
    std::string account_id_;
    std::string account_code_;
    std::string name_;
    std::string description_;
    std::string tax_code_;
    AccountType account_type_{AccountType::kAsset};
    std::string currency_{"USD"};
    bool is_active_{false};
    bool is_system_account_{false};
    Amount balance_;
    int current_period_year_{0};
    int current_period_month_{0};
    EpochNanos created_at_ns_{0};
    std::string created_by_;
    EpochNanos last_modified_ns_{0};
    std::vector<LedgerEntry> entries_;
    std::vector<PeriodSummary> period_summaries_;
};

}  // namespace ledger_core
