#pragma once

#include <cstdint>
#include <string>

#include "ledger_core/contracts/types.h"
#include "ledger_core/core/fixed_decimal.h"

namespace ledger_core {

struct LedgerEntry {
    std::string entry_id;
    LedgerEntryType type{LedgerEntryType::kDebit};
    // Always >= 0; the signed effect on the balance is balance_effect.
    Amount amount;
    Amount balance_effect;
    Amount balance_after;
    std::string description;
    std::string performed_by;
    EpochNanos ts_ns{0};
    std::string reference_number;
    std::string reference_type;
    std::string reference_id;
    LedgerEntryStatus status{LedgerEntryStatus::kPosted};
    // Set on a reversed entry: the reversal that offsets it.
    std::string reversal_entry_id;
    // Set on a reversal entry: the entry it offsets.
    std::string reversed_entry_id;
    int period_year{0};
    int period_month{0};
};

struct PeriodSummary {
    int year{0};
    int month{0};
    Amount total_debits;
    Amount total_credits;
    Amount closing_balance;
    int entry_count{0};
    std::string closed_by;
    EpochNanos closed_at_ns{0};
};

struct PostingRequest {
    Amount amount;
    std::string description;
    std::string performed_by;
    std::string reference_number;
    std::string reference_type;
    std::string reference_id;
};

struct PostingResult {
    std::string entry_id;
    LedgerEntryType type{LedgerEntryType::kDebit};
    Amount amount;
    Amount balance_before;
    Amount new_balance;
};

enum class AccountEventKind {
    kCreated,
    kEntryAppended,
    kPeriodClosed,
    kActivated,
    kDeactivated,
    kDetailsUpdated,
};

inline std::string ToString(AccountEventKind kind) {
    switch (kind) {
        case AccountEventKind::kCreated:
            return "account_created";
        case AccountEventKind::kEntryAppended:
            return "entry_appended";
        case AccountEventKind::kPeriodClosed:
            return "period_closed";
        case AccountEventKind::kActivated:
            return "account_activated";
        case AccountEventKind::kDeactivated:
            return "account_deactivated";
        case AccountEventKind::kDetailsUpdated:
            return "details_updated";
    }
    return "unknown";
}

inline bool ParseAccountEventKind(const std::string& value, AccountEventKind* kind) {
    for (const auto candidate : {AccountEventKind::kCreated,
                                 AccountEventKind::kEntryAppended,
                                 AccountEventKind::kPeriodClosed,
                                 AccountEventKind::kActivated,
                                 AccountEventKind::kDeactivated,
                                 AccountEventKind::kDetailsUpdated}) {
        if (ToString(candidate) == value) {
            *kind = candidate;
            return true;
        }
    }
    return false;
}

// Every account mutation is one of these; replaying them rebuilds the account exactly.
struct AccountEvent {
    AccountEventKind kind{AccountEventKind::kCreated};
    std::string organization_id;
    std::string account_id;
    EpochNanos ts_ns{0};
    std::string performed_by;

    // kCreated, kDetailsUpdated (empty has_* fields mean unchanged)
    std::string account_code;
    std::string name;
    std::string description;
    std::string tax_code;
    bool has_name{false};
    bool has_description{false};
    bool has_tax_code{false};
    AccountType account_type{AccountType::kAsset};
    std::string currency;
    bool is_system_account{false};

    // kEntryAppended
    LedgerEntry entry;

    // kPeriodClosed
    PeriodSummary period;
};

}  // namespace ledger_core
