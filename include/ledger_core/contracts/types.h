#pragma once

#include <cctype>
#include <cstdint>
#include <functional>
#include <string>

namespace ledger_core {

using EpochNanos = std::int64_t;

// Injected wall clock; an empty NowFn means system_clock.
using NowFn = std::function<EpochNanos()>;

enum class LedgerErrorCode {
    kNone = 0,
    kInvalidArgument = 1,
    kInvalidState = 2,
    kAlreadyExists = 3,
    kNotFound = 4,
};

struct LedgerError {
    LedgerErrorCode code{LedgerErrorCode::kNone};
    std::string message;
};

inline bool FailWith(LedgerError* error, LedgerErrorCode code, const std::string& message) {
    if (error != nullptr) {
        error->code = code;
        error->message = message;
    }
    return false;
}

inline void ClearError(LedgerError* error) {
    if (error != nullptr) {
        error->code = LedgerErrorCode::kNone;
        error->message.clear();
    }
}

inline const char* LedgerErrorCodeName(LedgerErrorCode code) {
    switch (code) {
        case LedgerErrorCode::kNone:
            return "none";
        case LedgerErrorCode::kInvalidArgument:
            return "invalid_argument";
        case LedgerErrorCode::kInvalidState:
            return "invalid_state";
        case LedgerErrorCode::kAlreadyExists:
            return "already_exists";
        case LedgerErrorCode::kNotFound:
            return "not_found";
    }
    return "unknown";
}

enum class AccountType {
    kAsset,
    kLiability,
    kEquity,
    kRevenue,
    kExpense,
};

enum class BalanceSide {
    kDebit,
    kCredit,
};

enum class LedgerEntryType {
    kDebit,
    kCredit,
    kAdjustment,
    kOpening,
    kReversal,
};

enum class LedgerEntryStatus {
    kPosted,
    kReversed,
};

enum class JournalEntryStatus {
    kDraft,
    kApproved,
    kPosted,
    kVoided,
    kRejected,
};

enum class PeriodFrequency {
    kMonthly,
    kQuarterly,
    kYearly,
};

enum class PeriodStatus {
    kNotStarted,
    kOpen,
    kClosed,
    kLocked,
};

inline BalanceSide NormalBalanceSide(AccountType type) {
    switch (type) {
        case AccountType::kAsset:
        case AccountType::kExpense:
            return BalanceSide::kDebit;
        case AccountType::kLiability:
        case AccountType::kEquity:
        case AccountType::kRevenue:
            return BalanceSide::kCredit;
    }
    return BalanceSide::kDebit;
}

inline std::string ToString(AccountType type) {
    switch (type) {
        case AccountType::kAsset:
            return "asset";
        case AccountType::kLiability:
            return "liability";
        case AccountType::kEquity:
            return "equity";
        case AccountType::kRevenue:
            return "revenue";
        case AccountType::kExpense:
            return "expense";
    }
    return "unknown";
}

inline std::string ToString(BalanceSide side) {
    return side == BalanceSide::kDebit ? "debit" : "credit";
}

inline std::string ToString(LedgerEntryType type) {
    switch (type) {
        case LedgerEntryType::kDebit:
            return "debit";
        case LedgerEntryType::kCredit:
            return "credit";
        case LedgerEntryType::kAdjustment:
            return "adjustment";
        case LedgerEntryType::kOpening:
            return "opening";
        case LedgerEntryType::kReversal:
            return "reversal";
    }
    return "unknown";
}

inline std::string ToString(LedgerEntryStatus status) {
    return status == LedgerEntryStatus::kPosted ? "posted" : "reversed";
}

inline std::string ToString(JournalEntryStatus status) {
    switch (status) {
        case JournalEntryStatus::kDraft:
            return "draft";
        case JournalEntryStatus::kApproved:
            return "approved";
        case JournalEntryStatus::kPosted:
            return "posted";
        case JournalEntryStatus::kVoided:
            return "voided";
        case JournalEntryStatus::kRejected:
            return "rejected";
    }
    return "unknown";
}

inline std::string ToString(PeriodFrequency frequency) {
    switch (frequency) {
        case PeriodFrequency::kMonthly:
            return "monthly";
        case PeriodFrequency::kQuarterly:
            return "quarterly";
        case PeriodFrequency::kYearly:
            return "yearly";
    }
    return "unknown";
}

inline std::string ToString(PeriodStatus status) {
    switch (status) {
        case PeriodStatus::kNotStarted:
            return "not_started";
        case PeriodStatus::kOpen:
            return "open";
        case PeriodStatus::kClosed:
            return "closed";
        case PeriodStatus::kLocked:
            return "locked";
    }
    return "unknown";
}

inline bool ParseAccountType(const std::string& raw, AccountType* type) {
    std::string value;
    value.reserve(raw.size());
    for (const char ch : raw) {
        value.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (value == "asset") {
        *type = AccountType::kAsset;
    } else if (value == "liability") {
        *type = AccountType::kLiability;
    } else if (value == "equity") {
        *type = AccountType::kEquity;
    } else if (value == "revenue") {
        *type = AccountType::kRevenue;
    } else if (value == "expense") {
        *type = AccountType::kExpense;
    } else {
        return false;
    }
    return true;
}

inline bool ParseLedgerEntryType(const std::string& value, LedgerEntryType* type) {
    if (value == "debit") {
        *type = LedgerEntryType::kDebit;
    } else if (value == "credit") {
        *type = LedgerEntryType::kCredit;
    } else if (value == "adjustment") {
        *type = LedgerEntryType::kAdjustment;
    } else if (value == "opening") {
        *type = LedgerEntryType::kOpening;
    } else if (value == "reversal") {
        *type = LedgerEntryType::kReversal;
    } else {
        return false;
    }
    return true;
}

}  // namespace ledger_core
