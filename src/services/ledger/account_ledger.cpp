#include "ledger_core/services/account_ledger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "ledger_core/common/timestamp.h"
#include "ledger_core/core/structured_log.h"
#include "ledger_core/monitoring/metric_registry.h"

namespace ledger_core {

namespace {

constexpr const char* kApp = "account_ledger";

std::shared_ptr<MonitoringCounter> EntryCounter(LedgerEntryType type) {
    static std::mutex mutex;
    static std::unordered_map<int, std::shared_ptr<MonitoringCounter>> counters;
    std::lock_guard<std::mutex> lock(mutex);
    const auto key = static_cast<int>(type);
    const auto it = counters.find(key);
    if (it != counters.end()) {
        return it->second;
    }
    auto counter = MetricRegistry::Instance().BuildCounter(
        "ledger_core_account_entries_total",
        "Ledger entries appended to accounts",
        {{"type", ToString(type)}});
    counters.emplace(key, counter);
    return counter;
}

bool IsIsoCurrency(const std::string& currency) {
    return currency.size() == 3 &&
           std::all_of(currency.begin(), currency.end(), [](unsigned char ch) {
               return std::isupper(ch) != 0;
           });
}

std::string FormatPeriod(int year, int month) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d", year, month);
    return buffer;
}

}  // namespace

AccountLedger::AccountLedger(NowFn now, IAccountEventSink* sink, const LedgerRuntimeConfig* runtime)
    : now_(std::move(now)), sink_(sink), runtime_(runtime) {}

bool AccountLedger::Create(const CreateAccountRequest& request, LedgerError* error) {
    if (initialized_) {
        return FailWith(error, LedgerErrorCode::kAlreadyExists, "Account already exists");
    }
    if (request.account_code.empty()) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "Account code is required");
    }
    if (request.account_id.empty()) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "Account id is required");
    }
    const std::string currency = request.currency.empty() ? "USD" : request.currency;
    if (!IsIsoCurrency(currency)) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Currency must be a 3-letter ISO code: " + currency);
    }

    AccountEvent created;
    created.kind = AccountEventKind::kCreated;
    created.organization_id = request.organization_id;
    created.account_id = request.account_id;
    created.ts_ns = ResolveNow(now_);
    created.performed_by = request.performed_by;
    created.account_code = request.account_code;
    created.name = request.name;
    created.description = request.description;
    created.tax_code = request.tax_code;
    created.account_type = request.account_type;
    created.currency = currency;
    created.is_system_account = request.is_system_account;
    if (!Record(created, error)) {
        return false;
    }

    EmitStructuredLog(runtime_, kApp, "info", "account_created",
                      {{"organization_id", organization_id_},
                       {"account_id", account_id_},
                       {"account_code", account_code_},
                       {"type", ToString(account_type_)},
                       {"opening_balance", request.opening_balance.ToString()}});

    if (request.opening_balance.IsZero()) {
        return true;
    }
    LedgerEntry opening;
    opening.type = LedgerEntryType::kOpening;
    opening.amount = request.opening_balance.Abs();
    opening.balance_effect = request.opening_balance;
    opening.description = "Opening balance";
    return AppendEntry(std::move(opening), request.performed_by, nullptr, error);
}

bool AccountLedger::PostDebit(const PostingRequest& request,
                              PostingResult* result,
                              LedgerError* error) {
    return Post(BalanceSide::kDebit, request, result, error);
}

bool AccountLedger::PostCredit(const PostingRequest& request,
                               PostingResult* result,
                               LedgerError* error) {
    return Post(BalanceSide::kCredit, request, result, error);
}

bool AccountLedger::Post(BalanceSide side,
                         const PostingRequest& request,
                         PostingResult* result,
                         LedgerError* error) {
    if (!RequireInitialized(error)) {
        return false;
    }
    if (!request.amount.IsPositive()) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "Amount must be positive");
    }
    if (!RequireActive(error)) {
        return false;
    }

    LedgerEntry entry;
    entry.type = side == BalanceSide::kDebit ? LedgerEntryType::kDebit : LedgerEntryType::kCredit;
    entry.amount = request.amount;
    entry.balance_effect = side == normal_side() ? request.amount : request.amount.Negated();
    entry.description = request.description;
    entry.reference_number = request.reference_number;
    entry.reference_type = request.reference_type;
    entry.reference_id = request.reference_id;
    return AppendEntry(std::move(entry), request.performed_by, result, error);
}

bool AccountLedger::AdjustBalance(const Amount& new_balance,
                                  const std::string& reason,
                                  const std::string& performed_by,
                                  PostingResult* result,
                                  LedgerError* error) {
    if (!RequireInitialized(error) || !RequireActive(error)) {
        return false;
    }
    if (new_balance == balance_) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "New balance is the same as current balance");
    }
    Amount delta;
    if (!Amount::CheckedSub(new_balance, balance_, &delta)) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Adjustment is out of the representable range");
    }

    LedgerEntry entry;
    entry.type = LedgerEntryType::kAdjustment;
    entry.amount = delta.Abs();
    entry.balance_effect = delta;
    entry.description = reason;
    return AppendEntry(std::move(entry), performed_by, result, error);
}

bool AccountLedger::ReverseEntry(const std::string& entry_id_ref,
                                 const std::string& reason,
                                 const std::string& performed_by,
                                 PostingResult* result,
                                 LedgerError* error) {
    if (!RequireInitialized(error) || !RequireActive(error)) {
        return false;
    }
    // The id may alias an element of entries_, which AppendEntry reallocates.
    const std::string entry_id = entry_id_ref;
    const LedgerEntry* target = FindEntry(entry_id);
    if (target == nullptr) {
        return FailWith(error, LedgerErrorCode::kNotFound, "Entry " + entry_id + " not found");
    }
    if (target->type == LedgerEntryType::kReversal) {
        return FailWith(error, LedgerErrorCode::kInvalidState, "Cannot reverse a reversal entry");
    }
    if (target->status == LedgerEntryStatus::kReversed) {
        return FailWith(error, LedgerErrorCode::kInvalidState, "Entry has already been reversed");
    }

    LedgerEntry reversal;
    reversal.type = LedgerEntryType::kReversal;
    reversal.amount = target->amount;
    reversal.balance_effect = target->balance_effect.Negated();
    reversal.description = reason.empty() ? "Reversal of " + entry_id : reason;
    reversal.reference_type = "Reversal";
    reversal.reference_id = entry_id;
    reversal.reversed_entry_id = entry_id;
    const auto reversed_amount = target->amount;
    if (!AppendEntry(std::move(reversal), performed_by, result, error)) {
        return false;
    }
    EmitStructuredLog(runtime_, kApp, "info", "entry_reversed",
                      {{"account_id", account_id_},
                       {"entry_id", entry_id},
                       {"reversal_entry_id", entries_.back().entry_id},
                       {"amount", reversed_amount.ToString()},
                       {"balance", balance_.ToString()}});
    return true;
}

bool AccountLedger::ClosePeriod(int year,
                                int month,
                                const std::string& performed_by,
                                PeriodSummary* summary,
                                LedgerError* error) {
    if (!RequireInitialized(error)) {
        return false;
    }
    if (month < 1 || month > 12) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Month must be within 1..12: " + std::to_string(month));
    }
    const auto already_closed = std::any_of(
        period_summaries_.begin(), period_summaries_.end(), [year, month](const PeriodSummary& s) {
            return s.year == year && s.month == month;
        });
    if (already_closed) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Period " + FormatPeriod(year, month) + " is already closed");
    }
    if (year != current_period_year_ || month != current_period_month_) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Cannot close period " + FormatPeriod(year, month) +
                            ": current open period is " +
                            FormatPeriod(current_period_year_, current_period_month_));
    }

    auto event = NewEvent(AccountEventKind::kPeriodClosed, performed_by);
    PeriodSummary& period = event.period;
    period.year = year;
    period.month = month;
    period.closing_balance = balance_;
    period.closed_by = performed_by;
    period.closed_at_ns = event.ts_ns;
    for (const auto& entry : entries_) {
        if (entry.period_year != year || entry.period_month != month ||
            entry.type == LedgerEntryType::kOpening) {
            continue;
        }
        Amount* bucket = IsDebitSide(entry) ? &period.total_debits : &period.total_credits;
        if (!Amount::CheckedAdd(*bucket, entry.amount, bucket)) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidState,
                            "Period totals overflow for " + FormatPeriod(year, month));
        }
        ++period.entry_count;
    }
    if (!Record(event, error)) {
        return false;
    }
    if (summary != nullptr) {
        *summary = period_summaries_.back();
    }
    EmitStructuredLog(runtime_, kApp, "info", "period_closed",
                      {{"account_id", account_id_},
                       {"period", FormatPeriod(year, month)},
                       {"total_debits", period_summaries_.back().total_debits.ToString()},
                       {"total_credits", period_summaries_.back().total_credits.ToString()},
                       {"closing_balance", balance_.ToString()}});
    return true;
}

bool AccountLedger::Activate(const std::string& performed_by, LedgerError* error) {
    if (!RequireInitialized(error)) {
        return false;
    }
    if (is_active_) {
        return FailWith(error, LedgerErrorCode::kInvalidState, "Account is already active");
    }
    return Record(NewEvent(AccountEventKind::kActivated, performed_by), error);
}

bool AccountLedger::Deactivate(const std::string& performed_by, LedgerError* error) {
    if (!RequireInitialized(error)) {
        return false;
    }
    if (is_system_account_) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "System accounts cannot be deactivated");
    }
    if (!is_active_) {
        return FailWith(error, LedgerErrorCode::kInvalidState, "Account is already inactive");
    }
    return Record(NewEvent(AccountEventKind::kDeactivated, performed_by), error);
}

bool AccountLedger::UpdateDetails(const AccountDetailsUpdate& update, LedgerError* error) {
    if (!RequireInitialized(error)) {
        return false;
    }
    if (!update.name && !update.description && !update.tax_code) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "No account details to update");
    }
    if (update.name && update.name->empty()) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "Account name must not be empty");
    }
    auto event = NewEvent(AccountEventKind::kDetailsUpdated, update.performed_by);
    event.has_name = update.name.has_value();
    event.name = update.name.value_or("");
    event.has_description = update.description.has_value();
    event.description = update.description.value_or("");
    event.has_tax_code = update.tax_code.has_value();
    event.tax_code = update.tax_code.value_or("");
    return Record(event, error);
}

bool AccountLedger::Apply(const AccountEvent& event, LedgerError* error) {
    if (event.kind == AccountEventKind::kCreated) {
        return ApplyCreated(event, error);
    }
    if (!RequireInitialized(error)) {
        return false;
    }
    if (event.account_id != account_id_) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Event for account " + event.account_id + " applied to " + account_id_);
    }
    switch (event.kind) {
        case AccountEventKind::kEntryAppended:
            return ApplyEntry(event, error);
        case AccountEventKind::kPeriodClosed:
            return ApplyPeriodClosed(event, error);
        case AccountEventKind::kActivated:
            is_active_ = true;
            break;
        case AccountEventKind::kDeactivated:
            is_active_ = false;
            break;
        case AccountEventKind::kDetailsUpdated:
            if (event.has_name) {
                name_ = event.name;
            }
            if (event.has_description) {
                description_ = event.description;
            }
            if (event.has_tax_code) {
                tax_code_ = event.tax_code;
            }
            break;
        case AccountEventKind::kCreated:
            break;
    }
    last_modified_ns_ = event.ts_ns;
    return true;
}

Amount AccountLedger::GetBalanceAt(EpochNanos cutoff_ns) const {
    Amount balance;
    for (const auto& entry : entries_) {
        if (entry.ts_ns > cutoff_ns) {
            continue;
        }
        // Entries were range-checked when applied.
        (void)Amount::CheckedAdd(balance, entry.balance_effect, &balance);
    }
    return balance;
}

std::vector<LedgerEntry> AccountLedger::GetEntriesInRange(EpochNanos from_ns, EpochNanos to_ns) const {
    std::vector<LedgerEntry> out;
    for (const auto& entry : entries_) {
        if (entry.ts_ns >= from_ns && entry.ts_ns <= to_ns) {
            out.push_back(entry);
        }
    }
    return out;
}

std::vector<LedgerEntry> AccountLedger::GetEntriesByReference(const std::string& reference_id) const {
    std::vector<LedgerEntry> out;
    if (reference_id.empty()) {
        return out;
    }
    for (const auto& entry : entries_) {
        if (entry.reference_id == reference_id) {
            out.push_back(entry);
        }
    }
    return out;
}

std::vector<LedgerEntry> AccountLedger::GetRecentEntries(std::size_t count) const {
    std::vector<LedgerEntry> out;
    const auto take = std::min(count, entries_.size());
    out.reserve(take);
    for (auto it = entries_.rbegin(); it != entries_.rend() && out.size() < take; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::optional<LedgerEntry> AccountLedger::GetEntry(const std::string& entry_id) const {
    for (const auto& entry : entries_) {
        if (entry.entry_id == entry_id) {
            return entry;
        }
    }
    return std::nullopt;
}

AccountSummary AccountLedger::GetSummary() const {
    AccountSummary summary;
    summary.account_id = account_id_;
    summary.account_code = account_code_;
    summary.name = name_;
    summary.account_type = account_type_;
    summary.normal_side = normal_side();
    summary.currency = currency_;
    summary.balance = balance_;
    summary.entry_count = entries_.size();
    summary.is_active = is_active_;
    summary.is_system_account = is_system_account_;
    summary.current_period_year = current_period_year_;
    summary.current_period_month = current_period_month_;
    for (const auto& entry : entries_) {
        Amount* bucket = IsDebitSide(entry) ? &summary.total_debits : &summary.total_credits;
        (void)Amount::CheckedAdd(*bucket, entry.amount, bucket);
        summary.last_entry_ns = std::max(summary.last_entry_ns, entry.ts_ns);
    }
    return summary;
}

bool AccountLedger::RequireInitialized(LedgerError* error) const {
    if (!initialized_) {
        return FailWith(error, LedgerErrorCode::kNotFound, "Account does not exist");
    }
    return true;
}

bool AccountLedger::RequireActive(LedgerError* error) const {
    if (!is_active_) {
        return FailWith(error, LedgerErrorCode::kInvalidState, "Account is not active");
    }
    return true;
}

bool AccountLedger::Record(const AccountEvent& event, LedgerError* error) {
    if (sink_ != nullptr && !sink_->Append(event)) {
        EmitStructuredLog(runtime_, kApp, "error", "wal_append_failed",
                          {{"account_id", event.account_id}, {"event", ToString(event.kind)}});
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Failed to append account event to the write-ahead log");
    }
    return Apply(event, error);
}

bool AccountLedger::AppendEntry(LedgerEntry entry,
                                const std::string& performed_by,
                                PostingResult* result,
                                LedgerError* error) {
    const Amount balance_before = balance_;
    Amount balance_after;
    if (!Amount::CheckedAdd(balance_before, entry.balance_effect, &balance_after)) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Posting would overflow the account balance");
    }

    auto event = NewEvent(AccountEventKind::kEntryAppended, performed_by);
    entry.entry_id = NextEntryId();
    entry.performed_by = performed_by;
    entry.ts_ns = event.ts_ns;
    entry.balance_after = balance_after;
    entry.status = LedgerEntryStatus::kPosted;
    entry.period_year = current_period_year_;
    entry.period_month = current_period_month_;
    event.entry = std::move(entry);
    if (!Record(event, error)) {
        return false;
    }

    const auto& appended = entries_.back();
    EntryCounter(appended.type)->Increment();
    EmitStructuredLog(runtime_, kApp, "debug", "entry_appended",
                      {{"account_id", account_id_},
                       {"entry_id", appended.entry_id},
                       {"type", ToString(appended.type)},
                       {"amount", appended.amount.ToString()},
                       {"balance", balance_.ToString()}});
    if (result != nullptr) {
        result->entry_id = appended.entry_id;
        result->type = appended.type;
        result->amount = appended.amount;
        result->balance_before = balance_before;
        result->new_balance = balance_;
    }
    return true;
}

AccountEvent AccountLedger::NewEvent(AccountEventKind kind, const std::string& performed_by) const {
    AccountEvent event;
    event.kind = kind;
    event.organization_id = organization_id_;
    event.account_id = account_id_;
    event.ts_ns = ResolveNow(now_);
    event.performed_by = performed_by;
    return event;
}

std::string AccountLedger::NextEntryId() const {
    char suffix[24];
    std::snprintf(suffix, sizeof(suffix), "-%06zu", entries_.size() + 1);
    return account_id_ + suffix;
}

bool AccountLedger::IsDebitSide(const LedgerEntry& entry) const {
    if (entry.balance_effect.IsZero()) {
        return entry.type == LedgerEntryType::kDebit;
    }
    const bool increases = entry.balance_effect.IsPositive();
    return increases == (normal_side() == BalanceSide::kDebit);
}

LedgerEntry* AccountLedger::FindEntry(const std::string& entry_id) {
    for (auto& entry : entries_) {
        if (entry.entry_id == entry_id) {
            return &entry;
        }
    }
    return nullptr;
}

bool AccountLedger::ApplyCreated(const AccountEvent& event, LedgerError* error) {
    if (initialized_) {
        return FailWith(error, LedgerErrorCode::kAlreadyExists, "Account already exists");
    }
    if (event.account_code.empty() || event.account_id.empty()) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Account creation event is missing its id or code");
    }
    initialized_ = true;
    organization_id_ = event.organization_id;
    account_id_ = event.account_id;
    account_code_ = event.account_code;
    name_ = event.name;
    description_ = event.description;
    tax_code_ = event.tax_code;
    account_type_ = event.account_type;
    currency_ = event.currency.empty() ? "USD" : event.currency;
    is_system_account_ = event.is_system_account;
    is_active_ = true;
    balance_ = Amount();
    const auto created_on = ToCivilDate(event.ts_ns);
    current_period_year_ = created_on.year;
    current_period_month_ = created_on.month;
    created_at_ns_ = event.ts_ns;
    created_by_ = event.performed_by;
    last_modified_ns_ = event.ts_ns;
    return true;
}

bool AccountLedger::ApplyEntry(const AccountEvent& event, LedgerError* error) {
    const auto& entry = event.entry;
    if (entry.entry_id.empty() || FindEntry(entry.entry_id) != nullptr) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Duplicate or missing entry id: " + entry.entry_id);
    }
    if (entry.amount.IsNegative()) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Entry amount must not be negative: " + entry.entry_id);
    }
    Amount balance_after;
    if (!Amount::CheckedAdd(balance_, entry.balance_effect, &balance_after)) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Entry would overflow the account balance: " + entry.entry_id);
    }
    if (balance_after != entry.balance_after) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Entry " + entry.entry_id + " balance_after " +
                            entry.balance_after.ToString() + " does not match replayed balance " +
                            balance_after.ToString());
    }

    if (entry.type == LedgerEntryType::kReversal) {
        LedgerEntry* target = FindEntry(entry.reversed_entry_id);
        if (target == nullptr) {
            return FailWith(error,
                            LedgerErrorCode::kNotFound,
                            "Reversed entry " + entry.reversed_entry_id + " not found");
        }
        if (target->type == LedgerEntryType::kReversal ||
            target->status == LedgerEntryStatus::kReversed) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidState,
                            "Entry " + entry.reversed_entry_id + " cannot be reversed again");
        }
        target->status = LedgerEntryStatus::kReversed;
        target->reversal_entry_id = entry.entry_id;
    }

    entries_.push_back(entry);
    balance_ = balance_after;
    last_modified_ns_ = event.ts_ns;
    return true;
}

bool AccountLedger::ApplyPeriodClosed(const AccountEvent& event, LedgerError* error) {
    const auto& period = event.period;
    if (period.year != current_period_year_ || period.month != current_period_month_) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Closed period " + FormatPeriod(period.year, period.month) +
                            " is not the current period");
    }
    period_summaries_.push_back(period);
    const auto next = AddMonths(FirstDayOfMonth(period.year, period.month), 1);
    current_period_year_ = next.year;
    current_period_month_ = next.month;
    last_modified_ns_ = event.ts_ns;
    return true;
}

}  // namespace ledger_core
