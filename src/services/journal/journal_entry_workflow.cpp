#include "ledger_core/services/journal_entry_workflow.h"

#include <algorithm>
#include <utility>

#include "ledger_core/core/structured_log.h"
#include "ledger_core/monitoring/metric_registry.h"

namespace ledger_core {

namespace {

constexpr const char* kApp = "journal_entry_workflow";
constexpr const char* kJournalReferenceType = "JournalEntry";

std::shared_ptr<MonitoringCounter> JournalPostedCounter() {
    static const auto counter = MetricRegistry::Instance().BuildCounter(
        "ledger_core_journal_posted_total", "Journal entries fully posted to the ledger");
    return counter;
}

std::shared_ptr<MonitoringCounter> JournalPartialCounter() {
    static const auto counter = MetricRegistry::Instance().BuildCounter(
        "ledger_core_journal_partial_total", "Journal postings that stopped after a line failure");
    return counter;
}

std::string LinePrefix(std::size_t index) {
    return "Line " + std::to_string(index + 1) + ": ";
}

}  // namespace

JournalEntryWorkflow::JournalEntryWorkflow(NowFn now, const LedgerRuntimeConfig* runtime)
    : now_(std::move(now)), runtime_(runtime) {}

bool JournalEntryWorkflow::Create(const CreateJournalEntryRequest& request,
                                  const IChartOfAccounts* chart,
                                  LedgerError* error) {
    if (created_) {
        return FailWith(error, LedgerErrorCode::kAlreadyExists, "Journal entry already exists");
    }
    if (request.journal_entry_id.empty()) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "Journal entry id is required");
    }
    if (!request.posting_date.IsValid()) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Invalid posting date: " + request.posting_date.ToString());
    }
    if (request.lines.size() < 2) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidArgument,
                        "Journal entry requires at least two lines");
    }

    Amount total_debits;
    Amount total_credits;
    for (std::size_t i = 0; i < request.lines.size(); ++i) {
        const auto& line = request.lines[i];
        if (line.account_code.empty()) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidArgument,
                            LinePrefix(i) + "account code is required");
        }
        if (line.debit.IsNegative() || line.credit.IsNegative()) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidArgument,
                            LinePrefix(i) + "amounts must not be negative");
        }
        if (line.debit.IsZero() == line.credit.IsZero()) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidArgument,
                            LinePrefix(i) + "exactly one of debit or credit must be non-zero");
        }
        if (!Amount::CheckedAdd(total_debits, line.debit, &total_debits) ||
            !Amount::CheckedAdd(total_credits, line.credit, &total_credits)) {
            return FailWith(error,
                            LedgerErrorCode::kInvalidArgument,
                            "Journal entry totals are out of range");
        }
    }
    if (total_debits != total_credits) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Debits must equal credits (debits " + total_debits.ToString() +
                            ", credits " + total_credits.ToString() + ")");
    }
    if (chart != nullptr) {
        for (const auto& line : request.lines) {
            if (!chart->ValidateAccount(line.account_code)) {
                return FailWith(error,
                                LedgerErrorCode::kInvalidState,
                                "Account " + line.account_code + " not found or inactive");
            }
        }
    }

    created_ = true;
    journal_entry_id_ = request.journal_entry_id;
    organization_id_ = request.organization_id;
    posting_date_ = request.posting_date;
    lines_ = request.lines;
    memo_ = request.memo;
    reference_ = request.reference;
    status_ = JournalEntryStatus::kDraft;
    total_debits_ = total_debits;
    total_credits_ = total_credits;
    created_by_ = request.performed_by;
    created_at_ns_ = ResolveNow(now_);
    line_entry_ids_.assign(lines_.size(), std::string());
    EmitStructuredLog(runtime_, kApp, "info", "journal_created",
                      {{"journal_entry_id", journal_entry_id_},
                       {"posting_date", posting_date_.ToString()},
                       {"lines", std::to_string(lines_.size())},
                       {"total", total_debits_.ToString()}});
    return true;
}

bool JournalEntryWorkflow::Approve(const std::string& performed_by, LedgerError* error) {
    if (!RequireCreated(error)) {
        return false;
    }
    if (status_ != JournalEntryStatus::kDraft) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Only Draft journal entries can be approved (status " +
                            ToString(status_) + ")");
    }
    status_ = JournalEntryStatus::kApproved;
    approved_by_ = performed_by;
    approved_at_ns_ = ResolveNow(now_);
    return true;
}

bool JournalEntryWorkflow::Post(const std::string& performed_by,
                                IAccountPostingDirectory& directory,
                                const IPostingGate* gate,
                                LedgerError* error) {
    if (!RequireCreated(error)) {
        return false;
    }
    if (status_ != JournalEntryStatus::kApproved) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Journal entry must be Approved before posting");
    }
    if (gate != nullptr && !gate->CanPostToDate(posting_date_)) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Cannot post to date " + posting_date_.ToString() +
                            ". Period may be closed.");
    }
    for (const auto& line : lines_) {
        if (!directory.HasAccount(line.account_code)) {
            return FailWith(error,
                            LedgerErrorCode::kNotFound,
                            "Account " + line.account_code + " does not exist");
        }
    }

    for (std::size_t i = 0; i < lines_.size(); ++i) {
        if (!line_entry_ids_[i].empty()) {
            continue;
        }
        std::string existing;
        if (FindPostedEntry(directory, i, &existing)) {
            line_entry_ids_[i] = existing;
            continue;
        }

        const auto& line = lines_[i];
        const bool is_debit = !line.debit.IsZero();
        PostingRequest request;
        request.amount = is_debit ? line.debit : line.credit;
        request.description = line.description.empty() ? memo_ : line.description;
        request.performed_by = performed_by;
        request.reference_number = LineReference(i);
        request.reference_type = kJournalReferenceType;
        request.reference_id = journal_entry_id_;

        PostingResult result;
        LedgerError line_error;
        if (!directory.Post(line.account_code,
                            is_debit ? BalanceSide::kDebit : BalanceSide::kCredit,
                            request,
                            &result,
                            &line_error)) {
            JournalPartialCounter()->Increment();
            EmitStructuredLog(runtime_, kApp, "error", "journal_partially_posted",
                              {{"journal_entry_id", journal_entry_id_},
                               {"line", std::to_string(i + 1)},
                               {"account_code", line.account_code},
                               {"posted_lines", std::to_string(PostedLineCount())},
                               {"error", line_error.message}});
            return FailWith(error,
                            line_error.code,
                            LinePrefix(i) + line_error.message);
        }
        line_entry_ids_[i] = result.entry_id;
    }

    status_ = JournalEntryStatus::kPosted;
    posted_by_ = performed_by;
    posted_at_ns_ = ResolveNow(now_);
    JournalPostedCounter()->Increment();
    EmitStructuredLog(runtime_, kApp, "info", "journal_posted",
                      {{"journal_entry_id", journal_entry_id_},
                       {"posting_date", posting_date_.ToString()},
                       {"lines", std::to_string(lines_.size())}});
    return true;
}

bool JournalEntryWorkflow::Void(const std::string& reason,
                                const std::string& performed_by,
                                LedgerError* error) {
    if (!RequireCreated(error)) {
        return false;
    }
    if (status_ == JournalEntryStatus::kVoided) {
        return FailWith(error, LedgerErrorCode::kInvalidState, "Journal entry is already voided");
    }
    if (status_ == JournalEntryStatus::kRejected) {
        return FailWith(error, LedgerErrorCode::kInvalidState, "Cannot void a rejected entry");
    }
    if (status_ == JournalEntryStatus::kPosted) {
        return FailWith(error, LedgerErrorCode::kInvalidState, "Cannot void a Posted entry");
    }
    if (PostedLineCount() > 0) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Cannot void a partially posted entry");
    }
    status_ = JournalEntryStatus::kVoided;
    voided_by_ = performed_by;
    void_reason_ = reason;
    voided_at_ns_ = ResolveNow(now_);
    EmitStructuredLog(runtime_, kApp, "info", "journal_voided",
                      {{"journal_entry_id", journal_entry_id_}, {"reason", reason}});
    return true;
}

bool JournalEntryWorkflow::Reject(const std::string& reason,
                                  const std::string& performed_by,
                                  LedgerError* error) {
    if (!RequireCreated(error)) {
        return false;
    }
    if (reason.empty()) {
        return FailWith(error, LedgerErrorCode::kInvalidArgument, "Rejection reason is required");
    }
    if (status_ == JournalEntryStatus::kPosted) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Cannot reject a posted journal entry; use reverse instead");
    }
    if (status_ != JournalEntryStatus::kDraft && status_ != JournalEntryStatus::kApproved) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Cannot reject a journal entry with status " + ToString(status_));
    }
    if (PostedLineCount() > 0) {
        return FailWith(error,
                        LedgerErrorCode::kInvalidState,
                        "Cannot reject a partially posted entry");
    }
    status_ = JournalEntryStatus::kRejected;
    rejected_by_ = performed_by;
    rejection_reason_ = reason;
    rejected_at_ns_ = ResolveNow(now_);
    EmitStructuredLog(runtime_, kApp, "info", "journal_rejected",
                      {{"journal_entry_id", journal_entry_id_},
                       {"rejected_by", performed_by},
                       {"reason", reason}});
    return true;
}

JournalReconciliation JournalEntryWorkflow::Reconcile(
    const IAccountPostingDirectory& directory) const {
    JournalReconciliation out;
    out.status = status_;
    out.total_lines = lines_.size();
    for (std::size_t i = 0; i < lines_.size(); ++i) {
        std::string entry_id;
        if (!line_entry_ids_[i].empty() || FindPostedEntry(directory, i, &entry_id)) {
            ++out.posted_lines;
        } else {
            out.missing_lines.push_back(static_cast<int>(i + 1));
        }
    }
    if (status_ == JournalEntryStatus::kPosted) {
        out.consistent = out.missing_lines.empty();
    } else {
        out.consistent = out.posted_lines == 0;
    }
    return out;
}

std::string JournalEntryWorkflow::LineReference(std::size_t line_index) {
    return "line-" + std::to_string(line_index + 1);
}

std::size_t JournalEntryWorkflow::PostedLineCount() const {
    return static_cast<std::size_t>(std::count_if(
        line_entry_ids_.begin(), line_entry_ids_.end(), [](const std::string& id) {
            return !id.empty();
        }));
}

bool JournalEntryWorkflow::RequireCreated(LedgerError* error) const {
    if (!created_) {
        return FailWith(error, LedgerErrorCode::kNotFound, "Journal entry does not exist");
    }
    return true;
}

bool JournalEntryWorkflow::FindPostedEntry(const IAccountPostingDirectory& directory,
                                           std::size_t line_index,
                                           std::string* entry_id) const {
    const auto reference_number = LineReference(line_index);
    for (const auto& entry :
         directory.FindEntriesByReference(lines_[line_index].account_code, journal_entry_id_)) {
        if (entry.reference_type == kJournalReferenceType &&
            entry.reference_number == reference_number) {
            *entry_id = entry.entry_id;
            return true;
        }
    }
    return false;
}

}  // namespace ledger_core
