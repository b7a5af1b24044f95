#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ledger_core/common/timestamp.h"
#include "ledger_core/contracts/types.h"
#include "ledger_core/core/fixed_decimal.h"
#include "ledger_core/core/ledger_config.h"
#include "ledger_core/interfaces/account_posting_directory.h"
#include "ledger_core/interfaces/chart_of_accounts.h"
#include "ledger_core/interfaces/posting_gate.h"

namespace ledger_core {

struct JournalLine {
    std::string account_code;
    Amount debit;
    Amount credit;
    std::string description;
};

struct CreateJournalEntryRequest {
    std::string organization_id;
    std::string journal_entry_id;
    CivilDate posting_date;
    std::vector<JournalLine> lines;
    std::string memo;
    std::string reference;
    std::string performed_by;
};

struct JournalReconciliation {
    JournalEntryStatus status{JournalEntryStatus::kDraft};
    std::size_t total_lines{0};
    std::size_t posted_lines{0};
    // 1-based line numbers without a ledger entry.
    std::vector<int> missing_lines;
    // False when the status disagrees with the ledger postings (partial saga).
    bool consistent{true};
};

// A compound journal entry: Draft -> Approved -> Posted, or Voided/Rejected before posting.
//
// Posting fans out one account posting per line. Each posting commits on its own; the
// workflow keeps a per-line acknowledgement and Post() may be retried after a failure, it
// skips lines whose ledger entry already exists.
class JournalEntryWorkflow {
public:
    explicit JournalEntryWorkflow(NowFn now = {}, const LedgerRuntimeConfig* runtime = nullptr);

    bool Create(const CreateJournalEntryRequest& request,
                const IChartOfAccounts* chart,
                LedgerError* error);
    bool Approve(const std::string& performed_by, LedgerError* error);
    bool Post(const std::string& performed_by,
              IAccountPostingDirectory& directory,
              const IPostingGate* gate,
              LedgerError* error);
    bool Void(const std::string& reason, const std::string& performed_by, LedgerError* error);
    // Reviewer refusal of a Draft or Approved entry. Posted entries are reversed instead.
    bool Reject(const std::string& reason, const std::string& performed_by, LedgerError* error);

    JournalReconciliation Reconcile(const IAccountPostingDirectory& directory) const;

    // Reference number stamped on the ledger entry of line `line_index` (0-based).
    static std::string LineReference(std::size_t line_index);

    bool IsCreated() const { return created_; }
    const std::string& journal_entry_id() const { return journal_entry_id_; }
    const std::string& organization_id() const { return organization_id_; }
    JournalEntryStatus status() const { return status_; }
    const CivilDate& posting_date() const { return posting_date_; }
    const std::vector<JournalLine>& lines() const { return lines_; }
    const std::string& memo() const { return memo_; }
    const std::string& reference() const { return reference_; }
    Amount total_debits() const { return total_debits_; }
    Amount total_credits() const { return total_credits_; }
    const std::string& created_by() const { return created_by_; }
    EpochNanos created_at_ns() const { return created_at_ns_; }
    const std::string& approved_by() const { return approved_by_; }
    EpochNanos approved_at_ns() const { return approved_at_ns_; }
    const std::string& posted_by() const { return posted_by_; }
    EpochNanos posted_at_ns() const { return posted_at_ns_; }
    const std::string& voided_by() const { return voided_by_; }
    const std::string& void_reason() const { return void_reason_; }
    const std::string& rejected_by() const { return rejected_by_; }
    const std::string& rejection_reason() const { return rejection_reason_; }
    EpochNanos rejected_at_ns() const { return rejected_at_ns_; }
    // Ledger entry id per line; empty until the line is posted.
    const std::vector<std::string>& line_entry_ids() const { return line_entry_ids_; }
    std::size_t PostedLineCount() const;

private:
    bool RequireCreated(LedgerError* error) const;
    bool FindPostedEntry(const IAccountPostingDirectory& directory,
                         std::size_t line_index,
                         std::string* entry_id) const;

    NowFn now_;
    const LedgerRuntimeConfig* runtime_{nullptr};

    bool created_{false};
    std::string journal_entry_id_;
    std::string organization_id_;
    CivilDate posting_date_;
    std::vector<JournalLine> lines_;
    std::string memo_;
    std::string reference_;
    JournalEntryStatus status_{JournalEntryStatus::kDraft};
    Amount total_debits_;
    Amount total_credits_;
    std::string created_by_;
    EpochNanos created_at_ns_{0};
    std::string approved_by_;
    EpochNanos approved_at_ns_{0};
    std::string posted_by_;
    EpochNanos posted_at_ns_{0};
    std::string voided_by_;
    std::string void_reason_;
    EpochNanos voided_at_ns_{0};
    std::string rejected_by_;
    std::string rejection_reason_;
    EpochNanos rejected_at_ns_{0};
    std::vector<std::string> line_entry_ids_;
};

}  // namespace ledger_core
