#pragma once

#include <cstddef>
#include <string>

#include "ledger_core/contracts/account_event.h"
#include "ledger_core/core/ledger_config.h"
#include "ledger_core/services/account_book.h"

namespace ledger_core {

struct AccountWalReplayStats {
    bool file_opened{false};
    std::size_t lines_total{0};
    std::size_t events_loaded{0};
    // Well-formed lines of another organization or of an unknown event kind.
    std::size_t ignored_lines{0};
    std::size_t parse_errors{0};
    std::size_t state_rejected{0};
};

// Rebuilds an AccountBook from a LocalWalAccountEventSink file. Balances are recomputed
// from the entries; a line whose recorded balance_after disagrees is rejected.
class AccountWalReplayLoader {
public:
    explicit AccountWalReplayLoader(const LedgerRuntimeConfig* runtime = nullptr);

    AccountWalReplayStats Replay(const std::string& wal_path, AccountBook* book) const;

    // Returns false for malformed lines; `known_kind` is false for a well-formed line of
    // an event kind this build does not know.
    static bool ParseEventLine(const std::string& line, AccountEvent* event, bool* known_kind);

private:
    const LedgerRuntimeConfig* runtime_{nullptr};
};

}  // namespace ledger_core
