#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

#include "ledger_core/interfaces/account_event_sink.h"

namespace ledger_core {

// Appends one JSON object per account event to a local file. `seq` continues from the
// highest sequence already present in the file.
class LocalWalAccountEventSink : public IAccountEventSink {
public:
    explicit LocalWalAccountEventSink(std::string wal_path);
    ~LocalWalAccountEventSink() override;

    bool Append(const AccountEvent& event) override;
    bool Flush() override;

    bool IsOpen() const;
    std::uint64_t next_seq() const;

    static std::string FormatEventLine(std::uint64_t seq, const AccountEvent& event);
    static std::string EscapeJsonString(const std::string& input);

private:
    std::uint64_t ComputeNextSeq() const;

    std::string wal_path_;
    mutable std::mutex mutex_;
    std::ofstream stream_;
    std::uint64_t seq_{0};
};

}  // namespace ledger_core
