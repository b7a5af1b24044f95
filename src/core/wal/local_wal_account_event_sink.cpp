#include "ledger_core/core/local_wal_account_event_sink.h"

#include <cctype>
#include <exception>
#include <sstream>
#include <utility>

namespace ledger_core {

LocalWalAccountEventSink::LocalWalAccountEventSink(std::string wal_path)
    : wal_path_(std::move(wal_path)) {
    seq_ = ComputeNextSeq();
    stream_.open(wal_path_, std::ios::app);
}

LocalWalAccountEventSink::~LocalWalAccountEventSink() {
    Flush();
    if (stream_.is_open()) {
        stream_.close();
    }
}

bool LocalWalAccountEventSink::Append(const AccountEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_.is_open()) {
        return false;
    }
    stream_ << FormatEventLine(seq_, event);
    // Durability boundary: the event must reach the file before it is applied.
    stream_.flush();
    if (!stream_.good()) {
        return false;
    }
    ++seq_;
    return true;
}

bool LocalWalAccountEventSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_.is_open()) {
        return false;
    }
    stream_.flush();
    return stream_.good();
}

bool LocalWalAccountEventSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_.is_open();
}

std::uint64_t LocalWalAccountEventSink::next_seq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seq_;
}

std::string LocalWalAccountEventSink::FormatEventLine(std::uint64_t seq, const AccountEvent& event) {
    std::ostringstream oss;
    oss << "{"
        << "\"seq\":" << seq << ","
        << "\"kind\":\"" << ToString(event.kind) << "\","
        << "\"organization_id\":\"" << EscapeJsonString(event.organization_id) << "\","
        << "\"account_id\":\"" << EscapeJsonString(event.account_id) << "\","
        << "\"ts_ns\":" << event.ts_ns << ","
        << "\"performed_by\":\"" << EscapeJsonString(event.performed_by) << "\"";

    switch (event.kind) {
        case AccountEventKind::kCreated:
            oss << ",\"account_code\":\"" << EscapeJsonString(event.account_code) << "\""
                << ",\"name\":\"" << EscapeJsonString(event.name) << "\""
                << ",\"description\":\"" << EscapeJsonString(event.description) << "\""
                << ",\"tax_code\":\"" << EscapeJsonString(event.tax_code) << "\""
                << ",\"account_type\":\"" << ToString(event.account_type) << "\""
                << ",\"currency\":\"" << EscapeJsonString(event.currency) << "\""
                << ",\"is_system_account\":" << (event.is_system_account ? "true" : "false");
            break;
        case AccountEventKind::kDetailsUpdated:
            if (event.has_name) {
                oss << ",\"name\":\"" << EscapeJsonString(event.name) << "\"";
            }
            if (event.has_description) {
                oss << ",\"description\":\"" << EscapeJsonString(event.description) << "\"";
            }
            if (event.has_tax_code) {
                oss << ",\"tax_code\":\"" << EscapeJsonString(event.tax_code) << "\"";
            }
            break;
        case AccountEventKind::kEntryAppended: {
            const auto& entry = event.entry;
            oss << ",\"entry_id\":\"" << EscapeJsonString(entry.entry_id) << "\""
                << ",\"entry_type\":\"" << ToString(entry.type) << "\""
                << ",\"amount\":\"" << entry.amount.ToString() << "\""
                << ",\"balance_effect\":\"" << entry.balance_effect.ToString() << "\""
                << ",\"balance_after\":\"" << entry.balance_after.ToString() << "\""
                << ",\"description\":\"" << EscapeJsonString(entry.description) << "\""
                << ",\"reference_number\":\"" << EscapeJsonString(entry.reference_number) << "\""
                << ",\"reference_type\":\"" << EscapeJsonString(entry.reference_type) << "\""
                << ",\"reference_id\":\"" << EscapeJsonString(entry.reference_id) << "\""
                << ",\"reversed_entry_id\":\"" << EscapeJsonString(entry.reversed_entry_id) << "\""
                << ",\"period_year\":" << entry.period_year
                << ",\"period_month\":" << entry.period_month;
            break;
        }
        case AccountEventKind::kPeriodClosed: {
            const auto& period = event.period;
            oss << ",\"period_year\":" << period.year
                << ",\"period_month\":" << period.month
                << ",\"total_debits\":\"" << period.total_debits.ToString() << "\""
                << ",\"total_credits\":\"" << period.total_credits.ToString() << "\""
                << ",\"closing_balance\":\"" << period.closing_balance.ToString() << "\""
                << ",\"entry_count\":" << period.entry_count;
            break;
        }
        case AccountEventKind::kActivated:
        case AccountEventKind::kDeactivated:
            break;
    }
    oss << "}\n";
    return oss.str();
}

std::string LocalWalAccountEventSink::EscapeJsonString(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (const char ch : input) {
        switch (ch) {
            case '\\':
                out.append("\\\\");
                break;
            case '"':
                out.append("\\\"");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    static constexpr char kHex[] = "0123456789abcdef";
                    const auto code = static_cast<unsigned char>(ch);
                    out.append("\\u00");
                    out.push_back(kHex[code >> 4]);
                    out.push_back(kHex[code & 0x0f]);
                } else {
                    out.push_back(ch);
                }
                break;
        }
    }
    return out;
}

std::uint64_t LocalWalAccountEventSink::ComputeNextSeq() const {
    std::ifstream in(wal_path_);
    if (!in.is_open()) {
        return 0;
    }

    std::uint64_t max_seq = 0;
    std::string line;
    while (std::getline(in, line)) {
        const auto key_pos = line.find("\"seq\":");
        if (key_pos == std::string::npos) {
            continue;
        }
        std::size_t pos = key_pos + 6;
        std::size_t end = pos;
        while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end])) != 0) {
            ++end;
        }
        if (end == pos) {
            continue;
        }
        try {
            const auto parsed = static_cast<std::uint64_t>(std::stoull(line.substr(pos, end - pos)));
            if (parsed >= max_seq) {
                max_seq = parsed + 1;
            }
        } catch (const std::exception&) {
            continue;
        }
    }
    return max_seq;
}

}  // namespace ledger_core
