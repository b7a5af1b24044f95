#include "ledger_core/core/account_wal_replay_loader.h"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

#include "ledger_core/core/structured_log.h"

namespace ledger_core {

namespace {

constexpr const char* kApp = "account_wal_replay";

std::string Trim(const std::string& text) {
    std::size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool ExtractRawValue(const std::string& line, const std::string& key, std::string* raw_value) {
    const std::string marker = "\"" + key + "\":";
    const auto marker_pos = line.find(marker);
    if (marker_pos == std::string::npos) {
        return false;
    }

    std::size_t pos = marker_pos + marker.size();
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])) != 0) {
        ++pos;
    }
    if (pos >= line.size()) {
        return false;
    }

    if (line[pos] == '"') {
        ++pos;
        std::size_t end = pos;
        bool escaped = false;
        while (end < line.size()) {
            const char ch = line[end];
            if (escaped) {
                escaped = false;
            } else if (ch == '\\') {
                escaped = true;
            } else if (ch == '"') {
                break;
            }
            ++end;
        }
        if (end >= line.size() || line[end] != '"') {
            return false;
        }
        *raw_value = line.substr(pos, end - pos);
        return true;
    }

    std::size_t end = pos;
    while (end < line.size() && line[end] != ',' && line[end] != '}') {
        ++end;
    }
    *raw_value = Trim(line.substr(pos, end - pos));
    return !raw_value->empty();
}

bool ParseHex4(const std::string& raw, std::size_t pos, unsigned int* code) {
    if (pos + 4 > raw.size()) {
        return false;
    }
    unsigned int value = 0;
    for (std::size_t i = pos; i < pos + 4; ++i) {
        const char ch = raw[i];
        value <<= 4;
        if (ch >= '0' && ch <= '9') {
            value |= static_cast<unsigned int>(ch - '0');
        } else if (ch >= 'a' && ch <= 'f') {
            value |= static_cast<unsigned int>(ch - 'a' + 10);
        } else if (ch >= 'A' && ch <= 'F') {
            value |= static_cast<unsigned int>(ch - 'A' + 10);
        } else {
            return false;
        }
    }
    *code = value;
    return true;
}

// BMP code point as UTF-8.
void AppendUtf8(unsigned int code, std::string* out) {
    if (code < 0x80) {
        out->push_back(static_cast<char>(code));
    } else if (code < 0x800) {
        out->push_back(static_cast<char>(0xc0 | (code >> 6)));
        out->push_back(static_cast<char>(0x80 | (code & 0x3f)));
    } else {
        out->push_back(static_cast<char>(0xe0 | (code >> 12)));
        out->push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3f)));
        out->push_back(static_cast<char>(0x80 | (code & 0x3f)));
    }
}

std::string UnescapeJsonString(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const char ch = raw[i];
        if (ch != '\\' || i + 1 >= raw.size()) {
            out.push_back(ch);
            continue;
        }
        const char next = raw[++i];
        switch (next) {
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u': {
                unsigned int code = 0;
                if (ParseHex4(raw, i + 1, &code)) {
                    AppendUtf8(code, &out);
                    i += 4;
                } else {
                    out.push_back(next);
                }
                break;
            }
            default:
                out.push_back(next);
                break;
        }
    }
    return out;
}

bool ParseInt64Field(const std::string& line, const std::string& key, std::int64_t* value) {
    std::string raw;
    if (!ExtractRawValue(line, key, &raw)) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(raw, &consumed);
        if (consumed != raw.size()) {
            return false;
        }
        *value = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool ParseIntField(const std::string& line, const std::string& key, int* value) {
    std::int64_t parsed = 0;
    if (!ParseInt64Field(line, key, &parsed)) {
        return false;
    }
    *value = static_cast<int>(parsed);
    return true;
}

bool ParseStringField(const std::string& line, const std::string& key, std::string* value) {
    std::string raw;
    if (!ExtractRawValue(line, key, &raw)) {
        return false;
    }
    *value = UnescapeJsonString(raw);
    return true;
}

bool ParseAmountField(const std::string& line, const std::string& key, Amount* value) {
    std::string raw;
    if (!ExtractRawValue(line, key, &raw)) {
        return false;
    }
    return Amount::Parse(raw, value, nullptr);
}

bool ParseBoolField(const std::string& line, const std::string& key, bool* value) {
    std::string raw;
    if (!ExtractRawValue(line, key, &raw)) {
        return false;
    }
    if (raw == "true") {
        *value = true;
        return true;
    }
    if (raw == "false") {
        *value = false;
        return true;
    }
    return false;
}

bool ParseCreated(const std::string& line, AccountEvent* event) {
    std::string account_type;
    if (!ParseStringField(line, "account_code", &event->account_code) ||
        !ParseStringField(line, "account_type", &account_type) ||
        !ParseAccountType(account_type, &event->account_type)) {
        return false;
    }
    (void)ParseStringField(line, "name", &event->name);
    (void)ParseStringField(line, "description", &event->description);
    (void)ParseStringField(line, "tax_code", &event->tax_code);
    (void)ParseStringField(line, "currency", &event->currency);
    (void)ParseBoolField(line, "is_system_account", &event->is_system_account);
    return true;
}

bool ParseEntry(const std::string& line, AccountEvent* event) {
    auto& entry = event->entry;
    std::string entry_type;
    if (!ParseStringField(line, "entry_id", &entry.entry_id) ||
        !ParseStringField(line, "entry_type", &entry_type) ||
        !ParseLedgerEntryType(entry_type, &entry.type) ||
        !ParseAmountField(line, "amount", &entry.amount) ||
        !ParseAmountField(line, "balance_effect", &entry.balance_effect) ||
        !ParseAmountField(line, "balance_after", &entry.balance_after)) {
        return false;
    }
    (void)ParseStringField(line, "description", &entry.description);
    (void)ParseStringField(line, "reference_number", &entry.reference_number);
    (void)ParseStringField(line, "reference_type", &entry.reference_type);
    (void)ParseStringField(line, "reference_id", &entry.reference_id);
    (void)ParseStringField(line, "reversed_entry_id", &entry.reversed_entry_id);
    (void)ParseIntField(line, "period_year", &entry.period_year);
    (void)ParseIntField(line, "period_month", &entry.period_month);
    entry.performed_by = event->performed_by;
    entry.ts_ns = event->ts_ns;
    entry.status = LedgerEntryStatus::kPosted;
    return true;
}

bool ParsePeriodClosed(const std::string& line, AccountEvent* event) {
    auto& period = event->period;
    if (!ParseIntField(line, "period_year", &period.year) ||
        !ParseIntField(line, "period_month", &period.month) ||
        !ParseAmountField(line, "total_debits", &period.total_debits) ||
        !ParseAmountField(line, "total_credits", &period.total_credits) ||
        !ParseAmountField(line, "closing_balance", &period.closing_balance)) {
        return false;
    }
    (void)ParseIntField(line, "entry_count", &period.entry_count);
    period.closed_by = event->performed_by;
    period.closed_at_ns = event->ts_ns;
    return true;
}

}  // namespace

AccountWalReplayLoader::AccountWalReplayLoader(const LedgerRuntimeConfig* runtime)
    : runtime_(runtime) {}

bool AccountWalReplayLoader::ParseEventLine(const std::string& line,
                                            AccountEvent* event,
                                            bool* known_kind) {
    *known_kind = true;
    std::string kind;
    std::int64_t ts_ns = 0;
    if (!ParseStringField(line, "kind", &kind) ||
        !ParseStringField(line, "organization_id", &event->organization_id) ||
        !ParseStringField(line, "account_id", &event->account_id) ||
        !ParseInt64Field(line, "ts_ns", &ts_ns)) {
        return false;
    }
    if (!ParseAccountEventKind(kind, &event->kind)) {
        *known_kind = false;
        return true;
    }
    event->ts_ns = ts_ns;
    (void)ParseStringField(line, "performed_by", &event->performed_by);

    switch (event->kind) {
        case AccountEventKind::kCreated:
            return ParseCreated(line, event);
        case AccountEventKind::kEntryAppended:
            return ParseEntry(line, event);
        case AccountEventKind::kPeriodClosed:
            return ParsePeriodClosed(line, event);
        case AccountEventKind::kDetailsUpdated:
            event->has_name = ParseStringField(line, "name", &event->name);
            event->has_description = ParseStringField(line, "description", &event->description);
            event->has_tax_code = ParseStringField(line, "tax_code", &event->tax_code);
            return true;
        case AccountEventKind::kActivated:
        case AccountEventKind::kDeactivated:
            return true;
    }
    return false;
}

AccountWalReplayStats AccountWalReplayLoader::Replay(const std::string& wal_path,
                                                     AccountBook* book) const {
    AccountWalReplayStats stats;

    std::ifstream stream(wal_path);
    if (!stream.is_open()) {
        EmitStructuredLog(runtime_, kApp, "warn", "wal_open_failed", {{"path", wal_path}});
        return stats;
    }
    stats.file_opened = true;

    std::string line;
    while (std::getline(stream, line)) {
        if (Trim(line).empty()) {
            continue;
        }

        ++stats.lines_total;
        AccountEvent event;
        bool known_kind = true;
        if (!ParseEventLine(line, &event, &known_kind)) {
            ++stats.parse_errors;
            continue;
        }
        if (!known_kind || book == nullptr || event.organization_id != book->organization_id()) {
            ++stats.ignored_lines;
            continue;
        }
        ++stats.events_loaded;

        LedgerError error;
        if (!book->ApplyEvent(event, &error)) {
            ++stats.state_rejected;
            EmitStructuredLog(runtime_, kApp, "warn", "event_rejected",
                              {{"account_id", event.account_id},
                               {"kind", ToString(event.kind)},
                               {"code", LedgerErrorCodeName(error.code)},
                               {"error", error.message}});
        }
    }

    EmitStructuredLog(runtime_, kApp, "info", "replay_completed",
                      {{"path", wal_path},
                       {"lines", std::to_string(stats.lines_total)},
                       {"events", std::to_string(stats.events_loaded)},
                       {"ignored", std::to_string(stats.ignored_lines)},
                       {"parse_errors", std::to_string(stats.parse_errors)},
                       {"state_rejected", std::to_string(stats.state_rejected)}});
    return stats;
}

}  // namespace ledger_core
