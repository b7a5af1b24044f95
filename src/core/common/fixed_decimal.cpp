#include "ledger_core/core/fixed_decimal.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace ledger_core {
namespace {

constexpr std::int64_t kMaxUnits = std::numeric_limits<std::int64_t>::max();
// INT64_MIN is excluded so every amount can be negated.
constexpr std::int64_t kMinUnits = -kMaxUnits;

std::int64_t Pow10(int scale) {
    if (scale <= 0) {
        return 1;
    }
    std::int64_t value = 1;
    for (int i = 0; i < scale; ++i) {
        if (value > std::numeric_limits<std::int64_t>::max() / 10) {
            return std::numeric_limits<std::int64_t>::max();
        }
        value *= 10;
    }
    return value;
}

void SetError(std::string* error, const std::string& message) {
    if (error != nullptr) {
        *error = message;
    }
}

}  // namespace

std::string FixedDecimal::Format(std::int64_t scaled_value, int scale, int min_fraction_digits) {
    const int safe_scale = std::max(0, scale);
    const bool negative = scaled_value < 0;
    // Work in unsigned space so INT64_MIN formats correctly.
    const std::uint64_t magnitude = negative
                                        ? static_cast<std::uint64_t>(-(scaled_value + 1)) + 1U
                                        : static_cast<std::uint64_t>(scaled_value);
    const auto divisor = static_cast<std::uint64_t>(Pow10(safe_scale));
    const std::uint64_t whole = magnitude / divisor;
    std::uint64_t fraction = magnitude % divisor;

    std::string fraction_text(static_cast<std::size_t>(safe_scale), '0');
    for (int i = safe_scale - 1; i >= 0; --i) {
        fraction_text[static_cast<std::size_t>(i)] = static_cast<char>('0' + fraction % 10U);
        fraction /= 10U;
    }
    const auto keep = static_cast<std::size_t>(std::clamp(min_fraction_digits, 0, safe_scale));
    while (fraction_text.size() > keep && fraction_text.back() == '0') {
        fraction_text.pop_back();
    }

    std::string out = negative ? "-" : "";
    out += std::to_string(whole);
    if (!fraction_text.empty()) {
        out += "." + fraction_text;
    }
    return out;
}

bool Amount::Parse(const std::string& text, Amount* out, std::string* error) {
    if (out == nullptr) {
        SetError(error, "output amount pointer is null");
        return false;
    }
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::uint64_t whole = 0;
    std::size_t whole_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
        whole = whole * 10U + static_cast<std::uint64_t>(text[pos] - '0');
        if (whole > static_cast<std::uint64_t>(kMaxUnits / kUnitsPerWhole)) {
            SetError(error, "amount out of range: " + text);
            return false;
        }
        ++whole_digits;
        ++pos;
    }

    std::uint64_t fraction = 0;
    std::size_t fraction_digits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            if (fraction_digits == static_cast<std::size_t>(kScale)) {
                SetError(error, "amount has more than 4 fractional digits: " + text);
                return false;
            }
            fraction = fraction * 10U + static_cast<std::uint64_t>(text[pos] - '0');
            ++fraction_digits;
            ++pos;
        }
    }
    if (pos != text.size() || (whole_digits == 0 && fraction_digits == 0)) {
        SetError(error, "invalid amount: " + text);
        return false;
    }
    for (std::size_t i = fraction_digits; i < static_cast<std::size_t>(kScale); ++i) {
        fraction *= 10U;
    }

    const std::uint64_t magnitude = whole * static_cast<std::uint64_t>(kUnitsPerWhole) + fraction;
    if (magnitude > static_cast<std::uint64_t>(kMaxUnits)) {
        SetError(error, "amount out of range: " + text);
        return false;
    }
    const auto units = static_cast<std::int64_t>(magnitude);
    *out = Amount(negative ? -units : units);
    return true;
}

bool Amount::CheckedAdd(Amount lhs, Amount rhs, Amount* out) {
    if ((rhs.units_ > 0 && lhs.units_ > kMaxUnits - rhs.units_) ||
        (rhs.units_ < 0 && lhs.units_ < kMinUnits - rhs.units_)) {
        return false;
    }
    *out = Amount(lhs.units_ + rhs.units_);
    return true;
}

bool Amount::CheckedSub(Amount lhs, Amount rhs, Amount* out) {
    return CheckedAdd(lhs, rhs.Negated(), out);
}

std::string Amount::ToString() const {
    return FixedDecimal::Format(units_, kScale, /*min_fraction_digits=*/2);
}

}  // namespace ledger_core
