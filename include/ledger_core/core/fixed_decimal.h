#pragma once

#include <cstdint>
#include <string>

namespace ledger_core {

class FixedDecimal {
public:
    static std::string Format(std::int64_t scaled_value, int scale, int min_fraction_digits);
};

// Signed money amount with four fractional digits held as an exact int64 count of units.
class Amount {
public:
    static constexpr int kScale = 4;
    static constexpr std::int64_t kUnitsPerWhole = 10'000;

    Amount() = default;

    static Amount FromUnits(std::int64_t units) { return Amount(units); }
    static Amount FromInteger(std::int64_t whole) { return Amount(whole * kUnitsPerWhole); }
    // Accepts "-12", "12.5", "+0.0001"; more than four fractional digits is an error.
    static bool Parse(const std::string& text, Amount* out, std::string* error);

    static bool CheckedAdd(Amount lhs, Amount rhs, Amount* out);
    static bool CheckedSub(Amount lhs, Amount rhs, Amount* out);

    std::int64_t units() const { return units_; }
    std::string ToString() const;

    bool IsZero() const { return units_ == 0; }
    bool IsPositive() const { return units_ > 0; }
    bool IsNegative() const { return units_ < 0; }
    Amount Negated() const { return Amount(-units_); }
    Amount Abs() const { return units_ < 0 ? Amount(-units_) : *this; }

    bool operator==(const Amount& other) const { return units_ == other.units_; }
    bool operator!=(const Amount& other) const { return units_ != other.units_; }
    bool operator<(const Amount& other) const { return units_ < other.units_; }
    bool operator<=(const Amount& other) const { return units_ <= other.units_; }
    bool operator>(const Amount& other) const { return units_ > other.units_; }
    bool operator>=(const Amount& other) const { return units_ >= other.units_; }

private:
    explicit Amount(std::int64_t units) : units_(units) {}

    std::int64_t units_{0};
};

}  // namespace ledger_core
