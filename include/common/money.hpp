#pragma once

#include <cstdint>
#include <string>

namespace settle {

/**
 * Integer division rounded half-to-even. Denominator must be non-zero.
 */
int64_t div_round_half_even(__int128 numerator, __int128 denominator);

class Price;

/**
 * Fixed-point money amount in micro-units (1e-6) of the settlement currency.
 * All arithmetic is exact; the only rounding happens in the explicit
 * scaling helpers, which round half-to-even.
 */
class Amount {
public:
    static constexpr int64_t kScale = 1'000'000;
    static constexpr int kDecimals = 6;

    constexpr Amount() = default;

    static constexpr Amount from_micros(int64_t micros) { return Amount(micros); }
    // Throws InvalidAmountError when units * kScale does not fit in int64.
    static Amount from_units(int64_t units);
    static constexpr Amount zero() { return Amount(0); }

    // Parses "100", "88.5", "-0.000001". Throws InvalidAmountError on bad input
    // or more than kDecimals fractional digits.
    static Amount parse(const std::string& text);

    // Nearest representable amount; for config and JSON numbers only.
    static Amount from_double(double value);

    constexpr int64_t micros() const { return micros_; }
    double to_double() const { return static_cast<double>(micros_) / static_cast<double>(kScale); }

    // Canonical decimal, trailing zeros trimmed to at least two places: "88.00", "0.125".
    std::string to_string() const;

    constexpr bool is_positive() const { return micros_ > 0; }
    constexpr bool is_zero() const { return micros_ == 0; }
    constexpr bool is_negative() const { return micros_ < 0; }

    // amount * bps / 10000, half-even.
    Amount mul_bps(int64_t bps) const;

    // amount / price, half-even. Price must be positive.
    Amount div_price(const Price& price) const;

    Amount operator+(Amount other) const;
    Amount operator-(Amount other) const;
    Amount& operator+=(Amount other);
    Amount& operator-=(Amount other);
    Amount operator-() const { return Amount(-micros_); }

    constexpr bool operator==(const Amount& other) const { return micros_ == other.micros_; }
    constexpr bool operator!=(const Amount& other) const { return micros_ != other.micros_; }
    constexpr bool operator<(const Amount& other) const { return micros_ < other.micros_; }
    constexpr bool operator<=(const Amount& other) const { return micros_ <= other.micros_; }
    constexpr bool operator>(const Amount& other) const { return micros_ > other.micros_; }
    constexpr bool operator>=(const Amount& other) const { return micros_ >= other.micros_; }

private:
    constexpr explicit Amount(int64_t micros) : micros_(micros) {}

    int64_t micros_{0};
};

/**
 * Implied probability in nano-units (1e-9). A market price is always
 * strictly inside (0, 1).
 */
class Price {
public:
    static constexpr int64_t kScale = 1'000'000'000;
    static constexpr int kDecimals = 9;

    constexpr Price() = default;

    static constexpr Price from_nanos(int64_t nanos) { return Price(nanos); }
    static constexpr Price one() { return Price(kScale); }

    // numerator / denominator, half-even, clamped to [1, kScale - 1] nanos.
    static Price from_ratio(Amount numerator, Amount denominator);

    static Price parse(const std::string& text);
    static Price from_double(double value);

    constexpr int64_t nanos() const { return nanos_; }
    double to_double() const { return static_cast<double>(nanos_) / static_cast<double>(kScale); }
    std::string to_string() const;

    // 1 - price, exact.
    constexpr Price complement() const { return Price(kScale - nanos_); }

    constexpr bool is_valid_probability() const { return nanos_ > 0 && nanos_ < kScale; }

    constexpr bool operator==(const Price& other) const { return nanos_ == other.nanos_; }
    constexpr bool operator!=(const Price& other) const { return nanos_ != other.nanos_; }
    constexpr bool operator<(const Price& other) const { return nanos_ < other.nanos_; }
    constexpr bool operator>(const Price& other) const { return nanos_ > other.nanos_; }

private:
    constexpr explicit Price(int64_t nanos) : nanos_(nanos) {}

    int64_t nanos_{0};
};

} // namespace settle
