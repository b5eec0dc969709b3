#include "common/money.hpp"
#include "common/errors.hpp"
#include <fmt/format.h>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace settle {

namespace {

constexpr __int128 kInt64Max = std::numeric_limits<int64_t>::max();
constexpr __int128 kInt64Min = std::numeric_limits<int64_t>::min();

int64_t checked_narrow(__int128 value, const char* what) {
    if (value > kInt64Max || value < kInt64Min) {
        throw std::overflow_error(std::string(what) + " out of range");
    }
    return static_cast<int64_t>(value);
}

// Parses a signed decimal into an integer count of 10^-decimals units.
int64_t parse_fixed(const std::string& input, int decimals, const char* what) {
    size_t begin = 0;
    size_t end = input.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(input[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1]))) end--;

    if (begin == end) {
        throw InvalidAmountError(fmt::format("Empty {}", what));
    }

    bool negative = false;
    if (input[begin] == '-' || input[begin] == '+') {
        negative = input[begin] == '-';
        begin++;
    }

    __int128 whole = 0;
    __int128 frac = 0;
    int frac_digits = 0;
    bool seen_digit = false;
    bool seen_dot = false;

    for (size_t i = begin; i < end; i++) {
        char c = input[i];
        if (c == '.') {
            if (seen_dot) {
                throw InvalidAmountError(fmt::format("Malformed {}: '{}'", what, input));
            }
            seen_dot = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw InvalidAmountError(fmt::format("Malformed {}: '{}'", what, input));
        }
        seen_digit = true;
        if (seen_dot) {
            if (++frac_digits > decimals) {
                throw InvalidAmountError(fmt::format(
                    "{} '{}' has more than {} decimal places", what, input, decimals));
            }
            frac = frac * 10 + (c - '0');
        } else {
            whole = whole * 10 + (c - '0');
            if (whole > kInt64Max) {
                throw InvalidAmountError(fmt::format("{} '{}' out of range", what, input));
            }
        }
    }

    if (!seen_digit) {
        throw InvalidAmountError(fmt::format("Malformed {}: '{}'", what, input));
    }

    __int128 scale = 1;
    for (int i = 0; i < decimals; i++) scale *= 10;
    for (int i = frac_digits; i < decimals; i++) frac *= 10;

    __int128 value = whole * scale + frac;
    if (negative) value = -value;
    if (value > kInt64Max || value < kInt64Min) {
        throw InvalidAmountError(fmt::format("{} '{}' out of range", what, input));
    }
    return static_cast<int64_t>(value);
}

std::string format_fixed(int64_t raw, int64_t scale, int decimals, int min_decimals) {
    __int128 value = raw;
    bool negative = value < 0;
    if (negative) value = -value;

    auto whole = static_cast<unsigned long long>(value / scale);
    auto frac = static_cast<unsigned long long>(value % scale);

    std::string frac_str = fmt::format("{:0{}d}", frac, decimals);
    while (static_cast<int>(frac_str.size()) > min_decimals && frac_str.back() == '0') {
        frac_str.pop_back();
    }

    return fmt::format("{}{}.{}", negative ? "-" : "", whole, frac_str);
}

} // namespace

int64_t div_round_half_even(__int128 numerator, __int128 denominator) {
    if (denominator == 0) {
        throw std::domain_error("Division by zero");
    }
    if (denominator < 0) {
        numerator = -numerator;
        denominator = -denominator;
    }

    __int128 quotient = numerator / denominator;
    __int128 remainder = numerator % denominator;
    __int128 twice = (remainder < 0 ? -remainder : remainder) * 2;

    if (twice > denominator || (twice == denominator && quotient % 2 != 0)) {
        quotient += numerator < 0 ? -1 : 1;
    }

    return checked_narrow(quotient, "Quotient");
}

// ============================================================================
// Amount
// ============================================================================

Amount Amount::parse(const std::string& text) {
    return Amount(parse_fixed(text, kDecimals, "amount"));
}

Amount Amount::from_units(int64_t units) {
    __int128 micros = static_cast<__int128>(units) * kScale;
    if (micros > kInt64Max || micros < kInt64Min) {
        throw InvalidAmountError(fmt::format("Amount of {} units out of range", units));
    }
    return Amount(static_cast<int64_t>(micros));
}

Amount Amount::from_double(double value) {
    if (!std::isfinite(value)) {
        throw InvalidAmountError("Amount must be finite");
    }
    double scaled = std::round(value * static_cast<double>(kScale));
    if (scaled >= 9.2e18 || scaled <= -9.2e18) {
        throw InvalidAmountError("Amount out of range");
    }
    return Amount(static_cast<int64_t>(scaled));
}

std::string Amount::to_string() const {
    return format_fixed(micros_, kScale, kDecimals, 2);
}

Amount Amount::mul_bps(int64_t bps) const {
    return Amount(div_round_half_even(static_cast<__int128>(micros_) * bps, 10'000));
}

Amount Amount::div_price(const Price& price) const {
    if (price.nanos() <= 0) {
        throw std::domain_error("Price must be positive");
    }
    __int128 numerator = static_cast<__int128>(micros_) * Price::kScale;
    return Amount(div_round_half_even(numerator, price.nanos()));
}

Amount Amount::operator+(Amount other) const {
    return Amount(checked_narrow(static_cast<__int128>(micros_) + other.micros_, "Amount"));
}

Amount Amount::operator-(Amount other) const {
    return Amount(checked_narrow(static_cast<__int128>(micros_) - other.micros_, "Amount"));
}

Amount& Amount::operator+=(Amount other) {
    *this = *this + other;
    return *this;
}

Amount& Amount::operator-=(Amount other) {
    *this = *this - other;
    return *this;
}

// ============================================================================
// Price
// ============================================================================

Price Price::from_ratio(Amount numerator, Amount denominator) {
    if (denominator.micros() <= 0 || numerator.micros() < 0) {
        throw std::domain_error("Price ratio requires a non-negative numerator and positive denominator");
    }
    int64_t nanos = div_round_half_even(
        static_cast<__int128>(numerator.micros()) * kScale, denominator.micros());

    if (nanos < 1) nanos = 1;
    if (nanos > kScale - 1) nanos = kScale - 1;
    return Price(nanos);
}

Price Price::parse(const std::string& text) {
    return Price(parse_fixed(text, kDecimals, "price"));
}

Price Price::from_double(double value) {
    return Price(static_cast<int64_t>(std::llround(value * static_cast<double>(kScale))));
}

std::string Price::to_string() const {
    return format_fixed(nanos_, kScale, kDecimals, 1);
}

} // namespace settle
