#include "common/types.hpp"
#include "common/errors.hpp"
#include "common/utils.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>

namespace exchange {

namespace {

constexpr uint64_t MAX_WHOLE_UNITS =
    (static_cast<uint64_t>(std::numeric_limits<Price>::max()) - PRICE_SCALE) / PRICE_SCALE;

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

bool iequals(std::string_view a, std::string_view upper) noexcept {
    if (a.size() != upper.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) != upper[i]) return false;
    }
    return true;
}

} // anonymous namespace

Price to_fixed_price(double price) {
    if (!std::isfinite(price)) {
        throw InvalidArgument("price must be finite");
    }

    // |price| == mantissa * 2^shift exactly, mantissa < 2^53
    int exp = 0;
    const double frac = std::frexp(std::fabs(price), &exp);
    const uint64_t mantissa = static_cast<uint64_t>(std::ldexp(frac, 53));
    const uint64_t scaled = mantissa * PRICE_SCALE;   // < 2^60, no overflow
    const int shift = exp - 53;

    uint64_t cents = 0;
    if (shift >= 0) {
        if (shift >= 63 || scaled > (static_cast<uint64_t>(std::numeric_limits<Price>::max()) >> shift)) {
            throw InvalidArgument("price out of range");
        }
        cents = scaled << shift;
    } else if (-shift < 64) {
        const int n = -shift;
        cents = scaled >> n;
        const uint64_t remainder = scaled & ((uint64_t{1} << n) - 1);
        if (remainder >= (uint64_t{1} << (n - 1))) {
            ++cents;  // half-up
        }
    }
    // else: magnitude below 2^-11 cents, rounds to zero

    return price < 0 ? -static_cast<Price>(cents) : static_cast<Price>(cents);
}

Price parse_price(std::string_view text) {
    const std::string_view s = trim(text);
    size_t i = 0;
    bool negative = false;
    if (!s.empty() && (s[0] == '+' || s[0] == '-')) {
        negative = (s[0] == '-');
        ++i;
    }

    uint64_t whole = 0;
    size_t int_digits = 0;
    for (; i < s.size() && is_digit(s[i]); ++i, ++int_digits) {
        whole = whole * 10 + static_cast<uint64_t>(s[i] - '0');
        if (whole > MAX_WHOLE_UNITS) {
            throw InvalidArgument("price out of range: '" + std::string(text) + "'");
        }
    }

    uint64_t cents = 0;
    size_t frac_digits = 0;
    bool round_up = false;
    if (i < s.size() && s[i] == '.') {
        ++i;
        for (; i < s.size() && is_digit(s[i]); ++i, ++frac_digits) {
            const uint64_t d = static_cast<uint64_t>(s[i] - '0');
            if (frac_digits < static_cast<size_t>(PRICE_DECIMALS)) {
                cents = cents * 10 + d;
            } else if (frac_digits == static_cast<size_t>(PRICE_DECIMALS)) {
                // Remainder >= one half iff the first dropped digit is >= 5
                round_up = d >= 5;
            }
        }
    }

    if (i != s.size() || int_digits + frac_digits == 0) {
        throw InvalidArgument("malformed price: '" + std::string(text) + "'");
    }
    if (frac_digits == 1) cents *= 10;

    const Price value = static_cast<Price>(whole * PRICE_SCALE + cents + (round_up ? 1 : 0));
    return negative ? -value : value;
}

Quantity parse_quantity(std::string_view text) {
    const std::string_view s = trim(text);
    Quantity value = 0;
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    auto res = std::from_chars(begin, end, value);
    if (s.empty() || res.ec != std::errc{} || res.ptr != end) {
        throw InvalidArgument("quantity must be a non-negative integer: '" + std::string(text) + "'");
    }
    if (value > MAX_ORDER_QUANTITY) {
        throw InvalidArgument("quantity out of range: '" + std::string(text) + "'");
    }
    return value;
}

std::string format_price(Price price) {
    const bool negative = price < 0;
    const uint64_t magnitude = negative ? 0 - static_cast<uint64_t>(price) : static_cast<uint64_t>(price);
    char buf[32];
    snprintf(buf, sizeof(buf), "%s%llu.%02llu",
             negative ? "-" : "",
             static_cast<unsigned long long>(magnitude / PRICE_SCALE),
             static_cast<unsigned long long>(magnitude % PRICE_SCALE));
    return buf;
}

Side parse_side(std::string_view text) noexcept {
    const std::string_view s = trim(text);
    if (iequals(s, "BUY")) return Side::Buy;
    if (iequals(s, "SELL")) return Side::Sell;
    return Side::Unknown;
}

} // namespace exchange
