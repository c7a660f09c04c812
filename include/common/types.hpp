#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>

namespace exchange {

// Core type aliases
using Price = int64_t;          // Fixed-point: 150.50 stored as 15050 (2 decimal places)
using Quantity = uint64_t;
using OrderId = uint64_t;
using Timestamp = uint64_t;     // Nanoseconds, monotonic clock

// Constants
constexpr int PRICE_SCALE = 100;    // 2 decimal places
constexpr int PRICE_DECIMALS = 2;
constexpr size_t DEFAULT_SYMBOL_LENGTH = 3;
constexpr size_t MAX_SYMBOL_LENGTH = 32;
constexpr Quantity MAX_ORDER_QUANTITY = 1'000'000'000'000;  // Per order

// Enums
enum class Side : uint8_t {
    Buy = 0,
    Sell = 1,
    Unknown = 0xFF  // Anything that did not parse as BUY or SELL; rejected by the book
};

/// One execution between an aggressor and a resting order.
/// Immutable once appended to a book's trade ledger.
struct Trade {
    std::string symbol;
    OrderId buy_order_id;
    OrderId sell_order_id;
    Price price;            // Always the resting order's price
    Quantity quantity;
};

// Helper functions

/// Exact half-up (away from zero) rounding of the binary value of `price`
/// to 2 decimals. Throws InvalidArgument for NaN/inf or out-of-range input.
Price to_fixed_price(double price);

/// Parse a plain decimal ("99", "-1.005", "+100.50") exactly, rounding
/// half-up to 2 decimals. Throws InvalidArgument on malformed input.
Price parse_price(std::string_view text);

/// Parse a non-negative integer quantity up to MAX_ORDER_QUANTITY. Throws
/// InvalidArgument otherwise.
Quantity parse_quantity(std::string_view text);

/// "99.00", "-0.05"
std::string format_price(Price price);

/// Case-insensitive; anything other than BUY/SELL maps to Side::Unknown.
Side parse_side(std::string_view text) noexcept;

constexpr const char* side_name(Side side) noexcept {
    switch (side) {
        case Side::Buy:  return "BUY";
        case Side::Sell: return "SELL";
        default:         return "UNKNOWN";
    }
}

constexpr bool is_valid_side(Side side) noexcept {
    return side == Side::Buy || side == Side::Sell;
}

constexpr Side opposite_side(Side s) noexcept {
    return s == Side::Buy ? Side::Sell : Side::Buy;
}

inline Timestamp now_ns() noexcept {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<Timestamp>(ts.tv_sec) * 1'000'000'000ULL + static_cast<Timestamp>(ts.tv_nsec);
}

} // namespace exchange
