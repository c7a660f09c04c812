#pragma once

#include "order_book/price_level.hpp"
#include "risk/position_tracker.hpp"
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace exchange {

/// OrderBook: price-time priority matching engine for one symbol.
/// - Bids: descending price (std::greater), then ascending order id
/// - Offers: ascending price, then ascending order id
/// - Trades execute at the resting order's price
/// - Position is tracked for the aggressor side of every trade
///
/// Not thread-safe: add_order runs to completion and must not overlap any
/// other call on the same book.
class OrderBook {
public:
    /// An empty symbol gets a random token of `random_symbol_length` hex chars.
    explicit OrderBook(std::string_view symbol = {},
                       size_t random_symbol_length = DEFAULT_SYMBOL_LENGTH);

    /// Match `order` against the opposite side, then rest any remainder.
    /// Throws SymbolMismatch, UnknownSide, or InvalidArgument (quantity above
    /// MAX_ORDER_QUANTITY) before touching any state.
    /// Returns the trades produced by this call; the view is invalidated by
    /// the next add_order.
    std::span<const Trade> add_order(Order order);

    const std::string& symbol() const noexcept { return symbol_; }

    /// Resting orders in matching priority (best first).
    std::vector<const Order*> bids() const;
    std::vector<const Order*> offers() const;

    /// Top of book, nullptr when the side is empty.
    const Order* best_bid() const noexcept;
    const Order* best_offer() const noexcept;

    /// Resting order with this id, nullptr if not resting.
    const Order* find_order(OrderId id) const noexcept;

    /// Executed trades, oldest first.
    const std::vector<Trade>& trades() const noexcept { return trades_; }

    int64_t position(std::string_view symbol) const noexcept { return positions_.position(symbol); }
    const PositionTracker& positions() const noexcept { return positions_; }

    /// Remaining quantity resting at `price` on `side`, 0 if no such level.
    Quantity depth_at(Side side, Price price) const noexcept;

    /// Stats
    size_t order_count() const noexcept;
    size_t bid_level_count() const noexcept { return bids_.size(); }
    size_t offer_level_count() const noexcept { return offers_.size(); }

    /// Uppercase hex token, e.g. "3FA".
    static std::string random_symbol(size_t length = DEFAULT_SYMBOL_LENGTH);

private:
    template<typename Levels>
    void match_against(Order& incoming, Levels& levels);

    static bool crosses(Side aggressor, Price incoming, Price resting) noexcept;
    void record_trade(const Order& aggressor, const Order& resting, Quantity quantity);
    void add_to_book(Order order);

    std::string symbol_;

    // Price level maps
    std::map<Price, PriceLevel, std::greater<Price>> bids_; // Descending
    std::map<Price, PriceLevel> offers_;                     // Ascending

    std::vector<Trade> trades_;
    PositionTracker positions_;
};

} // namespace exchange
