#pragma once

#include "order_book/order_book.hpp"
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace exchange {

/// Append-only list of non-owning book references, in registration order.
/// Read-only aggregation (reporting) walks it; it never mutates a book.
class BookRegistry {
public:
    void register_book(const OrderBook& book) { books_.push_back(&book); }

    const std::vector<const OrderBook*>& books() const noexcept { return books_; }
    size_t size() const noexcept { return books_.size(); }
    bool empty() const noexcept { return books_.empty(); }

    auto begin() const noexcept { return books_.begin(); }
    auto end() const noexcept { return books_.end(); }

private:
    std::vector<const OrderBook*> books_;
};

/// Top-level context: owns the books it creates, registers each in its
/// BookRegistry, and hands out order ids from one sequence per symbol.
class Session {
public:
    explicit Session(size_t random_symbol_length = DEFAULT_SYMBOL_LENGTH);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Create and register a book. Empty symbol -> random token.
    /// The reference stays valid for the lifetime of the session.
    OrderBook& create_book(std::string_view symbol = {});

    /// First book created for `symbol` (case-insensitive), or nullptr.
    OrderBook* find_book(std::string_view symbol);
    const OrderBook* find_book(std::string_view symbol) const;

    /// Build an order with the next id of that symbol's sequence (1, 2, ...).
    Order make_order(std::string_view symbol, Side side, Price price, Quantity quantity);
    Order make_order(std::string_view symbol, std::string_view side, Price price, Quantity quantity);

    /// Take the next id for `symbol`. Explicit ids never advance the sequence.
    OrderId next_order_id(std::string_view symbol);

    const BookRegistry& registry() const noexcept { return registry_; }
    size_t book_count() const noexcept { return books_.size(); }

private:
    size_t random_symbol_length_;
    std::deque<OrderBook> books_;   // deque: stable addresses on push_back
    BookRegistry registry_;
    std::unordered_map<std::string, OrderId> sequences_;  // symbol -> next id
};

/// Submit `orders` to `book` one at a time, in sequence order. The first
/// rejection propagates; orders before it stay applied. Returns the number of
/// trades produced.
size_t send_orders(OrderBook& book, std::vector<Order> orders);

} // namespace exchange
