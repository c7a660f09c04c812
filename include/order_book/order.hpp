#pragma once

#include "common/types.hpp"
#include <string>
#include <string_view>

namespace exchange {

/// Order: one side's intent at one price.
/// Identity (id, symbol, side, price, original quantity) is fixed at
/// construction; only the remaining quantity changes, and only downwards
/// through execute().
class Order {
public:
    Order(OrderId id, std::string_view symbol, Side side, Price price, Quantity quantity);

    /// Side given as text ("buy", "SELL", ...). Unrecognized text yields
    /// Side::Unknown; the book rejects such orders on submission.
    Order(OrderId id, std::string_view symbol, std::string_view side, Price price, Quantity quantity);

    /// All fields as text, e.g. from a script line. Throws InvalidArgument
    /// for a malformed price or quantity.
    static Order from_text(OrderId id, std::string_view symbol, std::string_view side,
                           std::string_view price, std::string_view quantity);

    /// Execute up to `exec_quantity` against this order and return the amount
    /// actually applied (capped at what remains). Throws InvalidArgument if
    /// `exec_quantity` is zero; nothing is modified in that case.
    Quantity execute(Quantity exec_quantity);

    bool is_filled() const noexcept { return quantity_ == 0; }

    OrderId id() const noexcept { return id_; }
    const std::string& symbol() const noexcept { return symbol_; }
    Side side() const noexcept { return side_; }
    Price price() const noexcept { return price_; }
    Quantity quantity() const noexcept { return quantity_; }
    Quantity original_quantity() const noexcept { return original_quantity_; }
    Quantity filled_quantity() const noexcept { return original_quantity_ - quantity_; }

    /// Order(order_id=1, symbol='X', side='BUY', price=99.00, quantity=10)
    std::string to_string() const;

private:
    OrderId id_;
    std::string symbol_;
    Side side_;
    Price price_;
    Quantity quantity_;
    Quantity original_quantity_;
};

} // namespace exchange
