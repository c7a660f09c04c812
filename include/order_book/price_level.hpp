#pragma once

#include "order_book/order.hpp"
#include <algorithm>
#include <cstdint>
#include <map>
#include <utility>

namespace exchange {

/// PriceLevel: resting orders at one price, in time priority.
/// Time priority is the order id (lower id = earlier submission). Orders
/// sharing an id keep arrival order (multimap inserts at the upper bound).
/// The level owns its orders.
struct PriceLevel {
    Quantity total_quantity = 0;    // Sum of remaining quantity on the level

    std::multimap<OrderId, Order> orders;

    /// Rest an order on this level.
    void add_order(Order order) {
        total_quantity += order.quantity();
        const OrderId id = order.id();
        orders.emplace(id, std::move(order));
    }

    /// Account for quantity executed against an order on this level.
    void on_executed(Quantity quantity) noexcept {
        total_quantity = (total_quantity >= quantity) ? total_quantity - quantity : 0;
    }

    /// Evict the front order (called once it is filled).
    void pop_front() {
        total_quantity -= std::min(total_quantity, front().quantity());
        orders.erase(orders.begin());
    }

    /// Front of the queue (highest time priority). Level must not be empty.
    Order& front() { return orders.begin()->second; }
    const Order& front() const { return orders.begin()->second; }

    uint32_t order_count() const noexcept { return static_cast<uint32_t>(orders.size()); }
    bool empty() const noexcept { return orders.empty(); }
};

} // namespace exchange
