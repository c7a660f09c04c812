#include "order_book/order.hpp"
#include "common/errors.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cstdio>

namespace exchange {

Order::Order(OrderId id, std::string_view symbol, Side side, Price price, Quantity quantity)
    : id_(id)
    , symbol_(to_upper_ascii(trim(symbol)))
    , side_(side)
    , price_(price)
    , quantity_(quantity)
    , original_quantity_(quantity)
{}

Order::Order(OrderId id, std::string_view symbol, std::string_view side, Price price, Quantity quantity)
    : Order(id, symbol, parse_side(side), price, quantity)
{}

Order Order::from_text(OrderId id, std::string_view symbol, std::string_view side,
                       std::string_view price, std::string_view quantity) {
    return Order(id, symbol, side, parse_price(price), parse_quantity(quantity));
}

Quantity Order::execute(Quantity exec_quantity) {
    if (exec_quantity == 0) {
        throw InvalidArgument("execution quantity must be positive");
    }
    const Quantity actual = std::min(exec_quantity, quantity_);
    quantity_ -= actual;
    return actual;
}

std::string Order::to_string() const {
    char fields[96];
    snprintf(fields, sizeof(fields), "', side='%s', price=%s, quantity=%llu)",
             side_name(side_), format_price(price_).c_str(), static_cast<unsigned long long>(quantity_));
    return "Order(order_id=" + std::to_string(id_) + ", symbol='" + symbol_ + fields;
}

} // namespace exchange
