#include "exchange/session.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <utility>

namespace exchange {

Session::Session(size_t random_symbol_length)
    : random_symbol_length_(random_symbol_length)
{}

OrderBook& Session::create_book(std::string_view symbol) {
    OrderBook& book = books_.emplace_back(symbol, random_symbol_length_);
    registry_.register_book(book);
    LOG_INFO("Created order book %s", book.symbol().c_str());
    return book;
}

OrderBook* Session::find_book(std::string_view symbol) {
    return const_cast<OrderBook*>(std::as_const(*this).find_book(symbol));
}

const OrderBook* Session::find_book(std::string_view symbol) const {
    const std::string key = to_upper_ascii(trim(symbol));
    for (const OrderBook& book : books_) {
        if (book.symbol() == key) return &book;
    }
    return nullptr;
}

OrderId Session::next_order_id(std::string_view symbol) {
    auto [it, inserted] = sequences_.try_emplace(to_upper_ascii(trim(symbol)), 1);
    return it->second++;
}

Order Session::make_order(std::string_view symbol, Side side, Price price, Quantity quantity) {
    return Order(next_order_id(symbol), symbol, side, price, quantity);
}

Order Session::make_order(std::string_view symbol, std::string_view side, Price price, Quantity quantity) {
    return Order(next_order_id(symbol), symbol, side, price, quantity);
}

size_t send_orders(OrderBook& book, std::vector<Order> orders) {
    size_t trades = 0;
    for (Order& order : orders) {
        trades += book.add_order(std::move(order)).size();
    }
    return trades;
}

} // namespace exchange
