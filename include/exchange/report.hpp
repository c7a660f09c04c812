#pragma once

#include "exchange/session.hpp"
#include <cstdio>
#include <string>

namespace exchange {

// Read-only text views over book state. format_* build the text, print_*
// write it to `out`.

std::string format_trade(const Trade& trade);

/// BUY orders best first, then SELL orders best first.
std::string format_book(const OrderBook& book);
std::string format_trades(const OrderBook& book);
std::string format_position(const OrderBook& book);

/// Trades and positions of every registered book, in registration order.
std::string format_all_trades(const BookRegistry& registry);
std::string format_all_positions(const BookRegistry& registry);

void print_book(const OrderBook& book, FILE* out = stdout);
void print_trades(const OrderBook& book, FILE* out = stdout);
void print_position(const OrderBook& book, FILE* out = stdout);
void print_all_trades(const BookRegistry& registry, FILE* out = stdout);
void print_all_positions(const BookRegistry& registry, FILE* out = stdout);

} // namespace exchange
