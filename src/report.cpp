#include "exchange/report.hpp"
#include "common/logger.hpp"
#include <cstdarg>

namespace exchange {

namespace {

const std::string BANNER_RULE(34, '#');
const std::string TRADES_RULE(36, '#');
const std::string POSITION_RULE(24, '#');

void appendf(std::string& out, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

void appendf(std::string& out, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list sizing;
    va_copy(sizing, args);
    const int len = vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (len > 0) {
        const size_t start = out.size();
        out.resize(start + static_cast<size_t>(len) + 1);
        vsnprintf(out.data() + start, static_cast<size_t>(len) + 1, fmt, args);
        out.resize(start + static_cast<size_t>(len));  // Drop the terminator
    }
    va_end(args);
}

void append_banner(std::string& out, const char* title) {
    out += BANNER_RULE + "\n";
    appendf(out, "#          %-22s#\n", title);
    out += BANNER_RULE + "\n";
}

void write(const std::string& text, FILE* out) {
    fputs(text.c_str(), out);
    fflush(out);
}

} // anonymous namespace

std::string format_trade(const Trade& trade) {
    std::string out;
    appendf(out, "Trade: %s | BUY Order #%llu <-> SELL Order #%llu | Qty: %llu @ %s",
            trade.symbol.c_str(),
            static_cast<unsigned long long>(trade.buy_order_id),
            static_cast<unsigned long long>(trade.sell_order_id),
            static_cast<unsigned long long>(trade.quantity),
            format_price(trade.price).c_str());
    return out;
}

std::string format_book(const OrderBook& book) {
    std::string out = "\n";
    append_banner(out, "BUY ORDERS");
    for (const Order* order : book.bids()) {
        out += order->to_string() + "\n";
    }
    append_banner(out, "SELL ORDERS");
    for (const Order* order : book.offers()) {
        out += order->to_string() + "\n";
    }
    out += "\n";
    return out;
}

std::string format_trades(const OrderBook& book) {
    std::string out = "\n########## EXECUTED TRADES ##########\n";
    if (book.trades().empty()) {
        out += "No trades executed.\n";
    } else {
        for (const Trade& trade : book.trades()) {
            out += format_trade(trade) + "\n";
        }
    }
    out += TRADES_RULE + "\n";
    return out;
}

std::string format_position(const OrderBook& book) {
    std::string out = "\n########## POSITION ##########\n";
    for (const auto& [symbol, qty] : book.positions().positions()) {
        appendf(out, "%s: %lld\n", symbol.c_str(), static_cast<long long>(qty));
    }
    out += POSITION_RULE + "\n";
    return out;
}

std::string format_all_trades(const BookRegistry& registry) {
    std::string out = "\n########## ALL EXECUTED TRADES ##########\n";
    for (const OrderBook* book : registry) {
        appendf(out, "[OrderBook: %s]\n", book->symbol().c_str());
        if (book->trades().empty()) {
            out += "  No trades executed.\n";
            continue;
        }
        for (const Trade& trade : book->trades()) {
            out += "  " + format_trade(trade) + "\n";
        }
    }
    out += TRADES_RULE + "\n";
    return out;
}

std::string format_all_positions(const BookRegistry& registry) {
    std::string out = "\n########## ALL POSITIONS ##########\n";
    for (const OrderBook* book : registry) {
        for (const auto& [symbol, qty] : book->positions().positions()) {
            appendf(out, "[OrderBook: %s] %s: %lld\n", book->symbol().c_str(), symbol.c_str(),
                    static_cast<long long>(qty));
        }
    }
    out += POSITION_RULE + "\n";
    return out;
}

void print_book(const OrderBook& book, FILE* out) {
    LOG_INFO("Display order book: %s | Total orders: %zu", book.symbol().c_str(), book.order_count());
    write(format_book(book), out);
}

void print_trades(const OrderBook& book, FILE* out) {
    write(format_trades(book), out);
}

void print_position(const OrderBook& book, FILE* out) {
    write(format_position(book), out);
}

void print_all_trades(const BookRegistry& registry, FILE* out) {
    write(format_all_trades(registry), out);
}

void print_all_positions(const BookRegistry& registry, FILE* out) {
    write(format_all_positions(registry), out);
}

} // namespace exchange
