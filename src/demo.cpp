#include "exchange/demo.hpp"
#include "exchange/report.hpp"
#include "common/logger.hpp"
#include <initializer_list>
#include <vector>

namespace exchange {

namespace {

struct DemoOrder {
    Side side;
    double price;
    Quantity quantity;
};

std::vector<Order> batch(Session& session, const char* symbol, std::initializer_list<DemoOrder> orders) {
    std::vector<Order> out;
    out.reserve(orders.size());
    for (const DemoOrder& o : orders) {
        out.push_back(session.make_order(symbol, o.side, to_fixed_price(o.price), o.quantity));
    }
    return out;
}

} // anonymous namespace

void run_demo(Session& session, FILE* out, bool display_books) {
    LOG_INFO("Running built-in demo session");

    OrderBook& tesla = session.create_book("TESLA");
    send_orders(tesla, batch(session, "TESLA", {
        {Side::Buy, 100.00, 35},
        {Side::Sell, 102.00, 10},
        {Side::Sell, 101.00, 30},
    }));
    if (display_books) print_book(tesla, out);

    send_orders(tesla, batch(session, "TESLA", {
        {Side::Buy, 103.00, 10},   // takes 10 of the 30 @ 101
        {Side::Buy, 103.00, 10},   // takes another 10 @ 101
        {Side::Buy, 103.00, 30},   // last 10 @ 101, 10 @ 102, rests 10 @ 103
        {Side::Sell, 100.00, 60},   // hits 10 @ 103 and 35 @ 100, rests 15
    }));

    OrderBook& toyota = session.create_book("TOYOTA");
    send_orders(toyota, batch(session, "TOYOTA", {
        {Side::Buy, 100.00, 10},
        {Side::Sell, 101.00, 10},
        {Side::Buy, 100.00, 10},
    }));
    if (display_books) print_book(toyota, out);

    send_orders(toyota, batch(session, "TOYOTA", {
        {Side::Sell, 100.00, 20},   // both bids @ 100, earlier id first
    }));

    // Registered but never traded
    session.create_book("BYD");

    print_trades(tesla, out);
    print_position(tesla, out);
    print_trades(toyota, out);
    print_position(toyota, out);
    print_all_trades(session.registry(), out);
    print_all_positions(session.registry(), out);
}

} // namespace exchange
