#include "exchange/order_script.hpp"
#include "exchange/report.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <charconv>
#include <fstream>

namespace exchange {

namespace {

OrderId parse_order_id(std::string_view text, size_t line_no) {
    OrderId id = 0;
    const char* end = text.data() + text.size();
    auto res = std::from_chars(text.data(), end, id);
    if (res.ec != std::errc{} || res.ptr != end) {
        throw ParseError("bad order id '" + std::string(text) + "'", line_no);
    }
    return id;
}

void expect_args(const std::vector<std::string_view>& args, size_t min, size_t max, size_t line_no) {
    if (args.size() < min || args.size() > max) {
        throw ParseError("wrong number of arguments for '" + std::string(args[0]) + "'", line_no);
    }
}

} // anonymous namespace

OrderScript::OrderScript(Session& session, FILE* out)
    : session_(session)
    , out_(out)
{}

OrderBook& OrderScript::book_arg(std::string_view symbol, size_t line_no) {
    OrderBook* book = session_.find_book(symbol);
    if (!book) {
        throw ParseError("no order book '" + std::string(symbol) + "'", line_no);
    }
    return *book;
}

void OrderScript::submit(const std::vector<std::string_view>& args, size_t line_no) {
    // order BOOK SYMBOL SIDE PRICE QTY [ID]
    OrderBook& book = book_arg(args[1], line_no);

    Price price = 0;
    Quantity quantity = 0;
    try {
        price = parse_price(args[4]);
        quantity = parse_quantity(args[5]);
    } catch (const InvalidArgument& e) {
        throw ParseError(e.what(), line_no);
    }

    Order order = (args.size() == 7)
        ? Order(parse_order_id(args[6], line_no), args[2], args[3], price, quantity)
        : session_.make_order(args[2], args[3], price, quantity);

    try {
        stats_.trades += book.add_order(std::move(order)).size();
        ++stats_.orders_accepted;
    } catch (const SymbolMismatch& e) {
        ++stats_.orders_rejected;
        LOG_WARN("line %zu: order rejected: %s", line_no, e.what());
    } catch (const UnknownSide& e) {
        ++stats_.orders_rejected;
        LOG_WARN("line %zu: order rejected: %s", line_no, e.what());
    }
}

void OrderScript::run_line(std::string_view line, size_t line_no) {
    const size_t comment = line.find('#');
    if (comment != std::string_view::npos) line = line.substr(0, comment);

    const std::vector<std::string_view> args = split_whitespace(line);
    if (args.empty()) return;

    ++stats_.commands;
    const std::string command = to_upper_ascii(args[0]);

    if (command == "BOOK") {
        expect_args(args, 1, 2, line_no);
        session_.create_book(args.size() == 2 ? args[1] : std::string_view{});
    } else if (command == "ORDER") {
        expect_args(args, 6, 7, line_no);
        submit(args, line_no);
    } else if (command == "DISPLAY") {
        expect_args(args, 2, 2, line_no);
        print_book(book_arg(args[1], line_no), out_);
    } else if (command == "TRADES") {
        expect_args(args, 2, 2, line_no);
        print_trades(book_arg(args[1], line_no), out_);
    } else if (command == "POSITION") {
        expect_args(args, 2, 2, line_no);
        print_position(book_arg(args[1], line_no), out_);
    } else if (command == "ALL_TRADES") {
        expect_args(args, 1, 1, line_no);
        print_all_trades(session_.registry(), out_);
    } else if (command == "ALL_POSITIONS") {
        expect_args(args, 1, 1, line_no);
        print_all_positions(session_.registry(), out_);
    } else {
        throw ParseError("unknown command '" + std::string(args[0]) + "'", line_no);
    }
}

const ScriptStats& OrderScript::run(std::istream& in) {
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        run_line(line, line_no);
    }
    return stats_;
}

const ScriptStats& OrderScript::run_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ParseError("cannot open script '" + path + "'");
    }
    LOG_INFO("Running order script %s", path.c_str());
    return run(file);
}

} // namespace exchange
