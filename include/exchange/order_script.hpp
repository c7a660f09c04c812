#pragma once

#include "exchange/session.hpp"
#include <cstdio>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace exchange {

struct ScriptStats {
    size_t commands = 0;
    size_t orders_accepted = 0;
    size_t orders_rejected = 0;     // SymbolMismatch / UnknownSide from the book
    size_t trades = 0;
};

/// Line-oriented driver for a Session. One command per line; '#' starts a
/// comment, blank lines are skipped.
///
///   book [SYMBOL]                              create a book (random symbol if omitted)
///   order BOOK SYMBOL SIDE PRICE QTY [ID]      submit an order to BOOK
///   display BOOK | trades BOOK | position BOOK print one book
///   all_trades | all_positions                 print every registered book
///
/// Malformed lines throw ParseError with the line number. Orders the book
/// rejects are logged and counted, and the script carries on.
class OrderScript {
public:
    explicit OrderScript(Session& session, FILE* out = stdout);

    void run_line(std::string_view line, size_t line_no);
    const ScriptStats& run(std::istream& in);

    /// Throws ParseError if the file cannot be opened.
    const ScriptStats& run_file(const std::string& path);

    const ScriptStats& stats() const noexcept { return stats_; }

private:
    OrderBook& book_arg(std::string_view symbol, size_t line_no);
    void submit(const std::vector<std::string_view>& args, size_t line_no);

    Session& session_;
    FILE* out_;
    ScriptStats stats_;
};

} // namespace exchange
