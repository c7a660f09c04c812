#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "exchange/order_script.hpp"
#include <cstdio>
#include <sstream>

using namespace exchange;

class OrderScriptTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_NE(out_, nullptr);
    }

    void TearDown() override {
        if (out_) fclose(out_);
    }

    const ScriptStats& run(const std::string& text) {
        std::istringstream in(text);
        return script_.run(in);
    }

    std::string output() {
        std::string text;
        rewind(out_);
        char buf[256];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), out_)) > 0) {
            text.append(buf, n);
        }
        return text;
    }

    FILE* out_ = tmpfile();
    Session session_;
    OrderScript script_{session_, out_};
};

TEST_F(OrderScriptTest, CommentsAndBlankLinesAreSkipped) {
    const ScriptStats& stats = run("# header\n\n   \nbook X   # trailing comment\n");
    EXPECT_EQ(stats.commands, 1u);
    EXPECT_NE(session_.find_book("X"), nullptr);
}

TEST_F(OrderScriptTest, OrdersMatchAndCount) {
    const ScriptStats& stats = run(
        "book TESLA\n"
        "order TESLA TESLA SELL 99.00 10\n"
        "ORDER tesla tesla buy 100 10\n");

    EXPECT_EQ(stats.commands, 3u);
    EXPECT_EQ(stats.orders_accepted, 2u);
    EXPECT_EQ(stats.orders_rejected, 0u);
    EXPECT_EQ(stats.trades, 1u);

    const OrderBook* book = session_.find_book("TESLA");
    ASSERT_NE(book, nullptr);
    ASSERT_EQ(book->trades().size(), 1u);
    EXPECT_EQ(book->trades()[0].buy_order_id, 2u);
    EXPECT_EQ(book->trades()[0].sell_order_id, 1u);
    EXPECT_EQ(book->trades()[0].price, 9900);
}

TEST_F(OrderScriptTest, ExplicitIdIsUsed) {
    run("book X\n"
        "order X X BUY 100 5 40\n"
        "order X X BUY 100 5\n");

    const OrderBook* book = session_.find_book("X");
    auto bids = book->bids();
    ASSERT_EQ(bids.size(), 2u);
    // Auto sequence starts at 1 regardless of the explicit id
    EXPECT_EQ(bids[0]->id(), 1u);
    EXPECT_EQ(bids[1]->id(), 40u);
}

TEST_F(OrderScriptTest, RejectedOrdersAreCountedAndSkipped) {
    const ScriptStats& stats = run(
        "book TESLA\n"
        "order TESLA TOYOTA BUY 100 10\n"
        "order TESLA TESLA HOLD 100 10\n"
        "order TESLA TESLA BUY 100 10\n");

    EXPECT_EQ(stats.orders_rejected, 2u);
    EXPECT_EQ(stats.orders_accepted, 1u);
    EXPECT_EQ(session_.find_book("TESLA")->order_count(), 1u);
}

TEST_F(OrderScriptTest, ReportCommandsWriteOutput) {
    run("book X\n"
        "order X X SELL 99 10\n"
        "order X X BUY 100 10\n"
        "trades X\n"
        "position X\n");

    const std::string text = output();
    EXPECT_NE(text.find("Trade: X | BUY Order #2 <-> SELL Order #1 | Qty: 10 @ 99.00"), std::string::npos);
    EXPECT_NE(text.find("X: 10"), std::string::npos);
}

TEST_F(OrderScriptTest, AggregateCommands) {
    run("book A\n"
        "book B\n"
        "all_trades\n"
        "all_positions\n");

    const std::string text = output();
    EXPECT_NE(text.find("[OrderBook: A]"), std::string::npos);
    EXPECT_NE(text.find("[OrderBook: B]"), std::string::npos);
    EXPECT_NE(text.find("ALL POSITIONS"), std::string::npos);
}

TEST_F(OrderScriptTest, BookWithoutSymbolGetsRandomOne) {
    run("book\n");
    ASSERT_EQ(session_.book_count(), 1u);
    EXPECT_EQ(session_.registry().books()[0]->symbol().size(), DEFAULT_SYMBOL_LENGTH);
}

TEST_F(OrderScriptTest, UnknownCommandReportsLine) {
    try {
        run("book X\n\nfrobnicate\n");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 3u);
        EXPECT_STREQ(e.what(), "line 3: unknown command 'frobnicate'");
    }
}

TEST_F(OrderScriptTest, MalformedLinesThrow) {
    EXPECT_THROW(script_.run_line("order X X BUY 100", 1), ParseError);
    EXPECT_THROW(script_.run_line("display X", 2), ParseError);  // no such book

    script_.run_line("book X", 3);
    EXPECT_THROW(script_.run_line("order X X BUY abc 10", 4), ParseError);
    EXPECT_THROW(script_.run_line("order X X BUY 100 -1", 5), ParseError);
    EXPECT_THROW(script_.run_line("order X X BUY 100 10 x7", 6), ParseError);
    EXPECT_THROW(script_.run_line("all_trades extra", 7), ParseError);
    EXPECT_TRUE(session_.find_book("X")->bids().empty());
}

TEST_F(OrderScriptTest, MissingFileThrows) {
    EXPECT_THROW(script_.run_file("/nonexistent/orders.script"), ParseError);
}
