#include "order_book/order_book.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <random>

namespace exchange {

OrderBook::OrderBook(std::string_view symbol, size_t random_symbol_length)
    : symbol_(trim(symbol).empty() ? random_symbol(random_symbol_length) : to_upper_ascii(trim(symbol)))
{}

std::string OrderBook::random_symbol(size_t length) {
    static constexpr char HEX_DIGITS[] = "0123456789ABCDEF";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 15);

    std::string symbol(std::clamp<size_t>(length, 1, MAX_SYMBOL_LENGTH), '0');
    for (char& c : symbol) {
        c = HEX_DIGITS[digit(rng)];
    }
    return symbol;
}

std::span<const Trade> OrderBook::add_order(Order order) {
    if (order.symbol() != symbol_) [[unlikely]] {
        LOG_WARN("Rejected order %llu: symbol '%s' does not match book '%s'",
                 static_cast<unsigned long long>(order.id()), order.symbol().c_str(), symbol_.c_str());
        throw SymbolMismatch("Order symbol '" + order.symbol() +
                             "' does not match OrderBook symbol '" + symbol_ + "'");
    }
    if (!is_valid_side(order.side())) [[unlikely]] {
        LOG_WARN("Rejected order %llu: unknown side", static_cast<unsigned long long>(order.id()));
        throw UnknownSide("Unknown order side for order " + std::to_string(order.id()));
    }

    if (order.quantity() > MAX_ORDER_QUANTITY) [[unlikely]] {
        LOG_WARN("Rejected order %llu: quantity %llu above limit",
                 static_cast<unsigned long long>(order.id()),
                 static_cast<unsigned long long>(order.quantity()));
        throw InvalidArgument("Order quantity " + std::to_string(order.quantity()) +
                              " exceeds the per-order limit of " + std::to_string(MAX_ORDER_QUANTITY));
    }

    LOG_INFO("Adding order: %s", order.to_string().c_str());

    const size_t first_trade = trades_.size();

    if (order.side() == Side::Buy) {
        match_against(order, offers_);
    } else {
        match_against(order, bids_);
    }

    if (!order.is_filled()) {
        add_to_book(std::move(order));
    }

    return std::span<const Trade>(trades_.data() + first_trade, trades_.size() - first_trade);
}

bool OrderBook::crosses(Side aggressor, Price incoming, Price resting) noexcept {
    // BUY lifts offers at or below its limit, SELL hits bids at or above it
    return aggressor == Side::Buy ? incoming >= resting : incoming <= resting;
}

template<typename Levels>
void OrderBook::match_against(Order& incoming, Levels& levels) {
    while (!incoming.is_filled() && !levels.empty()) {
        auto level_it = levels.begin();
        PriceLevel& level = level_it->second;
        Order& resting = level.front();

        // Best price is the only candidate; nothing behind it can cross either
        if (!crosses(incoming.side(), incoming.price(), resting.price())) break;

        const Quantity trade_qty = std::min(incoming.quantity(), resting.quantity());

        // Incoming executes first; its actual amount drives the resting side
        const Quantity executed = incoming.execute(trade_qty);
        resting.execute(executed);
        level.on_executed(executed);

        record_trade(incoming, resting, executed);

        if (resting.is_filled()) {
            level.pop_front();
            if (level.empty()) {
                levels.erase(level_it);
            }
        } else {
            // Resting order only partially consumed: incoming is exhausted
            break;
        }
    }
}

void OrderBook::record_trade(const Order& aggressor, const Order& resting, Quantity quantity) {
    const bool aggressor_buys = aggressor.side() == Side::Buy;
    const OrderId buy_id = aggressor_buys ? aggressor.id() : resting.id();
    const OrderId sell_id = aggressor_buys ? resting.id() : aggressor.id();

    trades_.push_back(Trade{symbol_, buy_id, sell_id, resting.price(), quantity});
    positions_.on_fill(symbol_, aggressor.side(), quantity);

    LOG_INFO("Executed: %s %llu @ %s between order %llu and %llu",
             side_name(aggressor.side()), static_cast<unsigned long long>(quantity),
             format_price(resting.price()).c_str(),
             static_cast<unsigned long long>(aggressor.id()),
             static_cast<unsigned long long>(resting.id()));
}

void OrderBook::add_to_book(Order order) {
    LOG_DEBUG("Resting %s", order.to_string().c_str());
    const Price price = order.price();
    PriceLevel& level = (order.side() == Side::Buy) ? bids_[price] : offers_[price];
    level.add_order(std::move(order));
}

std::vector<const Order*> OrderBook::bids() const {
    std::vector<const Order*> out;
    for (const auto& [price, level] : bids_) {
        for (const auto& [id, order] : level.orders) {
            out.push_back(&order);
        }
    }
    return out;
}

std::vector<const Order*> OrderBook::offers() const {
    std::vector<const Order*> out;
    for (const auto& [price, level] : offers_) {
        for (const auto& [id, order] : level.orders) {
            out.push_back(&order);
        }
    }
    return out;
}

const Order* OrderBook::best_bid() const noexcept {
    return bids_.empty() ? nullptr : &bids_.begin()->second.front();
}

const Order* OrderBook::best_offer() const noexcept {
    return offers_.empty() ? nullptr : &offers_.begin()->second.front();
}

const Order* OrderBook::find_order(OrderId id) const noexcept {
    for (const auto& [price, level] : bids_) {
        auto it = level.orders.find(id);
        if (it != level.orders.end()) return &it->second;
    }
    for (const auto& [price, level] : offers_) {
        auto it = level.orders.find(id);
        if (it != level.orders.end()) return &it->second;
    }
    return nullptr;
}

Quantity OrderBook::depth_at(Side side, Price price) const noexcept {
    if (side == Side::Buy) {
        auto it = bids_.find(price);
        return it == bids_.end() ? 0 : it->second.total_quantity;
    }
    if (side == Side::Sell) {
        auto it = offers_.find(price);
        return it == offers_.end() ? 0 : it->second.total_quantity;
    }
    return 0;
}

size_t OrderBook::order_count() const noexcept {
    size_t count = 0;
    for (const auto& [price, level] : bids_) count += level.order_count();
    for (const auto& [price, level] : offers_) count += level.order_count();
    return count;
}

} // namespace exchange
