#include "risk/position_tracker.hpp"
#include <algorithm>
#include <limits>

namespace exchange {

void PositionTracker::on_fill(const std::string& symbol, Side aggressor, Quantity quantity) {
    constexpr int64_t MAX_POS = std::numeric_limits<int64_t>::max();
    constexpr int64_t MIN_POS = std::numeric_limits<int64_t>::min();
    const int64_t signed_qty = static_cast<int64_t>(std::min<Quantity>(quantity, MAX_POS));
    int64_t& pos = positions_[symbol];

    // Saturate at the int64 limits
    if (aggressor == Side::Buy) {
        pos = (pos > MAX_POS - signed_qty) ? MAX_POS : pos + signed_qty;
    } else {
        pos = (pos < MIN_POS + signed_qty) ? MIN_POS : pos - signed_qty;
    }
}

int64_t PositionTracker::position(std::string_view symbol) const noexcept {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return 0;
    return it->second;
}

int64_t PositionTracker::total_absolute_position() const noexcept {
    constexpr uint64_t MAX_TOTAL = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    uint64_t total = 0;
    for (const auto& [symbol, pos] : positions_) {
        const uint64_t magnitude = pos < 0 ? 0 - static_cast<uint64_t>(pos) : static_cast<uint64_t>(pos);
        total = (magnitude > MAX_TOTAL - total) ? MAX_TOTAL : total + magnitude;
    }
    return static_cast<int64_t>(total);
}

} // namespace exchange
