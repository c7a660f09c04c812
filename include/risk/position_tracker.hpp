#pragma once

#include "common/types.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace exchange {

/// Net position per symbol, attributed to the aggressor of each trade:
/// +quantity when the aggressor bought, -quantity when it sold.
/// A symbol only appears once it has traded. Positions saturate at the
/// int64 limits.
class PositionTracker {
public:
    using PositionMap = std::map<std::string, int64_t, std::less<>>;

    /// Update position on fill
    void on_fill(const std::string& symbol, Side aggressor, Quantity quantity);

    /// Position queries
    int64_t position(std::string_view symbol) const noexcept;
    int64_t total_absolute_position() const noexcept;

    const PositionMap& positions() const noexcept { return positions_; }
    bool empty() const noexcept { return positions_.empty(); }

private:
    PositionMap positions_;
};

} // namespace exchange
