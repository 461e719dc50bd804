#pragma once

#include "bar.hpp"
#include "order.hpp"
#include "position.hpp"
#include <cstddef>
#include <functional>
#include <vector>

namespace ledgerbt {

/// Read-only snapshot of the ledger handed to the strategy each interval.
/// Reflects the state before the current interval's fills. Only valid for the
/// duration of the onCandle() call it was passed to.
class PositionsBook {
public:
    PositionsBook(const std::vector<Position>& ledger, const Bar& current, double cash);
    /// open_index: ledger indices of the open positions, in entry order.
    PositionsBook(const std::vector<Position>& ledger, const std::vector<std::size_t>& open_index,
                  const Bar& current, double cash);

    /// Copies of the currently open positions, in entry order.
    const std::vector<Position>& openPositions() const { return open_; }
    std::vector<Position> closedPositions() const;

    /// Net open quantity (+ long, - short).
    double quantity() const;
    /// Open quantity marked at the current bar's close.
    double value() const;
    double cash() const { return cash_; }
    /// cash + value()
    double equity() const { return cash_ + value(); }

    /// True iff at least one open position is long.
    bool isLong() const;
    /// True iff at least one open position is short.
    bool isShort() const;
    bool isFlat() const { return open_.empty(); }

    /// One EXIT order per open position. Does not touch the ledger.
    std::vector<Order> close() const;
    std::vector<Order> closeLong() const;
    std::vector<Order> closeShort() const;
    std::vector<Order> closeIf(const std::function<bool(const Position&)>& pred) const;

private:
    const std::vector<Position>& ledger_;
    std::vector<Position> open_;
    double close_;
    double cash_;
};

} // namespace ledgerbt
