#pragma once

#include "bar.hpp"
#include "order.hpp"
#include "position.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ledgerbt {

/// Applies one interval's orders against the next bar and owns the position ledger.
/// Orders placed at bar t are filled at bar t+1 (avoids look-ahead):
///   market: at t+1 open;
///   limit:  at the limit price if it lies within t+1 [low, high], else dropped.
/// All EXIT orders are applied before any ENTER order, each group in input order.
/// Buying power at mark price p = cash + sum(q * p) - sum(|q| * p): no leverage,
/// so gross open exposure never exceeds equity.
class FillEngine {
public:
    explicit FillEngine(double starting_cash, std::string symbol = "");

    /// Validate and fill orders emitted for next_bar. Returns number of fills.
    /// Order shapes and EXIT ids are checked for the whole batch before any fill,
    /// so MalformedOrderError and UnknownPositionError leave the ledger untouched.
    /// InsufficientCapitalError leaves the fills applied before it in the ledger.
    std::size_t process(const std::vector<Order>& orders, const Bar& next_bar);

    /// Cash plus open quantity marked at mark_price.
    double equity(double mark_price) const;
    /// Sum of |quantity| * mark_price over open positions.
    double grossExposure(double mark_price) const;
    double buyingPower(double mark_price) const;

    double cash() const { return cash_; }
    const std::vector<Position>& ledger() const { return ledger_; }
    /// Ledger indices of open positions, in entry order.
    const std::vector<std::size_t>& openIndex() const { return open_; }
    std::size_t openCount() const { return open_.size(); }

private:
    /// Limit orders outside the bar range yield no price.
    static std::optional<double> fillPrice(const Order& order, const Bar& bar);

    /// Every EXIT must name a distinct open position.
    void checkExits(const std::vector<Order>& orders, const Bar& bar) const;
    bool fillExit(const Order& order, const Bar& bar);
    bool fillEnter(const Order& order, const Bar& bar);
    const Position* findOpen(PositionId id) const;

    std::string symbol_;
    double cash_;
    std::vector<Position> ledger_;  // index = id - 1
    std::vector<std::size_t> open_;
};

} // namespace ledgerbt
