#pragma once

#include "bar.hpp"
#include "fill_engine.hpp"
#include "pnl.hpp"
#include "position.hpp"
#include "stats.hpp"
#include "strategy.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ledgerbt {

constexpr double DEFAULT_STARTING_EQUITY = 100000.0;

/// Orchestrates the backtest: feed bars to strategy, fill its orders, build the PnL table.
/// One instance per run: run() may be called once.
class Backtester {
public:
    /// Throws InvalidInputError if bars are empty, not strictly increasing in
    /// time, or carry non-finite or non-positive prices, high < low, or an
    /// open/close outside [low, high]; also if starting_equity
    /// is negative or not finite.
    Backtester(std::vector<Bar> bars,
               std::unique_ptr<IStrategy> strategy,
               double starting_equity = DEFAULT_STARTING_EQUITY,
               std::string symbol = "");

    /// Interval t = 0 .. N-2: strategy sees bars [0, t]; its orders fill on bar t+1.
    /// No strategy call on the last bar (nothing left to fill against), and no
    /// implicit liquidation: positions still open stay open.
    /// Throws on the first fatal fault; ledger() then shows the partial state.
    void run();

    /// True once run() completed without error.
    bool finished() const { return finished_; }

    const std::vector<Bar>& bars() const { return bars_; }
    const std::vector<Position>& ledger() const { return fills_.ledger(); }
    double cash() const { return fills_.cash(); }
    double startingEquity() const { return starting_equity_; }
    const std::string& symbol() const { return symbol_; }

    /// Throws std::logic_error unless finished().
    const PnlTable& pnl() const;
    Stats stats(double periods_per_year = TRADING_DAYS_PER_YEAR) const;

private:
    void validateBars() const;

    std::vector<Bar> bars_;
    std::unique_ptr<IStrategy> strategy_;
    double starting_equity_;
    std::string symbol_;
    FillEngine fills_;
    PnlTable pnl_;
    bool started_{false};
    bool finished_{false};
};

} // namespace ledgerbt
