#pragma once

#include "bar.hpp"
#include "pnl.hpp"
#include "position.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ledgerbt {

constexpr double TRADING_DAYS_PER_YEAR = 252.0;

/// Metric name -> value; empty optional = not applicable (distinct from 0).
using StatEntries = std::vector<std::pair<std::string, std::optional<double>>>;

/// Summary metrics derived from a PnL table and its ledger.
/// Percentages are in percent; win_rate and exposure_fraction are fractions.
struct Stats {
    Timestamp start{0};
    Timestamp end{0};
    std::int64_t duration{0};          // seconds
    std::size_t intervals{0};

    double starting_equity{0};
    double final_equity{0};
    double peak_equity{0};

    // total = realized + unrealized (open positions marked at the last close)
    double total_pnl{0};
    std::optional<double> total_pnl_pct;
    double realized_pnl{0};
    std::optional<double> realized_pnl_pct;
    double unrealized_pnl{0};

    std::optional<double> buy_and_hold_pnl;
    std::optional<double> buy_and_hold_pnl_pct;

    std::size_t exposure_intervals{0};
    double exposure_fraction{0};

    double max_drawdown{0};             // peak-to-trough, in equity units
    std::optional<double> max_drawdown_pct;
    std::optional<double> sharpe_ratio;

    std::size_t num_trades{0};          // closed positions
    std::size_t open_positions{0};      // still open at the last bar
    std::size_t winning_trades{0};
    std::size_t losing_trades{0};
    std::optional<double> win_rate;
    std::optional<double> avg_win;
    std::optional<double> avg_loss;
    std::optional<double> best_trade;
    std::optional<double> worst_trade;
    std::optional<double> profit_factor;
    std::optional<double> expectancy;
    std::optional<double> max_position_duration;  // seconds
    std::optional<double> avg_position_duration;  // seconds

    /// Flat ordered mapping, e.g. for printing.
    StatEntries entries() const;
};

/// Pure function of the table and ledger. table must not be empty.
Stats computeStats(const PnlTable& table,
                   const std::vector<Position>& ledger,
                   double periods_per_year = TRADING_DAYS_PER_YEAR);

/// Lookup in entries(); empty if the name is unknown or the value not applicable.
std::optional<double> findStat(const StatEntries& entries, const std::string& name);

} // namespace ledgerbt
