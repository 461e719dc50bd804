#include "stats.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace ledgerbt {

namespace {

std::optional<double> pct(double numerator, double denominator) {
    if (denominator == 0) return std::nullopt;
    return numerator / denominator * 100.0;
}

std::optional<double> asOptional(std::size_t v) { return static_cast<double>(v); }

} // namespace

Stats computeStats(const PnlTable& table,
                   const std::vector<Position>& ledger,
                   double periods_per_year) {
    if (table.empty()) throw InvalidInputError("cannot compute stats of an empty PnL table");

    Stats s;
    const std::size_t n = table.size();
    const auto& equity = table.equity;

    s.start = table.time.front();
    s.end = table.time.back();
    s.duration = s.end - s.start;
    s.intervals = n;

    s.starting_equity = table.starting_equity;
    s.final_equity = equity.back();
    s.peak_equity = *std::max_element(equity.begin(), equity.end());

    s.total_pnl = table.total_pnl.back();
    s.realized_pnl = table.realized_pnl.back();
    s.unrealized_pnl = table.unrealized_pnl.back();
    s.total_pnl_pct = pct(s.total_pnl, s.starting_equity);
    s.realized_pnl_pct = pct(s.realized_pnl, s.starting_equity);

    // Buy and hold over the raw close series, sized with the starting equity
    const double first_close = table.close.front();
    if (first_close > 0) {
        const double change = table.close.back() / first_close - 1.0;
        s.buy_and_hold_pnl = change * s.starting_equity;
        s.buy_and_hold_pnl_pct = change * 100.0;
    }

    s.exposure_intervals = static_cast<std::size_t>(
        std::count_if(table.open_positions.begin(), table.open_positions.end(),
                      [](std::size_t c) { return c > 0; }));
    s.exposure_fraction = static_cast<double>(s.exposure_intervals) / static_cast<double>(n);

    // Max drawdown: largest peak-to-trough drop, % taken against the peak of that drop
    double peak = equity[0];
    double dd_peak = peak;
    for (double eq : equity) {
        if (eq > peak) peak = eq;
        double dd = peak - eq;
        if (dd > s.max_drawdown) {
            s.max_drawdown = dd;
            dd_peak = peak;
        }
    }
    if (dd_peak > 0) s.max_drawdown_pct = pct(s.max_drawdown, dd_peak);

    // Sharpe: mean and std of period returns, annualized
    if (n >= 3) {
        std::vector<double> returns;
        returns.reserve(n - 1);
        for (std::size_t i = 1; i < n; ++i) {
            if (equity[i - 1] != 0)
                returns.push_back((equity[i] - equity[i - 1]) / equity[i - 1]);
            else
                returns.push_back(0);
        }
        double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());
        double sq_sum = 0;
        for (double r : returns) sq_sum += (r - mean) * (r - mean);
        double stddev = std::sqrt(sq_sum / static_cast<double>(returns.size() - 1));
        if (stddev != 0)
            s.sharpe_ratio = (mean / stddev) * std::sqrt(periods_per_year);
    }

    // Trade statistics over closed positions
    double win_sum = 0;
    double loss_sum = 0;
    double duration_sum = 0;
    for (const auto& p : ledger) {
        if (p.isOpen()) {
            ++s.open_positions;
            continue;
        }
        ++s.num_trades;
        double pnl = p.realizedPnl();
        if (pnl > 0) {
            ++s.winning_trades;
            win_sum += pnl;
        } else if (pnl < 0) {
            ++s.losing_trades;
            loss_sum += pnl;
        }
        s.best_trade = s.best_trade ? std::max(*s.best_trade, pnl) : pnl;
        s.worst_trade = s.worst_trade ? std::min(*s.worst_trade, pnl) : pnl;

        double d = static_cast<double>(p.duration());
        s.max_position_duration = s.max_position_duration ? std::max(*s.max_position_duration, d) : d;
        duration_sum += d;
    }

    if (s.num_trades > 0) {
        const double trades = static_cast<double>(s.num_trades);
        double win_rate = static_cast<double>(s.winning_trades) / trades;
        s.win_rate = win_rate;
        if (s.winning_trades > 0) s.avg_win = win_sum / static_cast<double>(s.winning_trades);
        if (s.losing_trades > 0) s.avg_loss = loss_sum / static_cast<double>(s.losing_trades);
        s.expectancy = win_rate * s.avg_win.value_or(0.0) + (1.0 - win_rate) * s.avg_loss.value_or(0.0);
        s.avg_position_duration = duration_sum / trades;
    }
    if (loss_sum != 0) s.profit_factor = win_sum / std::abs(loss_sum);

    return s;
}

StatEntries Stats::entries() const {
    return {
        {"start", static_cast<double>(start)},
        {"end", static_cast<double>(end)},
        {"duration", static_cast<double>(duration)},
        {"intervals", asOptional(intervals)},
        {"starting_equity", starting_equity},
        {"final_equity", final_equity},
        {"peak_equity", peak_equity},
        {"total_pnl", total_pnl},
        {"total_pnl_pct", total_pnl_pct},
        {"realized_pnl", realized_pnl},
        {"realized_pnl_pct", realized_pnl_pct},
        {"unrealized_pnl", unrealized_pnl},
        {"buy_and_hold_pnl", buy_and_hold_pnl},
        {"buy_and_hold_pnl_pct", buy_and_hold_pnl_pct},
        {"exposure_intervals", asOptional(exposure_intervals)},
        {"exposure_fraction", exposure_fraction},
        {"max_drawdown", max_drawdown},
        {"max_drawdown_pct", max_drawdown_pct},
        {"sharpe_ratio", sharpe_ratio},
        {"num_trades", asOptional(num_trades)},
        {"open_positions", asOptional(open_positions)},
        {"winning_trades", asOptional(winning_trades)},
        {"losing_trades", asOptional(losing_trades)},
        {"win_rate", win_rate},
        {"avg_win", avg_win},
        {"avg_loss", avg_loss},
        {"best_trade", best_trade},
        {"worst_trade", worst_trade},
        {"profit_factor", profit_factor},
        {"expectancy", expectancy},
        {"max_position_duration", max_position_duration},
        {"avg_position_duration", avg_position_duration},
    };
}

std::optional<double> findStat(const StatEntries& entries, const std::string& name) {
    for (const auto& e : entries)
        if (e.first == name) return e.second;
    return std::nullopt;
}

} // namespace ledgerbt
