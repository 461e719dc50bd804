#include "report.hpp"
#include "timestamp.hpp"
#include <fstream>
#include <iomanip>
#include <optional>

namespace ledgerbt {

namespace {
    void writeCsvQuoted(std::ostream& out, const std::string& s) {
        out << '"';
        for (char c : s) {
            if (c == '"') out << "\"\"";
            else out << c;
        }
        out << '"';
    }

    void printOptional(std::ostream& out, const std::optional<double>& v, const char* suffix = "") {
        if (v) out << *v << suffix;
        else out << "n/a";
    }

    void printDuration(std::ostream& out, const std::optional<double>& seconds) {
        if (seconds) out << formatDuration(static_cast<std::int64_t>(*seconds));
        else out << "n/a";
    }
}

Report::Report(const PnlTable& pnl, const std::vector<Position>& ledger, const Stats& stats,
               const std::string& strategy_name, const std::string& strategy_params)
    : pnl_(pnl), ledger_(ledger), stats_(stats)
    , strategy_name_(strategy_name), strategy_params_(strategy_params) {}

void Report::printReportHeader(std::ostream& out) const {
    if (!strategy_name_.empty()) {
        out << "Strategy: " << strategy_name_;
        if (!strategy_params_.empty()) out << " (" << strategy_params_ << ")";
        out << "\n";
    }
}

void Report::printMetrics(std::ostream& out) const {
    const Stats& m = stats_;
    const std::ios_base::fmtflags saved_flags = out.flags();
    const std::streamsize saved_precision = out.precision();
    out << std::fixed << std::setprecision(2);
    out << "Start:            " << formatTimestamp(m.start) << "\n";
    out << "End:              " << formatTimestamp(m.end) << "\n";
    out << "Duration:         " << formatDuration(m.duration) << "\n";
    out << "Bars:             " << m.intervals << "\n";
    out << "Starting equity:  " << m.starting_equity << "\n";
    out << "Final equity:     " << m.final_equity << "\n";
    out << "Peak equity:      " << m.peak_equity << "\n";
    out << "Total P&L:        " << m.total_pnl << " (";
    printOptional(out, m.total_pnl_pct, "%");
    out << ")\n";
    out << "Realized P&L:     " << m.realized_pnl << " (";
    printOptional(out, m.realized_pnl_pct, "%");
    out << ")\n";
    out << "Unrealized P&L:   " << m.unrealized_pnl << "\n";
    out << "Buy & hold P&L:   ";
    printOptional(out, m.buy_and_hold_pnl);
    out << " (";
    printOptional(out, m.buy_and_hold_pnl_pct, "%");
    out << ")\n";
    out << "Exposure:         " << m.exposure_intervals << " bars ("
        << m.exposure_fraction * 100.0 << "%)\n";
    out << "Max drawdown:     " << m.max_drawdown << " (";
    printOptional(out, m.max_drawdown_pct, "%");
    out << ")\n";
    out << "Sharpe ratio:     " << std::setprecision(3);
    printOptional(out, m.sharpe_ratio);
    out << "\n" << std::setprecision(2);
    out << "Closed trades:    " << m.num_trades << "\n";
    out << "Open positions:   " << m.open_positions << "\n";
    out << "Winning trades:   " << m.winning_trades << "\n";
    out << "Losing trades:    " << m.losing_trades << "\n";
    out << "Win rate:         ";
    printOptional(out, m.win_rate ? std::optional<double>(*m.win_rate * 100.0) : std::nullopt, "%");
    out << "\nAvg win:          ";
    printOptional(out, m.avg_win);
    out << "\nAvg loss:         ";
    printOptional(out, m.avg_loss);
    out << "\nBest trade:       ";
    printOptional(out, m.best_trade);
    out << "\nWorst trade:      ";
    printOptional(out, m.worst_trade);
    out << "\nProfit factor:    ";
    printOptional(out, m.profit_factor);
    out << "\nExpectancy:       ";
    printOptional(out, m.expectancy);
    out << "\nMax trade length: ";
    printDuration(out, m.max_position_duration);
    out << "\nAvg trade length: ";
    printDuration(out, m.avg_position_duration);
    out << "\n";
    out.flags(saved_flags);
    out.precision(saved_precision);
}

void Report::printSummary(std::ostream& out) const {
    out << "\n========== Backtest Report ==========\n";
    printReportHeader(out);
    printMetrics(out);
    out << "======================================\n\n";
}

bool Report::writeLedger(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "id,symbol,status,quantity,entry_time,entry_price,exit_time,exit_price,realized_pnl\n";
    f << std::setprecision(10);
    for (const auto& p : ledger_) {
        f << p.id << ',';
        writeCsvQuoted(f, p.symbol);
        f << ',' << (p.isOpen() ? "open" : "closed") << ','
          << p.quantity << ',' << formatTimestamp(p.entry_time) << ',' << p.entry_price << ',';
        if (p.exit_time) f << formatTimestamp(*p.exit_time);
        f << ',';
        if (p.exit_price) f << *p.exit_price;
        f << ',';
        if (p.isClosed()) f << p.realizedPnl();
        f << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write ledger: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writePnlTable(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "bar_index,timestamp,close,realized_pnl,unrealized_pnl,total_pnl,open_notional,cash_balance,equity,open_positions";
    for (const auto& s : pnl_.positions)
        f << ",pos-" << s.id << "-value,pos-" << s.id << "-pnl";
    f << "\n";
    f << std::fixed << std::setprecision(4);
    for (std::size_t i = 0; i < pnl_.size(); ++i) {
        f << i << ',' << formatTimestamp(pnl_.time[i]) << ',' << pnl_.close[i] << ','
          << pnl_.realized_pnl[i] << ',' << pnl_.unrealized_pnl[i] << ',' << pnl_.total_pnl[i] << ','
          << pnl_.open_notional[i] << ',' << pnl_.cash_balance[i] << ',' << pnl_.equity[i] << ','
          << pnl_.open_positions[i];
        for (const auto& s : pnl_.positions)
            f << ',' << s.value[i] << ',' << s.pnl[i];
        f << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write PnL table: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeReport(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "Backtest Report\n";
    f << "================\n\n";
    if (!strategy_name_.empty()) {
        printReportHeader(f);
        f << "\n";
    }
    printMetrics(f);
    if (!f) {
        std::cerr << "Failed to write report: " << filepath << "\n";
        return false;
    }
    return true;
}

} // namespace ledgerbt
