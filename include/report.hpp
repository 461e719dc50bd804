#pragma once

#include "pnl.hpp"
#include "position.hpp"
#include "stats.hpp"
#include <string>
#include <ostream>
#include <iostream>
#include <vector>

namespace ledgerbt {

class Report {
public:
    /// strategy_name and strategy_params are included in report output (e.g. "sma_crossover", "fast=10 slow=30").
    Report(const PnlTable& pnl, const std::vector<Position>& ledger, const Stats& stats,
           const std::string& strategy_name = "",
           const std::string& strategy_params = "");

    /// Print summary to console.
    void printSummary(std::ostream& out = std::cout) const;

    /// Write the position ledger (open and closed) as CSV. Returns false and logs to stderr on failure.
    bool writeLedger(const std::string& filepath) const;

    /// Write the PnL table as CSV, one row per bar. Returns false and logs to stderr on failure.
    bool writePnlTable(const std::string& filepath) const;

    /// Write full report to a text file. Returns false and logs to stderr on failure.
    bool writeReport(const std::string& filepath) const;

private:
    void printReportHeader(std::ostream& out) const;
    void printMetrics(std::ostream& out) const;

    const PnlTable& pnl_;
    const std::vector<Position>& ledger_;
    const Stats& stats_;
    std::string strategy_name_;
    std::string strategy_params_;
};

} // namespace ledgerbt
