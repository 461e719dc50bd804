#pragma once

#include "bar.hpp"
#include "position.hpp"
#include <cstddef>
#include <vector>

namespace ledgerbt {

/// Per-position columns of the PnL table.
struct PositionSeries {
    PositionId id{0};
    std::vector<double> value;  // quantity * close while held, else 0
    std::vector<double> pnl;    // 0 before entry, mark-to-market while held, realized after exit
};

/// One row per bar. Built once from the completed ledger; read-only afterwards.
/// At every row: cash_balance + open_notional == equity, equity == starting_equity + total_pnl.
struct PnlTable {
    double starting_equity{0};
    std::vector<Timestamp> time;
    std::vector<double> close;
    std::vector<PositionSeries> positions;

    std::vector<double> realized_pnl;
    std::vector<double> unrealized_pnl;
    std::vector<double> total_pnl;
    std::vector<double> open_notional;
    std::vector<double> cash_balance;
    std::vector<double> equity;
    std::vector<std::size_t> open_positions;

    std::size_t size() const { return time.size(); }
    bool empty() const { return time.empty(); }
};

/// Second pass over the ledger: depends only on each position's entry/exit
/// timestamps and prices, not on the order fills happened in.
/// A position is held on bars [entry, exit): it is marked at the entry bar's
/// close, and its exit bar already carries the frozen realized value.
/// Throws InvalidInputError if a position's times are not bar timestamps.
PnlTable computePnl(const std::vector<Bar>& bars,
                    const std::vector<Position>& ledger,
                    double starting_equity);

} // namespace ledgerbt
