#include "pnl.hpp"
#include "errors.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace ledgerbt {

namespace {

std::size_t barIndex(const std::vector<Timestamp>& times, Timestamp t, PositionId id) {
    auto it = std::lower_bound(times.begin(), times.end(), t);
    if (it == times.end() || *it != t)
        throw InvalidInputError("position " + std::to_string(id) + " time "
                                + std::to_string(t) + " is not a bar timestamp");
    return static_cast<std::size_t>(it - times.begin());
}

} // namespace

PnlTable computePnl(const std::vector<Bar>& bars,
                    const std::vector<Position>& ledger,
                    double starting_equity) {
    PnlTable table;
    const std::size_t n = bars.size();
    table.starting_equity = starting_equity;
    table.time.reserve(n);
    table.close.reserve(n);
    for (const auto& b : bars) {
        table.time.push_back(b.time);
        table.close.push_back(b.close);
    }

    table.realized_pnl.assign(n, 0.0);
    table.unrealized_pnl.assign(n, 0.0);
    table.total_pnl.assign(n, 0.0);
    table.open_notional.assign(n, 0.0);
    table.cash_balance.assign(n, 0.0);
    table.equity.assign(n, 0.0);
    table.open_positions.assign(n, 0);

    table.positions.reserve(ledger.size());
    for (const auto& pos : ledger) {
        const std::size_t entry = barIndex(table.time, pos.entry_time, pos.id);
        std::size_t held_end = n;
        if (pos.isClosed() && pos.exit_time && pos.exit_price) {
            held_end = barIndex(table.time, *pos.exit_time, pos.id);
            if (held_end <= entry)
                throw InvalidInputError("position " + std::to_string(pos.id) + " exits before it enters");
        }

        PositionSeries s;
        s.id = pos.id;
        s.value.assign(n, 0.0);
        s.pnl.assign(n, 0.0);

        for (std::size_t t = entry; t < held_end; ++t) {
            s.value[t] = pos.quantity * table.close[t];
            s.pnl[t] = pos.unrealizedPnl(table.close[t]);
            table.unrealized_pnl[t] += s.pnl[t];
            table.open_notional[t] += s.value[t];
            ++table.open_positions[t];
        }

        if (held_end < n) {
            const double realized = pos.realizedPnl();
            for (std::size_t t = held_end; t < n; ++t) {
                s.pnl[t] = realized;
                table.realized_pnl[t] += realized;
            }
        }

        table.positions.push_back(std::move(s));
    }

    for (std::size_t t = 0; t < n; ++t) {
        double total = 0;
        for (const auto& s : table.positions) total += s.pnl[t];
        table.total_pnl[t] = total;
        table.equity[t] = starting_equity + total;
        table.cash_balance[t] = table.equity[t] - table.open_notional[t];
    }

    return table;
}

} // namespace ledgerbt
