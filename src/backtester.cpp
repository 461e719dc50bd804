#include "backtester.hpp"
#include "errors.hpp"
#include "positions_book.hpp"
#include "strategy.hpp"
#include "timestamp.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace ledgerbt {

Backtester::Backtester(std::vector<Bar> bars,
                       std::unique_ptr<IStrategy> strategy,
                       double starting_equity,
                       std::string symbol)
    : bars_(std::move(bars))
    , strategy_(std::move(strategy))
    , starting_equity_(starting_equity)
    , symbol_(std::move(symbol))
    , fills_(starting_equity, symbol_)
{
    if (!strategy_) throw std::invalid_argument("Backtester: strategy is null");
    if (!std::isfinite(starting_equity_) || starting_equity_ < 0)
        throw InvalidInputError("starting equity must be finite and >= 0");
    validateBars();
}

void Backtester::validateBars() const {
    if (bars_.empty()) throw InvalidInputError("bar sequence is empty");

    for (std::size_t i = 0; i < bars_.size(); ++i) {
        const Bar& b = bars_[i];
        std::ostringstream where;
        where << "bar " << i << " (" << formatTimestamp(b.time) << ")";

        if (!std::isfinite(b.open) || !std::isfinite(b.high) || !std::isfinite(b.low)
            || !std::isfinite(b.close) || !std::isfinite(b.volume))
            throw InvalidInputError(where.str() + ": non-finite value");
        if (b.high < b.low)
            throw InvalidInputError(where.str() + ": high below low");
        if (b.low <= 0)
            throw InvalidInputError(where.str() + ": prices must be positive");
        if (b.open < b.low || b.open > b.high || b.close < b.low || b.close > b.high)
            throw InvalidInputError(where.str() + ": open/close outside [low, high]");
        if (b.volume < 0)
            throw InvalidInputError(where.str() + ": negative volume");
        if (i > 0 && b.time <= bars_[i - 1].time)
            throw InvalidInputError(where.str() + ": timestamp not strictly increasing");
    }
}

void Backtester::run() {
    if (started_) throw std::logic_error("Backtester::run called twice; use a fresh instance per run");
    started_ = true;

    for (std::size_t i = 0; i + 1 < bars_.size(); ++i) {
        const Bar& next = bars_[i + 1];

        // Open shorts that can no longer be covered: equity at the next open is gone.
        double eq_at_open = fills_.equity(next.open);
        if (eq_at_open < 0) {
            std::ostringstream msg;
            msg << "equity negative at open of " << formatTimestamp(next.time)
                << ": " << eq_at_open << " (open positions cannot be covered)";
            throw InsufficientCapitalError(msg.str());
        }

        // 1. Strategy sees bars [0, i] and the ledger before this interval's fills
        BarHistory history(bars_.data(), i + 1);
        std::vector<Order> orders;
        {
            PositionsBook book(fills_.ledger(), fills_.openIndex(), bars_[i], fills_.cash());
            orders = strategy_->onCandle(history, book);
        }

        // 2. Fill at bar i+1: exits, then entries
        if (!orders.empty()) fills_.process(orders, next);
    }

    // 3. Reporting pass over the completed ledger
    pnl_ = computePnl(bars_, fills_.ledger(), starting_equity_);
    finished_ = true;
}

const PnlTable& Backtester::pnl() const {
    if (!finished_) throw std::logic_error("Backtester::pnl: run() has not completed");
    return pnl_;
}

Stats Backtester::stats(double periods_per_year) const {
    return computeStats(pnl(), fills_.ledger(), periods_per_year);
}

} // namespace ledgerbt
