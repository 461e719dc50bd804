#pragma once

#include "bar.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace ledgerbt {

/// Unique, monotonic position identifier (first position is 1).
using PositionId = std::uint64_t;

enum class PositionStatus { Open, Closed };

/// One trade in the ledger. Created OPEN by an ENTER fill, closed once by an
/// EXIT fill, never touched again after that.
/// quantity is signed: + long, - short. Never zero.
struct Position {
    PositionId id{0};
    std::string symbol;
    double quantity{0};
    Timestamp entry_time{0};
    double entry_price{0};
    std::optional<Timestamp> exit_time;
    std::optional<double> exit_price;
    PositionStatus status{PositionStatus::Open};

    bool isOpen() const { return status == PositionStatus::Open; }
    bool isClosed() const { return status == PositionStatus::Closed; }
    bool isLong() const { return quantity > 0; }
    bool isShort() const { return quantity < 0; }

    /// quantity * (exit_price - entry_price); sign of quantity carries direction.
    /// Zero while the position is open.
    double realizedPnl() const {
        return exit_price ? quantity * (*exit_price - entry_price) : 0.0;
    }

    /// Mark-to-market PnL at mark_price (meaningful while open).
    double unrealizedPnl(double mark_price) const {
        return quantity * (mark_price - entry_price);
    }

    /// Seconds held; zero while open.
    std::int64_t duration() const { return exit_time ? *exit_time - entry_time : 0; }
};

} // namespace ledgerbt
