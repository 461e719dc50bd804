#pragma once

#include "bar.hpp"
#include "order.hpp"
#include <vector>

namespace ledgerbt {

class PositionsBook;  // forward declaration

/// Interface your trading algorithm must implement.
/// The engine calls onCandle() once per interval in chronological order.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    /// history: bars up to and including the current one (no look-ahead).
    /// book: open positions before this interval's fills.
    /// Returned orders fill against the next bar; exits are applied before entries.
    virtual std::vector<Order> onCandle(const BarHistory& history, const PositionsBook& book) = 0;
};

} // namespace ledgerbt
