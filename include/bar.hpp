#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace ledgerbt {

/// Seconds since the Unix epoch (UTC).
using Timestamp = std::int64_t;

/// Single OHLCV bar.
struct Bar {
    Timestamp time{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
};

/// Read-only view of bars [0, t] handed to the strategy.
/// It holds no reference past bar t, so a strategy cannot look ahead.
class BarHistory {
public:
    using const_iterator = const Bar*;

    BarHistory(const Bar* first, std::size_t count) : first_(first), count_(count) {}

    std::size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    const Bar& operator[](std::size_t i) const { return first_[i]; }
    const Bar& at(std::size_t i) const {
        if (i >= count_) throw std::out_of_range("BarHistory::at: index past current bar");
        return first_[i];
    }

    /// Current bar (last visible).
    const Bar& back() const { return first_[count_ - 1]; }

    const_iterator begin() const { return first_; }
    const_iterator end() const { return first_ + count_; }

private:
    const Bar* first_;
    std::size_t count_;
};

} // namespace ledgerbt
