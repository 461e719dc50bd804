#include "example_sma_strategy.hpp"
#include "positions_book.hpp"
#include "bar.hpp"
#include <vector>
#include <memory>

namespace ledgerbt {

/// SMA fast/slow: long when fast > slow, short when fast < slow.
/// On a flip, closes everything and opens the other side in the same interval
/// (exits fill first, so the freed capital backs the new entry).
class SmaCrossoverStrategy : public IStrategy {
public:
    SmaCrossoverStrategy(int fast_period, int slow_period, double position_size)
        : fast_period_(fast_period)
        , slow_period_(slow_period)
        , position_size_(position_size)
    {}

    std::vector<Order> onCandle(const BarHistory& history, const PositionsBook& book) override {
        std::vector<Order> orders;
        const std::size_t n = history.size();
        if (n < static_cast<std::size_t>(slow_period_)) return orders;

        double fast_sma = sma(history, fast_period_);
        double slow_sma = sma(history, slow_period_);
        if (history.back().close <= 0) return orders;

        bool want_long = fast_sma > slow_sma;
        bool want_short = fast_sma < slow_sma;

        // 1) Exit: close the side that disagrees with the signal
        if (want_long && book.isShort()) orders = book.closeShort();
        else if (want_short && book.isLong()) orders = book.closeLong();

        // 2) Entry when flat (or just flattened)
        bool flat_after_exits = book.isFlat() || orders.size() == book.openPositions().size();
        if (!flat_after_exits) return orders;

        // Sized on equity at this close; fills at the next open.
        double notional = position_size_ * book.equity();
        if (notional <= 0) return orders;

        if (want_long) orders.push_back(Order::enterValue(notional));
        else if (want_short) orders.push_back(Order::enterValue(-notional));
        return orders;
    }

private:
    static double sma(const BarHistory& history, int period) {
        const std::size_t n = history.size();
        if (period <= 0 || n < static_cast<std::size_t>(period)) return 0;
        double sum = 0;
        for (int i = 0; i < period; ++i) {
            sum += history[n - 1 - static_cast<std::size_t>(i)].close;
        }
        return sum / period;
    }

    int fast_period_;
    int slow_period_;
    double position_size_;
};

std::unique_ptr<IStrategy> createSmaCrossoverStrategy(int fast, int slow, double size) {
    return std::make_unique<SmaCrossoverStrategy>(fast, slow, size);
}

} // namespace ledgerbt
