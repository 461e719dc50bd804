#pragma once

#include "bar.hpp"
#include <vector>
#include <string>
#include <optional>
#include <utility>

namespace ledgerbt {

/// Loads OHLCV bars from a CSV file.
/// Header names the columns: timestamp/date/datetime/time, open, high, low, close [, volume].
/// Column order is free; header matching is case-insensitive.
class DataSource {
public:
    explicit DataSource(const std::string& filepath);

    /// Load bars from the CSV file. Returns false (reason on stderr) if the file
    /// cannot be read, a required column is missing, or a row does not parse.
    /// Blank lines are skipped. Ordering is not checked here; Backtester does that.
    bool load();

    const std::vector<Bar>& bars() const { return bars_; }
    std::vector<Bar> takeBars() { return std::move(bars_); }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }

    /// Get bar at index (0-based).
    const Bar& at(std::size_t i) const { return bars_.at(i); }

private:
    struct Columns {
        int time{-1};
        int open{-1};
        int high{-1};
        int low{-1};
        int close{-1};
        int volume{-1};
    };

    std::string filepath_;
    std::vector<Bar> bars_;

    static std::optional<Bar> parseLine(const std::string& line, const Columns& cols);
};

} // namespace ledgerbt
