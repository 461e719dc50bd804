#pragma once

#include "bar.hpp"
#include <optional>
#include <string>

namespace ledgerbt {

/// Parse a bar timestamp into epoch seconds (UTC).
/// Supports: "2024-01-02", "2024-01-02T09:30", "2024-01-02T09:30:00.000Z",
/// "2024-01-02 09:30:00", "2025-08-04T00_00_00", compact "20240102" and plain
/// epoch seconds ("1704186000"). Day-of-month is checked against the month.
std::optional<Timestamp> parseTimestamp(const std::string& text);

/// "YYYY-MM-DDTHH:MM:SS"
std::string formatTimestamp(Timestamp ts);

/// Human-readable duration, e.g. "3d 04:15:00".
std::string formatDuration(std::int64_t seconds);

} // namespace ledgerbt
