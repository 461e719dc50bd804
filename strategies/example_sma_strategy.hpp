#pragma once

#include "strategy.hpp"
#include <memory>

namespace ledgerbt {

/// Factory: create SMA crossover strategy.
/// size = fraction of current equity committed per entry (0 < size <= 1).
std::unique_ptr<IStrategy> createSmaCrossoverStrategy(int fast = 9, int slow = 21, double size = 0.5);

} // namespace ledgerbt
