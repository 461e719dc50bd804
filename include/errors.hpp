#pragma once

#include <stdexcept>
#include <string>

namespace ledgerbt {

/// Base of every fault that aborts a backtest run.
/// None of these are retried: the ledger is left as of the last successful fill.
class BacktestError : public std::runtime_error {
public:
    explicit BacktestError(const std::string& what) : std::runtime_error(what) {}
};

/// Order shape is invalid or ambiguous (e.g. both quantity and value set).
class MalformedOrderError : public BacktestError {
public:
    explicit MalformedOrderError(const std::string& what) : BacktestError(what) {}
};

/// EXIT references a position id that does not exist or is already closed.
class UnknownPositionError : public BacktestError {
public:
    explicit UnknownPositionError(const std::string& what) : BacktestError(what) {}
};

/// ENTER needs more buying power than is available, or equity went negative.
class InsufficientCapitalError : public BacktestError {
public:
    explicit InsufficientCapitalError(const std::string& what) : BacktestError(what) {}
};

/// Bar sequence empty, not strictly time-ordered, or carrying non-finite values.
class InvalidInputError : public BacktestError {
public:
    explicit InvalidInputError(const std::string& what) : BacktestError(what) {}
};

using OrderError = MalformedOrderError;
using NotFoundError = UnknownPositionError;

} // namespace ledgerbt
