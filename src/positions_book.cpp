#include "positions_book.hpp"
#include <algorithm>

namespace ledgerbt {

PositionsBook::PositionsBook(const std::vector<Position>& ledger, const Bar& current, double cash)
    : ledger_(ledger), close_(current.close), cash_(cash)
{
    for (const auto& p : ledger_)
        if (p.isOpen()) open_.push_back(p);
}

PositionsBook::PositionsBook(const std::vector<Position>& ledger, const std::vector<std::size_t>& open_index,
                             const Bar& current, double cash)
    : ledger_(ledger), close_(current.close), cash_(cash)
{
    open_.reserve(open_index.size());
    for (std::size_t i : open_index) open_.push_back(ledger_.at(i));
}

std::vector<Position> PositionsBook::closedPositions() const {
    std::vector<Position> out;
    for (const auto& p : ledger_)
        if (p.isClosed()) out.push_back(p);
    return out;
}

double PositionsBook::quantity() const {
    double q = 0;
    for (const auto& p : open_) q += p.quantity;
    return q;
}

double PositionsBook::value() const {
    double v = 0;
    for (const auto& p : open_) v += p.quantity * close_;
    return v;
}

bool PositionsBook::isLong() const {
    return std::any_of(open_.begin(), open_.end(), [](const Position& p) { return p.isLong(); });
}

bool PositionsBook::isShort() const {
    return std::any_of(open_.begin(), open_.end(), [](const Position& p) { return p.isShort(); });
}

std::vector<Order> PositionsBook::close() const {
    return closeIf([](const Position&) { return true; });
}

std::vector<Order> PositionsBook::closeLong() const {
    return closeIf([](const Position& p) { return p.isLong(); });
}

std::vector<Order> PositionsBook::closeShort() const {
    return closeIf([](const Position& p) { return p.isShort(); });
}

std::vector<Order> PositionsBook::closeIf(const std::function<bool(const Position&)>& pred) const {
    std::vector<Order> orders;
    for (const auto& p : open_)
        if (pred(p)) orders.push_back(Order::exit(p.id));
    return orders;
}

} // namespace ledgerbt
