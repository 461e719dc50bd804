#include "fill_engine.hpp"
#include "errors.hpp"
#include "timestamp.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace ledgerbt {

namespace {
    // Relative slack so a strategy committing exactly its buying power is not
    // rejected by rounding in value / price * price.
    constexpr double BUYING_POWER_EPS = 1e-9;
}

FillEngine::FillEngine(double starting_cash, std::string symbol)
    : symbol_(std::move(symbol))
    , cash_(starting_cash)
{
}

std::size_t FillEngine::process(const std::vector<Order>& orders, const Bar& next_bar) {
    // Validate the whole batch first: a malformed order or a bad exit id aborts before any fill.
    for (const auto& o : orders) validateOrder(o);
    checkExits(orders, next_bar);

    std::size_t fills = 0;

    // Exits first: frees buying power and cannot close a position opened this interval.
    for (const auto& o : orders)
        if (o.isExit() && fillExit(o, next_bar)) ++fills;

    for (const auto& o : orders)
        if (o.isEnter() && fillEnter(o, next_bar)) ++fills;

    return fills;
}

double FillEngine::equity(double mark_price) const {
    double eq = cash_;
    for (std::size_t i : open_) eq += ledger_[i].quantity * mark_price;
    return eq;
}

double FillEngine::grossExposure(double mark_price) const {
    double gross = 0;
    for (std::size_t i : open_) gross += std::abs(ledger_[i].quantity) * mark_price;
    return gross;
}

double FillEngine::buyingPower(double mark_price) const {
    return equity(mark_price) - grossExposure(mark_price);
}

std::optional<double> FillEngine::fillPrice(const Order& order, const Bar& bar) {
    if (!order.isLimit()) return bar.open;
    double limit = *order.price;
    if (limit < bar.low || limit > bar.high) return std::nullopt;
    return limit;
}

const Position* FillEngine::findOpen(PositionId id) const {
    if (id == 0 || id > ledger_.size()) return nullptr;
    const Position& p = ledger_[static_cast<std::size_t>(id - 1)];
    return p.isOpen() ? &p : nullptr;
}

void FillEngine::checkExits(const std::vector<Order>& orders, const Bar& bar) const {
    std::vector<PositionId> claimed;
    for (const auto& o : orders) {
        if (!o.isExit()) continue;
        const PositionId id = *o.position_id;
        bool duplicate = std::find(claimed.begin(), claimed.end(), id) != claimed.end();
        if (duplicate || !findOpen(id)) {
            std::ostringstream msg;
            msg << "exit references " << (duplicate ? "already exited" : "unknown or closed")
                << " position " << id << " at " << formatTimestamp(bar.time);
            throw UnknownPositionError(msg.str());
        }
        claimed.push_back(id);
    }
}

bool FillEngine::fillExit(const Order& order, const Bar& bar) {
    auto price = fillPrice(order, bar);
    if (!price) return false;  // limit not reached: dropped, position stays open

    const std::size_t idx = static_cast<std::size_t>(*order.position_id - 1);
    Position& pos = ledger_[idx];
    pos.exit_time = bar.time;
    pos.exit_price = *price;
    pos.status = PositionStatus::Closed;
    cash_ += pos.quantity * *price;
    open_.erase(std::find(open_.begin(), open_.end(), idx));
    return true;
}

bool FillEngine::fillEnter(const Order& order, const Bar& bar) {
    auto price = fillPrice(order, bar);
    if (!price) return false;

    double qty = order.quantity ? *order.quantity : *order.value / *price;
    if (!std::isfinite(qty) || qty == 0) {
        throw MalformedOrderError("enter order resolves to an invalid quantity: " + describeOrder(order));
    }

    // Open positions are marked at the fill bar's open.
    double required = std::abs(qty * *price);
    double available = buyingPower(bar.open);
    if (required > available + BUYING_POWER_EPS * std::max(1.0, required)) {
        std::ostringstream msg;
        msg << "insufficient buying power for " << describeOrder(order)
            << " at " << formatTimestamp(bar.time) << ": required " << required
            << ", available " << available;
        throw InsufficientCapitalError(msg.str());
    }

    Position pos;
    pos.id = static_cast<PositionId>(ledger_.size() + 1);
    pos.symbol = symbol_;
    pos.quantity = qty;
    pos.entry_time = bar.time;
    pos.entry_price = *price;
    pos.status = PositionStatus::Open;
    open_.push_back(ledger_.size());
    ledger_.push_back(pos);

    cash_ -= qty * *price;
    return true;
}

} // namespace ledgerbt
