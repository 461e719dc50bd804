#pragma once

#include "position.hpp"
#include <optional>
#include <string>

namespace ledgerbt {

enum class OrderAction { Enter, Exit };

/// A strategy's intent for the next bar. Produced and consumed within one interval.
/// ENTER: exactly one of quantity / value (signed notional), no position id.
/// EXIT: position id only.
/// price set => limit order (fills at that price if inside next bar's [low, high]);
/// empty => market order (fills at next bar's open).
struct Order {
    OrderAction action{OrderAction::Enter};
    std::optional<double> quantity;
    std::optional<double> value;
    std::optional<double> price;
    std::optional<PositionId> position_id;

    bool isEnter() const { return action == OrderAction::Enter; }
    bool isExit() const { return action == OrderAction::Exit; }
    bool isLimit() const { return price.has_value(); }

    static Order enterQuantity(double quantity, std::optional<double> limit_price = std::nullopt);
    static Order enterValue(double value, std::optional<double> limit_price = std::nullopt);
    static Order exit(PositionId id, std::optional<double> limit_price = std::nullopt);
};

/// Throws MalformedOrderError if the order shape is invalid.
void validateOrder(const Order& order);

std::string describeOrder(const Order& order);

} // namespace ledgerbt
