#include "order.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

namespace ledgerbt {

Order Order::enterQuantity(double quantity, std::optional<double> limit_price) {
    Order o;
    o.action = OrderAction::Enter;
    o.quantity = quantity;
    o.price = limit_price;
    return o;
}

Order Order::enterValue(double value, std::optional<double> limit_price) {
    Order o;
    o.action = OrderAction::Enter;
    o.value = value;
    o.price = limit_price;
    return o;
}

Order Order::exit(PositionId id, std::optional<double> limit_price) {
    Order o;
    o.action = OrderAction::Exit;
    o.position_id = id;
    o.price = limit_price;
    return o;
}

void validateOrder(const Order& order) {
    if (order.price && (!std::isfinite(*order.price) || *order.price <= 0))
        throw MalformedOrderError("limit price must be a positive finite number: " + describeOrder(order));

    if (order.isEnter()) {
        if (order.quantity.has_value() == order.value.has_value())
            throw MalformedOrderError("enter order needs exactly one of quantity or value: " + describeOrder(order));
        double size = order.quantity ? *order.quantity : *order.value;
        if (!std::isfinite(size) || size == 0)
            throw MalformedOrderError("enter order size must be finite and non-zero: " + describeOrder(order));
        if (order.position_id)
            throw MalformedOrderError("enter order must not reference a position: " + describeOrder(order));
        return;
    }

    if (!order.position_id)
        throw MalformedOrderError("exit order needs a position id: " + describeOrder(order));
    if (order.quantity || order.value)
        throw MalformedOrderError("exit order closes the whole position; quantity/value not allowed: " + describeOrder(order));
}

std::string describeOrder(const Order& order) {
    std::ostringstream out;
    out << (order.isEnter() ? "enter" : "exit");
    if (order.quantity) out << " quantity=" << *order.quantity;
    if (order.value) out << " value=" << *order.value;
    if (order.position_id) out << " position=" << *order.position_id;
    if (order.price) out << " limit=" << *order.price;
    else out << " market";
    return out.str();
}

} // namespace ledgerbt
