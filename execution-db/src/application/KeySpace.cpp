#include "application/KeySpace.hpp"
#include <stdexcept>

namespace execdb::application {

namespace {

const char* suffixOf(KeyKind kind) {
    switch (kind) {
        case KeyKind::TRADER:                   return "";
        case KeyKind::ACCOUNTS:                 return ":Accounts:";
        case KeyKind::ORDERS:                   return ":Orders:";
        case KeyKind::POSITIONS:                return ":Positions:";
        case KeyKind::STRATEGIES:               return ":Strategies:";
        case KeyKind::INDEX_ORDER_POSITION:     return ":Index:OrderPosition";
        case KeyKind::INDEX_ORDER_STRATEGY:     return ":Index:OrderStrategy";
        case KeyKind::INDEX_POSITION_STRATEGY:  return ":Index:PositionStrategy";
        case KeyKind::INDEX_POSITION_ORDERS:    return ":Index:PositionOrders:";
        case KeyKind::INDEX_STRATEGY_ORDERS:    return ":Index:StrategyOrders:";
        case KeyKind::INDEX_STRATEGY_POSITIONS: return ":Index:StrategyPositions:";
        case KeyKind::INDEX_ORDERS:             return ":Index:Orders";
        case KeyKind::INDEX_ORDERS_WORKING:     return ":Index:Orders:Working";
        case KeyKind::INDEX_ORDERS_COMPLETED:   return ":Index:Orders:Completed";
        case KeyKind::INDEX_POSITIONS:          return ":Index:Positions";
        case KeyKind::INDEX_POSITIONS_OPEN:     return ":Index:Positions:Open";
        case KeyKind::INDEX_POSITIONS_CLOSED:   return ":Index:Positions:Closed";
    }
    throw std::invalid_argument("Unknown key kind");
}

} // namespace

bool KeySpace::takesId(KeyKind kind) {
    switch (kind) {
        case KeyKind::ORDERS:
        case KeyKind::POSITIONS:
        case KeyKind::INDEX_POSITION_ORDERS:
        case KeyKind::INDEX_STRATEGY_ORDERS:
        case KeyKind::INDEX_STRATEGY_POSITIONS:
            return true;
        default:
            return false;
    }
}

std::string KeySpace::key(
    const domain::TraderId& traderId,
    KeyKind kind,
    const std::optional<std::string>& id)
{
    if (id && !takesId(kind)) {
        throw std::invalid_argument("Key kind does not take an id: " + *id);
    }

    std::string result = "Trader-" + traderId.value() + suffixOf(kind);
    if (id) {
        result += *id;
    }
    return result;
}

} // namespace execdb::application
