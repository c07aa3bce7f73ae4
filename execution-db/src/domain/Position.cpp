#include "domain/Position.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace execdb::domain {

Position::Position(const OrderFilledEvent& opening)
    : accountId(opening.accountId),
      fromOrder(opening.clOrdId),
      symbol(opening.symbol),
      entry(opening.side),
      quoteCurrency(opening.currency),
      openedTime(opening.timestamp)
{
    if (!opening.positionId) {
        throw std::invalid_argument("Fill " + opening.executionId + " carries no position id");
    }
    id = *opening.positionId;
    fold(opening);
}

void Position::apply(const OrderFilledEvent& fill) {
    if (fill.positionId && *fill.positionId != id) {
        throw std::invalid_argument("Fill for position " + *fill.positionId + " applied to " + id);
    }
    if (fill.symbol != symbol) {
        throw std::invalid_argument("Fill for " + fill.symbol + " applied to position in " + symbol);
    }
    fold(fill);
}

void Position::fold(const OrderFilledEvent& fill) {
    if (fill.filledQuantity <= 0) {
        throw std::invalid_argument(
            "Fill " + fill.executionId + " has non-positive quantity " + std::to_string(fill.filledQuantity));
    }

    const int64_t signedQuantity = fill.side == OrderSide::BUY ? fill.filledQuantity : -fill.filledQuantity;
    const double price = fill.averagePrice.toDouble();

    if (relativeQuantity == 0 || (relativeQuantity > 0) == (signedQuantity > 0)) {
        // Наращивание позиции
        const int64_t held = std::llabs(relativeQuantity);
        averageOpenPrice = (averageOpenPrice * held + price * fill.filledQuantity)
                           / static_cast<double>(held + fill.filledQuantity);
    } else {
        // Сокращение, возможно с переворотом
        const int64_t closing = std::min<int64_t>(std::llabs(relativeQuantity), fill.filledQuantity);
        const double direction = relativeQuantity > 0 ? 1.0 : -1.0;
        realizedPnl += (price - averageOpenPrice) * direction * closing;
        averageClosePrice = (averageClosePrice.value_or(0.0) * closedQuantity + price * closing)
                            / static_cast<double>(closedQuantity + closing);
        closedQuantity += closing;

        if (fill.filledQuantity > closing) {
            averageOpenPrice = price;
        }
    }

    relativeQuantity += signedQuantity;
    quantity = std::llabs(relativeQuantity);
    peakQuantity = std::max(peakQuantity, quantity);
    side = relativeQuantity > 0 ? PositionSide::LONG
         : relativeQuantity < 0 ? PositionSide::SHORT
         : PositionSide::FLAT;

    if (relativeQuantity == 0) {
        closedTime = fill.timestamp;
    } else {
        closedTime.reset();
    }

    orderIds.insert(fill.clOrdId);
    executionIds.push_back(fill.executionId);
    events.push_back(std::make_shared<const OrderFilledEvent>(fill));
}

bool Position::operator==(const Position& other) const {
    if (id != other.id || accountId != other.accountId || fromOrder != other.fromOrder ||
        symbol != other.symbol || entry != other.entry || side != other.side ||
        relativeQuantity != other.relativeQuantity || quantity != other.quantity ||
        peakQuantity != other.peakQuantity || closedQuantity != other.closedQuantity ||
        averageOpenPrice != other.averageOpenPrice || averageClosePrice != other.averageClosePrice ||
        realizedPnl != other.realizedPnl || quoteCurrency != other.quoteCurrency ||
        openedTime != other.openedTime || closedTime != other.closedTime ||
        orderIds != other.orderIds || executionIds != other.executionIds ||
        events.size() != other.events.size()) {
        return false;
    }

    for (size_t i = 0; i < events.size(); ++i) {
        if (!events[i]->sameAs(*other.events[i])) {
            return false;
        }
    }
    return true;
}

} // namespace execdb::domain
