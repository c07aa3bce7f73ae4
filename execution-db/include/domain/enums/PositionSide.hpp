#pragma once

#include <string>

namespace execdb::domain {

/**
 * @brief Направление позиции по знаку относительного количества
 */
enum class PositionSide {
    FLAT,
    LONG,
    SHORT
};

inline std::string toString(PositionSide side) {
    switch (side) {
        case PositionSide::FLAT:  return "FLAT";
        case PositionSide::LONG:  return "LONG";
        case PositionSide::SHORT: return "SHORT";
    }
    return "UNKNOWN";
}

} // namespace execdb::domain
