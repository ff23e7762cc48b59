#pragma once

#include <string>
#include <stdexcept>

namespace hospitality::domain {

/**
 * @brief Единица учёта складской позиции
 */
enum class UnitOfMeasure {
    PIECE,
    KILOGRAM,
    GRAM,
    LITER,
    MILLILITER,
    BOTTLE,
    BOX,
    CASE
};

inline std::string toString(UnitOfMeasure unit) {
    switch (unit) {
        case UnitOfMeasure::PIECE:      return "PIECE";
        case UnitOfMeasure::KILOGRAM:   return "KILOGRAM";
        case UnitOfMeasure::GRAM:       return "GRAM";
        case UnitOfMeasure::LITER:      return "LITER";
        case UnitOfMeasure::MILLILITER: return "MILLILITER";
        case UnitOfMeasure::BOTTLE:     return "BOTTLE";
        case UnitOfMeasure::BOX:        return "BOX";
        case UnitOfMeasure::CASE:       return "CASE";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline UnitOfMeasure unitOfMeasureFromString(const std::string& str) {
    if (str == "PIECE")      return UnitOfMeasure::PIECE;
    if (str == "KILOGRAM")   return UnitOfMeasure::KILOGRAM;
    if (str == "GRAM")       return UnitOfMeasure::GRAM;
    if (str == "LITER")      return UnitOfMeasure::LITER;
    if (str == "MILLILITER") return UnitOfMeasure::MILLILITER;
    if (str == "BOTTLE")     return UnitOfMeasure::BOTTLE;
    if (str == "BOX")        return UnitOfMeasure::BOX;
    if (str == "CASE")       return UnitOfMeasure::CASE;
    throw std::invalid_argument("Unknown UnitOfMeasure: " + str);
}

} // namespace hospitality::domain
