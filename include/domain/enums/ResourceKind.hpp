#pragma once

#include <string>
#include <stdexcept>

namespace hospitality::domain {

/**
 * @brief Тип бронируемого ресурса
 */
enum class ResourceKind {
    ROOM,   ///< Номер в отеле
    TABLE   ///< Столик в ресторане
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::ROOM:  return "ROOM";
        case ResourceKind::TABLE: return "TABLE";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline ResourceKind resourceKindFromString(const std::string& str) {
    if (str == "ROOM")  return ResourceKind::ROOM;
    if (str == "TABLE") return ResourceKind::TABLE;
    throw std::invalid_argument("Unknown ResourceKind: " + str);
}

} // namespace hospitality::domain
