#pragma once

#include <string>
#include <stdexcept>

namespace hospitality::domain {

/**
 * @brief Статус складской позиции
 */
enum class ItemStatus {
    ACTIVE,
    INACTIVE,
    DISCONTINUED
};

inline std::string toString(ItemStatus status) {
    switch (status) {
        case ItemStatus::ACTIVE:       return "ACTIVE";
        case ItemStatus::INACTIVE:     return "INACTIVE";
        case ItemStatus::DISCONTINUED: return "DISCONTINUED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline ItemStatus itemStatusFromString(const std::string& str) {
    if (str == "ACTIVE")       return ItemStatus::ACTIVE;
    if (str == "INACTIVE")     return ItemStatus::INACTIVE;
    if (str == "DISCONTINUED") return ItemStatus::DISCONTINUED;
    throw std::invalid_argument("Unknown ItemStatus: " + str);
}

} // namespace hospitality::domain
