#pragma once

#include <string>
#include <stdexcept>

namespace hospitality::domain {

/**
 * @brief Статус брони
 */
enum class ReservationStatus {
    HELD,       ///< Удерживается до подтверждения
    CONFIRMED,  ///< Подтверждена
    CANCELLED   ///< Отменена (строка остаётся для отчётов)
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(ReservationStatus status) {
    switch (status) {
        case ReservationStatus::HELD:      return "HELD";
        case ReservationStatus::CONFIRMED: return "CONFIRMED";
        case ReservationStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline ReservationStatus reservationStatusFromString(const std::string& str) {
    if (str == "HELD")      return ReservationStatus::HELD;
    if (str == "CONFIRMED") return ReservationStatus::CONFIRMED;
    if (str == "CANCELLED") return ReservationStatus::CANCELLED;
    throw std::invalid_argument("Unknown ReservationStatus: " + str);
}

/**
 * @brief Занимает ли бронь интервал ресурса
 */
inline bool isActive(ReservationStatus status) {
    return status == ReservationStatus::HELD || status == ReservationStatus::CONFIRMED;
}

} // namespace hospitality::domain
