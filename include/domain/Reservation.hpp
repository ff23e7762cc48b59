#pragma once

#include "enums/ReservationStatus.hpp"
#include "TimeInterval.hpp"
#include "Timestamp.hpp"
#include <string>

namespace hospitality::domain {

/**
 * @brief Бронь ресурса на полуоткрытый интервал
 *
 * Интервал не редактируется: перенос - это отмена + новая бронь.
 */
struct Reservation {
    std::string id;             ///< UUID брони
    std::string resourceId;     ///< FK на bookable_resources
    std::string propertyId;
    std::string customerId;
    TimeInterval interval;      ///< [start, end)
    int partySize = 1;
    ReservationStatus status = ReservationStatus::HELD;
    std::string cancellationReason;
    Timestamp createdAt;
    Timestamp updatedAt;

    Reservation() = default;

    /**
     * @brief Занимает ли бронь интервал ресурса
     */
    bool isActive() const {
        return domain::isActive(status);
    }

    bool conflictsWith(const TimeInterval& other) const {
        return isActive() && interval.overlaps(other);
    }
};

} // namespace hospitality::domain
