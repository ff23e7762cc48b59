#pragma once

#include "domain/BookableResource.hpp"
#include "domain/Reservation.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hospitality::ports::input {

/**
 * @brief Запрос на регистрацию ресурса
 */
struct RegisterResourceRequest {
    std::string propertyId;
    domain::ResourceKind kind = domain::ResourceKind::ROOM;
    std::string name;
    int capacity = 1;
};

/**
 * @brief Запрос на бронирование
 *
 * propertyId - объект из контекста вызывающего; ресурс другого объекта
 * для него не существует.
 */
struct CreateReservationRequest {
    std::string propertyId;
    std::string resourceId;
    domain::Timestamp start;
    domain::Timestamp end;
    std::string customerId;
    int partySize = 1;
};

/**
 * @brief Интерфейс проверки доступности и бронирования
 *
 * Отказы - исключения из domain/exceptions/DomainException.hpp.
 */
class IAvailabilityService {
public:
    virtual ~IAvailabilityService() = default;

    virtual domain::BookableResource registerResource(const RegisterResourceRequest& request) = 0;

    /**
     * @brief Мягко деактивировать ресурс
     * @throws domain::NotFoundException если ресурс не найден или чужой
     */
    virtual domain::BookableResource deactivateResource(
        const std::string& propertyId,
        const std::string& resourceId
    ) = 0;

    /**
     * @brief Свободен ли ресурс на [start, end)
     * @throws domain::ValidationException если start >= end
     * @throws domain::NotFoundException если ресурс не найден
     */
    virtual bool checkAvailability(
        const std::string& resourceId,
        const domain::Timestamp& start,
        const domain::Timestamp& end
    ) = 0;

    /**
     * @brief Активные ресурсы объекта заданного вида, вмещающие partySize
     *        и свободные на [start, end)
     *
     * Порядок: по вместимости по возрастанию, затем по имени.
     * Результат - снимок без блокировки: createReservation перепроверяет.
     *
     * @throws domain::ValidationException если start >= end, partySize <= 0 или propertyId пуст
     */
    virtual std::vector<domain::BookableResource> findAvailableResources(
        const std::string& propertyId,
        domain::ResourceKind kind,
        int partySize,
        const domain::Timestamp& start,
        const domain::Timestamp& end
    ) = 0;

    /**
     * @brief Атомарно проверить доступность и создать бронь в статусе HELD
     * @throws domain::ConflictException если интервал занят
     */
    virtual domain::Reservation createReservation(const CreateReservationRequest& request) = 0;

    /**
     * @brief HELD -> CONFIRMED (повторное подтверждение - no-op)
     */
    virtual domain::Reservation confirmReservation(const std::string& reservationId) = 0;

    /**
     * @brief Отменить бронь (повторная отмена - no-op)
     */
    virtual domain::Reservation cancelReservation(
        const std::string& reservationId,
        const std::string& reason
    ) = 0;

    virtual std::optional<domain::Reservation> getReservation(const std::string& reservationId) = 0;

    virtual std::vector<domain::Reservation> listReservations(const std::string& resourceId) = 0;

    /**
     * @brief HELD брони, созданные раньше cutoff
     */
    virtual std::vector<domain::Reservation> listExpiredHolds(const domain::Timestamp& cutoff) = 0;

    /**
     * @brief Отменить бронь, если под блокировкой она всё ещё HELD и создана раньше cutoff
     * @return true если бронь отменена этим вызовом
     */
    virtual bool expireHold(const std::string& reservationId, const domain::Timestamp& cutoff) = 0;
};

} // namespace hospitality::ports::input
