#pragma once

#include "domain/BookableResource.hpp"
#include "domain/Reservation.hpp"
#include "domain/TimeInterval.hpp"
#include "domain/Timestamp.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hospitality::ports::output {

/**
 * @brief Единица работы над агрегатом "ресурс + его брони"
 *
 * Пока объект жив, ресурс эксклюзивно заблокирован.
 * Изменения видны другим только после commit().
 * Уничтожение без commit() = откат.
 */
class IReservationUnitOfWork {
public:
    virtual ~IReservationUnitOfWork() = default;

    /**
     * @brief Заблокированный ресурс
     */
    virtual const domain::BookableResource& resource() const = 0;

    /**
     * @brief Активные (HELD / CONFIRMED) брони ресурса, пересекающиеся с интервалом
     */
    virtual std::vector<domain::Reservation> findActiveOverlapping(const domain::TimeInterval& interval) = 0;

    /**
     * @brief Бронь этого ресурса по ID
     */
    virtual std::optional<domain::Reservation> findReservation(const std::string& reservationId) = 0;

    /**
     * @throws domain::ConflictException если хранилище отвергло пересечение
     */
    virtual void insert(const domain::Reservation& reservation) = 0;

    /**
     * @brief Сменить статус брони (интервал не меняется никогда)
     */
    virtual void updateStatus(
        const std::string& reservationId,
        domain::ReservationStatus status,
        const std::string& reason,
        const domain::Timestamp& at
    ) = 0;

    /**
     * @brief Зафиксировать изменения
     * @throws domain::ConflictException если хранилище обнаружило пересечение
     */
    virtual void commit() = 0;
};

/**
 * @brief Интерфейс хранилища ресурсов и броней
 *
 * Output Port. Все изменения броней идут только через lockResource().
 */
class IReservationRepository {
public:
    virtual ~IReservationRepository() = default;

    virtual void saveResource(const domain::BookableResource& resource) = 0;

    virtual std::optional<domain::BookableResource> findResource(const std::string& resourceId) = 0;

    virtual std::vector<domain::BookableResource> findResourcesByProperty(const std::string& propertyId) = 0;

    /**
     * @brief Мягкая деактивация ресурса
     * @return false если ресурс не найден
     */
    virtual bool setResourceActive(const std::string& resourceId, bool active) = 0;

    virtual std::optional<domain::Reservation> findReservation(const std::string& reservationId) = 0;

    /**
     * @brief Все брони ресурса, по возрастанию начала интервала
     */
    virtual std::vector<domain::Reservation> findByResource(const std::string& resourceId) = 0;

    /**
     * @brief Чтение без блокировки (для checkAvailability)
     */
    virtual std::vector<domain::Reservation> findActiveOverlapping(
        const std::string& resourceId,
        const domain::TimeInterval& interval
    ) = 0;

    /**
     * @brief HELD брони, созданные раньше cutoff
     */
    virtual std::vector<domain::Reservation> findHeldCreatedBefore(const domain::Timestamp& cutoff) = 0;

    /**
     * @brief Эксклюзивно заблокировать ресурс
     * @return nullptr если ресурс не найден
     */
    virtual std::unique_ptr<IReservationUnitOfWork> lockResource(const std::string& resourceId) = 0;
};

} // namespace hospitality::ports::output
