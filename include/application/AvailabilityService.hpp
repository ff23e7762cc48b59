#pragma once

#include "ports/input/IAvailabilityService.hpp"
#include "ports/output/IReservationRepository.hpp"
#include "ports/output/IClock.hpp"
#include "domain/exceptions/DomainException.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace hospitality::application {

/**
 * @brief Сервис доступности и бронирования ресурсов
 *
 * Проверка пересечения и вставка брони выполняются в одной единице работы
 * под эксклюзивной блокировкой ресурса (lockResource). Два одновременных
 * запроса на один интервал: первый фиксируется, второй видит его бронь
 * и получает ConflictException.
 */
class AvailabilityService : public ports::input::IAvailabilityService {
public:
    AvailabilityService(
        std::shared_ptr<ports::output::IReservationRepository> repository,
        std::shared_ptr<ports::output::IClock> clock
    ) : repository_(std::move(repository))
      , clock_(std::move(clock))
    {
        std::cout << "[AvailabilityService] Created" << std::endl;
    }

    domain::BookableResource registerResource(const ports::input::RegisterResourceRequest& request) override {
        if (request.propertyId.empty()) {
            throw domain::ValidationException("propertyId is required");
        }
        if (request.capacity <= 0) {
            throw domain::ValidationException("capacity must be positive");
        }

        domain::BookableResource resource(
            utils::UuidGenerator::generate(),
            request.propertyId,
            request.kind,
            request.name,
            request.capacity
        );
        resource.createdAt = clock_->now();

        repository_->saveResource(resource);
        std::cout << "[AvailabilityService] Resource registered: " << resource.id
                  << " kind=" << domain::toString(resource.kind)
                  << " property=" << resource.propertyId << std::endl;
        return resource;
    }

    domain::BookableResource deactivateResource(
        const std::string& propertyId,
        const std::string& resourceId
    ) override {
        auto resource = findScopedResource(propertyId, resourceId);

        if (resource.active) {
            repository_->setResourceActive(resourceId, false);
            resource.active = false;
            std::cout << "[AvailabilityService] Resource deactivated: " << resourceId << std::endl;
        }
        return resource;
    }

    bool checkAvailability(
        const std::string& resourceId,
        const domain::Timestamp& start,
        const domain::Timestamp& end
    ) override {
        domain::TimeInterval interval(start, end);
        validateInterval(interval);

        auto resource = repository_->findResource(resourceId);
        if (!resource) {
            throw domain::NotFoundException("Resource", resourceId);
        }
        if (!resource->active) {
            return false;
        }

        return repository_->findActiveOverlapping(resourceId, interval).empty();
    }

    std::vector<domain::BookableResource> findAvailableResources(
        const std::string& propertyId,
        domain::ResourceKind kind,
        int partySize,
        const domain::Timestamp& start,
        const domain::Timestamp& end
    ) override {
        domain::TimeInterval interval(start, end);
        validateInterval(interval);
        if (propertyId.empty()) {
            throw domain::ValidationException("propertyId is required");
        }
        if (partySize <= 0) {
            throw domain::ValidationException("partySize must be positive");
        }

        std::vector<domain::BookableResource> available;
        for (auto& resource : repository_->findResourcesByProperty(propertyId)) {
            if (!resource.active || resource.kind != kind || resource.capacity < partySize) {
                continue;
            }
            if (repository_->findActiveOverlapping(resource.id, interval).empty()) {
                available.push_back(std::move(resource));
            }
        }

        std::stable_sort(available.begin(), available.end(),
            [](const domain::BookableResource& a, const domain::BookableResource& b) {
                if (a.capacity != b.capacity) return a.capacity < b.capacity;
                return a.name < b.name;
            });
        return available;
    }

    domain::Reservation createReservation(const ports::input::CreateReservationRequest& request) override {
        domain::TimeInterval interval(request.start, request.end);
        validateInterval(interval);
        if (request.customerId.empty()) {
            throw domain::ValidationException("customerId is required");
        }
        if (request.partySize <= 0) {
            throw domain::ValidationException("partySize must be positive");
        }

        auto unit = repository_->lockResource(request.resourceId);
        if (!unit || !unit->resource().belongsTo(request.propertyId)) {
            throw domain::NotFoundException("Resource", request.resourceId);
        }

        const auto& resource = unit->resource();
        if (!resource.active) {
            throw domain::ValidationException("Resource " + resource.id + " is inactive");
        }
        if (request.partySize > resource.capacity) {
            throw domain::ValidationException(
                "partySize " + std::to_string(request.partySize) +
                " exceeds capacity " + std::to_string(resource.capacity) +
                " of resource " + resource.id);
        }

        auto conflicts = unit->findActiveOverlapping(interval);
        if (!conflicts.empty()) {
            std::cout << "[AvailabilityService] Conflict on " << resource.id
                      << " for " << interval.toString()
                      << " with " << conflicts.front().id << std::endl;
            throw domain::ConflictException(resource.id, interval.toString(), conflicts.front().id);
        }

        auto now = clock_->now();
        domain::Reservation reservation;
        reservation.id = utils::UuidGenerator::generate();
        reservation.resourceId = resource.id;
        reservation.propertyId = resource.propertyId;
        reservation.customerId = request.customerId;
        reservation.interval = interval;
        reservation.partySize = request.partySize;
        reservation.status = domain::ReservationStatus::HELD;
        reservation.createdAt = now;
        reservation.updatedAt = now;

        unit->insert(reservation);
        unit->commit();

        std::cout << "[AvailabilityService] Reservation created: " << reservation.id
                  << " resource=" << resource.id << " " << interval.toString() << std::endl;
        return reservation;
    }

    domain::Reservation confirmReservation(const std::string& reservationId) override {
        auto [unit, reservation] = lockReservation(reservationId);

        switch (reservation.status) {
            case domain::ReservationStatus::CONFIRMED:
                return reservation;
            case domain::ReservationStatus::CANCELLED:
                throw domain::InvalidTransitionException(
                    reservationId,
                    domain::toString(reservation.status),
                    domain::toString(domain::ReservationStatus::CONFIRMED));
            case domain::ReservationStatus::HELD:
                break;
        }

        auto now = clock_->now();
        unit->updateStatus(reservationId, domain::ReservationStatus::CONFIRMED, "", now);
        unit->commit();

        reservation.status = domain::ReservationStatus::CONFIRMED;
        reservation.updatedAt = now;
        std::cout << "[AvailabilityService] Reservation confirmed: " << reservationId << std::endl;
        return reservation;
    }

    domain::Reservation cancelReservation(
        const std::string& reservationId,
        const std::string& reason
    ) override {
        auto [unit, reservation] = lockReservation(reservationId);

        // Повторная отмена - успешный no-op
        if (reservation.status == domain::ReservationStatus::CANCELLED) {
            return reservation;
        }

        auto now = clock_->now();
        unit->updateStatus(reservationId, domain::ReservationStatus::CANCELLED, reason, now);
        unit->commit();

        reservation.status = domain::ReservationStatus::CANCELLED;
        reservation.cancellationReason = reason;
        reservation.updatedAt = now;
        std::cout << "[AvailabilityService] Reservation cancelled: " << reservationId
                  << " reason=" << reason << std::endl;
        return reservation;
    }

    std::optional<domain::Reservation> getReservation(const std::string& reservationId) override {
        return repository_->findReservation(reservationId);
    }

    std::vector<domain::Reservation> listReservations(const std::string& resourceId) override {
        return repository_->findByResource(resourceId);
    }

    std::vector<domain::Reservation> listExpiredHolds(const domain::Timestamp& cutoff) override {
        return repository_->findHeldCreatedBefore(cutoff);
    }

    bool expireHold(const std::string& reservationId, const domain::Timestamp& cutoff) override {
        auto [unit, reservation] = lockReservation(reservationId);

        // Бронь могли подтвердить после выборки просроченных
        if (reservation.status != domain::ReservationStatus::HELD || !(reservation.createdAt < cutoff)) {
            return false;
        }

        unit->updateStatus(reservationId, domain::ReservationStatus::CANCELLED, HOLD_EXPIRED_REASON, clock_->now());
        unit->commit();

        std::cout << "[AvailabilityService] Hold expired: " << reservationId << std::endl;
        return true;
    }

    static constexpr const char* HOLD_EXPIRED_REASON = "hold expired";

private:
    std::shared_ptr<ports::output::IReservationRepository> repository_;
    std::shared_ptr<ports::output::IClock> clock_;

    static void validateInterval(const domain::TimeInterval& interval) {
        if (!interval.isValid()) {
            throw domain::ValidationException(
                "Reservation start must be before end: " + interval.toString());
        }
    }

    domain::BookableResource findScopedResource(const std::string& propertyId, const std::string& resourceId) {
        auto resource = repository_->findResource(resourceId);
        if (!resource || !resource->belongsTo(propertyId)) {
            throw domain::NotFoundException("Resource", resourceId);
        }
        return *resource;
    }

    /**
     * @brief Заблокировать ресурс брони и перечитать бронь под блокировкой
     */
    std::pair<std::unique_ptr<ports::output::IReservationUnitOfWork>, domain::Reservation>
    lockReservation(const std::string& reservationId) {
        auto snapshot = repository_->findReservation(reservationId);
        if (!snapshot) {
            throw domain::NotFoundException("Reservation", reservationId);
        }

        auto unit = repository_->lockResource(snapshot->resourceId);
        if (!unit) {
            throw domain::NotFoundException("Reservation", reservationId);
        }

        auto current = unit->findReservation(reservationId);
        if (!current) {
            throw domain::NotFoundException("Reservation", reservationId);
        }
        return {std::move(unit), *current};
    }
};

} // namespace hospitality::application
