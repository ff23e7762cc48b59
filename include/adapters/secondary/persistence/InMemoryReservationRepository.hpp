#pragma once

#include "ports/output/IReservationRepository.hpp"
#include "domain/exceptions/DomainException.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <mutex>
#include <shared_mutex>

namespace hospitality::adapters::secondary {

/**
 * @brief In-memory реализация хранилища ресурсов и броней
 *
 * Каждый ресурс живёт в своём слоте. aggregateMutex - эксклюзивная
 * блокировка агрегата на время единицы работы, dataMutex защищает
 * данные слота от читателей без блокировки.
 */
class InMemoryReservationRepository : public ports::output::IReservationRepository {
public:
    void saveResource(const domain::BookableResource& resource) override {
        auto slot = std::make_shared<ResourceSlot>();
        slot->resource = resource;
        slots_.insert(resource.id, slot);
    }

    std::optional<domain::BookableResource> findResource(const std::string& resourceId) override {
        auto slot = slots_.find(resourceId);
        if (!slot) {
            return std::nullopt;
        }
        std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
        return slot->resource;
    }

    std::vector<domain::BookableResource> findResourcesByProperty(const std::string& propertyId) override {
        std::vector<domain::BookableResource> result;
        for (const auto& slot : slots_.values()) {
            std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
            if (slot->resource.belongsTo(propertyId)) {
                result.push_back(slot->resource);
            }
        }
        std::sort(result.begin(), result.end(),
            [](const domain::BookableResource& a, const domain::BookableResource& b) {
                return a.name < b.name;
            });
        return result;
    }

    bool setResourceActive(const std::string& resourceId, bool active) override {
        auto slot = slots_.find(resourceId);
        if (!slot) {
            return false;
        }
        std::unique_lock<std::shared_mutex> lock(slot->dataMutex);
        slot->resource.active = active;
        return true;
    }

    std::optional<domain::Reservation> findReservation(const std::string& reservationId) override {
        auto resourceId = reservationIndex_.find(reservationId);
        if (!resourceId) {
            return std::nullopt;
        }
        auto slot = slots_.find(*resourceId);
        if (!slot) {
            return std::nullopt;
        }
        std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
        return slot->findReservation(reservationId);
    }

    std::vector<domain::Reservation> findByResource(const std::string& resourceId) override {
        auto slot = slots_.find(resourceId);
        if (!slot) {
            return {};
        }
        std::vector<domain::Reservation> result;
        {
            std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
            result = slot->reservations;
        }
        std::sort(result.begin(), result.end(),
            [](const domain::Reservation& a, const domain::Reservation& b) {
                return a.interval.start < b.interval.start;
            });
        return result;
    }

    std::vector<domain::Reservation> findActiveOverlapping(
        const std::string& resourceId,
        const domain::TimeInterval& interval
    ) override {
        auto slot = slots_.find(resourceId);
        if (!slot) {
            return {};
        }
        std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
        return slot->activeOverlapping(interval);
    }

    std::vector<domain::Reservation> findHeldCreatedBefore(const domain::Timestamp& cutoff) override {
        std::vector<domain::Reservation> result;
        for (const auto& slot : slots_.values()) {
            std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
            for (const auto& reservation : slot->reservations) {
                if (reservation.status == domain::ReservationStatus::HELD && reservation.createdAt < cutoff) {
                    result.push_back(reservation);
                }
            }
        }
        std::sort(result.begin(), result.end(),
            [](const domain::Reservation& a, const domain::Reservation& b) {
                return a.createdAt < b.createdAt;
            });
        return result;
    }

    std::unique_ptr<ports::output::IReservationUnitOfWork> lockResource(const std::string& resourceId) override {
        auto slot = slots_.find(resourceId);
        if (!slot) {
            return nullptr;
        }
        return std::make_unique<UnitOfWork>(slot, reservationIndex_);
    }

    void clear() {
        slots_.clear();
        reservationIndex_.clear();
    }

private:
    struct ResourceSlot {
        std::mutex aggregateMutex;
        mutable std::shared_mutex dataMutex;
        domain::BookableResource resource;
        std::vector<domain::Reservation> reservations;

        std::optional<domain::Reservation> findReservation(const std::string& reservationId) const {
            for (const auto& reservation : reservations) {
                if (reservation.id == reservationId) {
                    return reservation;
                }
            }
            return std::nullopt;
        }

        std::vector<domain::Reservation> activeOverlapping(const domain::TimeInterval& interval) const {
            std::vector<domain::Reservation> result;
            for (const auto& reservation : reservations) {
                if (reservation.conflictsWith(interval)) {
                    result.push_back(reservation);
                }
            }
            return result;
        }
    };

    /**
     * @brief Единица работы: держит aggregateMutex, копит изменения до commit()
     */
    class UnitOfWork : public ports::output::IReservationUnitOfWork {
    public:
        UnitOfWork(std::shared_ptr<ResourceSlot> slot, ThreadSafeMap<std::string, std::string>& index)
            : slot_(std::move(slot))
            , guard_(slot_->aggregateMutex)
            , index_(index)
        {
            std::shared_lock<std::shared_mutex> lock(slot_->dataMutex);
            resource_ = slot_->resource;
            working_ = slot_->reservations;
        }

        const domain::BookableResource& resource() const override {
            return resource_;
        }

        std::vector<domain::Reservation> findActiveOverlapping(const domain::TimeInterval& interval) override {
            std::vector<domain::Reservation> result;
            for (const auto& reservation : working_) {
                if (reservation.conflictsWith(interval)) {
                    result.push_back(reservation);
                }
            }
            return result;
        }

        std::optional<domain::Reservation> findReservation(const std::string& reservationId) override {
            auto* reservation = find(reservationId);
            return reservation ? std::optional(*reservation) : std::nullopt;
        }

        void insert(const domain::Reservation& reservation) override {
            working_.push_back(reservation);
            inserted_.push_back(reservation.id);
        }

        void updateStatus(
            const std::string& reservationId,
            domain::ReservationStatus status,
            const std::string& reason,
            const domain::Timestamp& at
        ) override {
            auto* reservation = find(reservationId);
            if (!reservation) {
                throw domain::NotFoundException("Reservation", reservationId);
            }
            reservation->status = status;
            if (status == domain::ReservationStatus::CANCELLED) {
                reservation->cancellationReason = reason;
            }
            reservation->updatedAt = at;
        }

        void commit() override {
            ensureNoOverlap();

            std::unique_lock<std::shared_mutex> lock(slot_->dataMutex);
            slot_->reservations = working_;
            for (const auto& id : inserted_) {
                index_.insert(id, std::make_shared<std::string>(resource_.id));
            }
            inserted_.clear();
        }

    private:
        std::shared_ptr<ResourceSlot> slot_;
        std::lock_guard<std::mutex> guard_;
        ThreadSafeMap<std::string, std::string>& index_;
        domain::BookableResource resource_;
        std::vector<domain::Reservation> working_;
        std::vector<std::string> inserted_;

        domain::Reservation* find(const std::string& reservationId) {
            for (auto& reservation : working_) {
                if (reservation.id == reservationId) {
                    return &reservation;
                }
            }
            return nullptr;
        }

        // Аналог exclusion constraint: активные брони ресурса не пересекаются
        void ensureNoOverlap() const {
            for (size_t i = 0; i < working_.size(); ++i) {
                if (!working_[i].isActive()) continue;
                for (size_t j = i + 1; j < working_.size(); ++j) {
                    if (working_[j].conflictsWith(working_[i].interval)) {
                        throw domain::ConflictException(
                            resource_.id, working_[j].interval.toString(), working_[i].id);
                    }
                }
            }
        }
    };

    ThreadSafeMap<std::string, ResourceSlot> slots_;
    ThreadSafeMap<std::string, std::string> reservationIndex_;   // reservationId -> resourceId
};

} // namespace hospitality::adapters::secondary
