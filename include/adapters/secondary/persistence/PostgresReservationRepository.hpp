// include/adapters/secondary/persistence/PostgresReservationRepository.hpp
#pragma once

#include "ports/output/IReservationRepository.hpp"
#include "adapters/secondary/persistence/PostgresSupport.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace hospitality::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища ресурсов и броней
 *
 * Таблицы: bookable_resources, reservations.
 * Exclusion constraint reservations_no_overlap не даёт активным броням
 * одного ресурса пересекаться, даже если запись пришла в обход сервиса.
 * Единица работы держит строку ресурса через SELECT ... FOR UPDATE.
 */
class PostgresReservationRepository : public ports::output::IReservationRepository {
public:
    explicit PostgresReservationRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    void saveResource(const domain::BookableResource& resource) override {
        postgres::guarded(COMPONENT, "saveResource", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO bookable_resources (id, property_id, kind, name, capacity, active, created_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7::timestamptz) "
                "ON CONFLICT (id) DO UPDATE SET "
                "name = EXCLUDED.name, capacity = EXCLUDED.capacity, active = EXCLUDED.active",
                resource.id,
                resource.propertyId,
                domain::toString(resource.kind),
                resource.name,
                resource.capacity,
                resource.active,
                resource.createdAt.toString()
            );

            txn.commit();
            std::cout << "[" << COMPONENT << "] Saved resource " << resource.id << std::endl;
        });
    }

    std::optional<domain::BookableResource> findResource(const std::string& resourceId) override {
        return postgres::guarded(COMPONENT, "findResource", [&]() -> std::optional<domain::BookableResource> {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + resourceColumns() + " FROM bookable_resources WHERE id = $1",
                resourceId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToResource(result[0]);
        });
    }

    std::vector<domain::BookableResource> findResourcesByProperty(const std::string& propertyId) override {
        return postgres::guarded(COMPONENT, "findResourcesByProperty", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + resourceColumns() + " FROM bookable_resources "
                "WHERE property_id = $1 ORDER BY name",
                propertyId
            );

            std::vector<domain::BookableResource> resources;
            for (const auto& row : result) {
                resources.push_back(rowToResource(row));
            }
            return resources;
        });
    }

    bool setResourceActive(const std::string& resourceId, bool active) override {
        return postgres::guarded(COMPONENT, "setResourceActive", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE bookable_resources SET active = $2 WHERE id = $1",
                resourceId,
                active
            );
            txn.commit();
            return result.affected_rows() > 0;
        });
    }

    std::optional<domain::Reservation> findReservation(const std::string& reservationId) override {
        return postgres::guarded(COMPONENT, "findReservation", [&]() -> std::optional<domain::Reservation> {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + reservationColumns() + " FROM reservations WHERE id = $1",
                reservationId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToReservation(result[0]);
        });
    }

    std::vector<domain::Reservation> findByResource(const std::string& resourceId) override {
        return postgres::guarded(COMPONENT, "findByResource", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + reservationColumns() + " FROM reservations "
                "WHERE resource_id = $1 ORDER BY starts_at",
                resourceId
            );
            return rowsToReservations(result);
        });
    }

    std::vector<domain::Reservation> findActiveOverlapping(
        const std::string& resourceId,
        const domain::TimeInterval& interval
    ) override {
        return postgres::guarded(COMPONENT, "findActiveOverlapping", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            return queryActiveOverlapping(txn, resourceId, interval);
        });
    }

    std::vector<domain::Reservation> findHeldCreatedBefore(const domain::Timestamp& cutoff) override {
        return postgres::guarded(COMPONENT, "findHeldCreatedBefore", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + reservationColumns() + " FROM reservations "
                "WHERE status = 'HELD' AND created_at < $1::timestamptz "
                "ORDER BY created_at",
                cutoff.toString()
            );
            return rowsToReservations(result);
        });
    }

    std::unique_ptr<ports::output::IReservationUnitOfWork> lockResource(const std::string& resourceId) override {
        return postgres::guarded(COMPONENT, "lockResource",
            [&]() -> std::unique_ptr<ports::output::IReservationUnitOfWork> {
                auto unit = std::make_unique<UnitOfWork>(*settings_);
                if (!unit->lock(resourceId)) {
                    return nullptr;
                }
                return unit;
            });
    }

private:
    static constexpr const char* COMPONENT = "PostgresReservationRepository";

    std::shared_ptr<settings::DbSettings> settings_;

    /**
     * @brief Транзакция с заблокированной строкой ресурса
     *
     * Запись выполняется сразу внутри транзакции, видимой только ей.
     * Уничтожение pqxx::work без commit() откатывает всё.
     */
    class UnitOfWork : public ports::output::IReservationUnitOfWork {
    public:
        explicit UnitOfWork(const settings::DbSettings& settings)
            : conn_(settings.getConnectionString())
            , txn_(conn_)
        {
            postgres::applyLockTimeout(txn_, settings);
        }

        bool lock(const std::string& resourceId) {
            auto result = txn_.exec_params(
                "SELECT " + resourceColumns() + " FROM bookable_resources WHERE id = $1 FOR UPDATE",
                resourceId
            );
            if (result.empty()) {
                return false;
            }
            resource_ = rowToResource(result[0]);
            return true;
        }

        const domain::BookableResource& resource() const override {
            return resource_;
        }

        std::vector<domain::Reservation> findActiveOverlapping(const domain::TimeInterval& interval) override {
            return postgres::guarded(COMPONENT, "findActiveOverlapping", [&] {
                return queryActiveOverlapping(txn_, resource_.id, interval);
            });
        }

        std::optional<domain::Reservation> findReservation(const std::string& reservationId) override {
            return postgres::guarded(COMPONENT, "findReservation", [&]() -> std::optional<domain::Reservation> {
                auto result = txn_.exec_params(
                    "SELECT " + reservationColumns() + " FROM reservations "
                    "WHERE id = $1 AND resource_id = $2",
                    reservationId,
                    resource_.id
                );
                if (result.empty()) {
                    return std::nullopt;
                }
                return rowToReservation(result[0]);
            });
        }

        void insert(const domain::Reservation& reservation) override {
            postgres::guarded(COMPONENT, "insert", [&] {
                try {
                    txn_.exec_params(
                        "INSERT INTO reservations (id, resource_id, property_id, customer_id, "
                        "starts_at, ends_at, party_size, status, cancellation_reason, created_at, updated_at) "
                        "VALUES ($1, $2, $3, $4, $5::timestamptz, $6::timestamptz, $7, $8, $9, "
                        "$10::timestamptz, $11::timestamptz)",
                        reservation.id,
                        reservation.resourceId,
                        reservation.propertyId,
                        reservation.customerId,
                        reservation.interval.start.toString(),
                        reservation.interval.end.toString(),
                        reservation.partySize,
                        domain::toString(reservation.status),
                        reservation.cancellationReason,
                        reservation.createdAt.toString(),
                        reservation.updatedAt.toString()
                    );
                } catch (const pqxx::sql_error& e) {
                    if (e.sqlstate() == EXCLUSION_VIOLATION) {
                        throw domain::ConflictException(reservation.resourceId, reservation.interval.toString());
                    }
                    throw;
                }
            });
        }

        void updateStatus(
            const std::string& reservationId,
            domain::ReservationStatus status,
            const std::string& reason,
            const domain::Timestamp& at
        ) override {
            postgres::guarded(COMPONENT, "updateStatus", [&] {
                auto result = txn_.exec_params(
                    "UPDATE reservations SET status = $3, "
                    "cancellation_reason = CASE WHEN $3 = 'CANCELLED' THEN $4 ELSE cancellation_reason END, "
                    "updated_at = $5::timestamptz "
                    "WHERE id = $1 AND resource_id = $2",
                    reservationId,
                    resource_.id,
                    domain::toString(status),
                    reason,
                    at.toString()
                );
                if (result.affected_rows() == 0) {
                    throw domain::NotFoundException("Reservation", reservationId);
                }
            });
        }

        void commit() override {
            postgres::guarded(COMPONENT, "commit", [&] {
                try {
                    txn_.commit();
                } catch (const pqxx::sql_error& e) {
                    if (e.sqlstate() == EXCLUSION_VIOLATION) {
                        throw domain::ConflictException(resource_.id, "commit");
                    }
                    throw;
                }
            });
        }

    private:
        pqxx::connection conn_;
        pqxx::work txn_;
        domain::BookableResource resource_;
    };

    static constexpr const char* EXCLUSION_VIOLATION = "23P01";

    static std::string resourceColumns() {
        return "id, property_id, kind, name, capacity, active, " + postgres::micros("created_at");
    }

    static std::string reservationColumns() {
        return "id, resource_id, property_id, customer_id, party_size, status, cancellation_reason, " +
               postgres::micros("starts_at") + ", " + postgres::micros("ends_at") + ", " +
               postgres::micros("created_at") + ", " + postgres::micros("updated_at");
    }

    static domain::BookableResource rowToResource(const pqxx::row& row) {
        domain::BookableResource resource;
        resource.id = row["id"].as<std::string>();
        resource.propertyId = row["property_id"].as<std::string>();
        resource.kind = domain::resourceKindFromString(row["kind"].as<std::string>());
        resource.name = row["name"].as<std::string>();
        resource.capacity = row["capacity"].as<int>();
        resource.active = row["active"].as<bool>();
        resource.createdAt = postgres::readTimestamp(row, "created_at");
        return resource;
    }

    static domain::Reservation rowToReservation(const pqxx::row& row) {
        domain::Reservation reservation;
        reservation.id = row["id"].as<std::string>();
        reservation.resourceId = row["resource_id"].as<std::string>();
        reservation.propertyId = row["property_id"].as<std::string>();
        reservation.customerId = row["customer_id"].as<std::string>();
        reservation.partySize = row["party_size"].as<int>();
        reservation.status = domain::reservationStatusFromString(row["status"].as<std::string>());
        reservation.cancellationReason = row["cancellation_reason"].as<std::string>();
        reservation.interval = domain::TimeInterval(
            postgres::readTimestamp(row, "starts_at"),
            postgres::readTimestamp(row, "ends_at"));
        reservation.createdAt = postgres::readTimestamp(row, "created_at");
        reservation.updatedAt = postgres::readTimestamp(row, "updated_at");
        return reservation;
    }

    static std::vector<domain::Reservation> rowsToReservations(const pqxx::result& result) {
        std::vector<domain::Reservation> reservations;
        reservations.reserve(result.size());
        for (const auto& row : result) {
            reservations.push_back(rowToReservation(row));
        }
        return reservations;
    }

    static std::vector<domain::Reservation> queryActiveOverlapping(
        pqxx::work& txn,
        const std::string& resourceId,
        const domain::TimeInterval& interval
    ) {
        // [start, end) пересекается с [s, e), если start < e и s < end
        auto result = txn.exec_params(
            "SELECT " + reservationColumns() + " FROM reservations "
            "WHERE resource_id = $1 AND status IN ('HELD', 'CONFIRMED') "
            "AND starts_at < $3::timestamptz AND ends_at > $2::timestamptz "
            "ORDER BY starts_at",
            resourceId,
            interval.start.toString(),
            interval.end.toString()
        );
        return rowsToReservations(result);
    }

    void initSchema() {
        postgres::guarded(COMPONENT, "initSchema", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec("CREATE EXTENSION IF NOT EXISTS btree_gist");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS bookable_resources (
                    id VARCHAR(64) PRIMARY KEY,
                    property_id VARCHAR(64) NOT NULL,
                    kind VARCHAR(16) NOT NULL,
                    name VARCHAR(255) NOT NULL,
                    capacity INTEGER NOT NULL CHECK (capacity > 0),
                    active BOOLEAN NOT NULL DEFAULT TRUE,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS reservations (
                    id VARCHAR(64) PRIMARY KEY,
                    resource_id VARCHAR(64) NOT NULL REFERENCES bookable_resources(id),
                    property_id VARCHAR(64) NOT NULL,
                    customer_id VARCHAR(64) NOT NULL,
                    starts_at TIMESTAMPTZ NOT NULL,
                    ends_at TIMESTAMPTZ NOT NULL,
                    party_size INTEGER NOT NULL CHECK (party_size > 0),
                    status VARCHAR(16) NOT NULL,
                    cancellation_reason TEXT NOT NULL DEFAULT '',
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    CHECK (starts_at < ends_at),
                    CONSTRAINT reservations_no_overlap EXCLUDE USING gist (
                        resource_id WITH =,
                        tstzrange(starts_at, ends_at, '[)') WITH &&
                    ) WHERE (status IN ('HELD', 'CONFIRMED'))
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_reservations_resource ON reservations (resource_id, starts_at)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_reservations_held ON reservations (status, created_at)");

            txn.commit();
            std::cout << "[" << COMPONENT << "] Schema initialized" << std::endl;
        });
    }
};

} // namespace hospitality::adapters::secondary
