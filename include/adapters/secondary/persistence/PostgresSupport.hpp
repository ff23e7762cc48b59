#pragma once

#include "domain/exceptions/DomainException.hpp"
#include "domain/Timestamp.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <optional>
#include <string>

namespace hospitality::adapters::secondary::postgres {

/**
 * @brief Выражение для чтения TIMESTAMPTZ как микросекунд Unix
 */
inline std::string micros(const std::string& column) {
    return "(EXTRACT(EPOCH FROM " + column + ") * 1000000)::BIGINT AS " + column + "_us";
}

inline domain::Timestamp readTimestamp(const pqxx::row& row, const std::string& column) {
    return domain::Timestamp::fromUnixMicros(row[column + "_us"].as<int64_t>());
}

inline std::optional<domain::Timestamp> readOptionalTimestamp(const pqxx::row& row, const std::string& column) {
    auto field = row[column + "_us"];
    if (field.is_null()) {
        return std::nullopt;
    }
    return domain::Timestamp::fromUnixMicros(field.as<int64_t>());
}

inline std::optional<std::string> readOptionalString(const pqxx::row& row, const std::string& column) {
    auto field = row[column];
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<std::string>();
}

inline std::optional<std::string> optionalTimestampParam(const std::optional<domain::Timestamp>& ts) {
    if (!ts) {
        return std::nullopt;
    }
    return ts->toString();
}

/**
 * @brief Ограничить ожидание блокировок внутри транзакции
 */
inline void applyLockTimeout(pqxx::work& txn, const settings::DbSettings& settings) {
    txn.exec("SET LOCAL lock_timeout = " + std::to_string(settings.getLockTimeoutMs()));
}

/**
 * @brief Перевести ошибку PostgreSQL в доменное исключение
 *
 * Ограничения схемы (exclusion, CHECK) становятся бизнес-отказами,
 * сбои соединения, lock_timeout, serialization failure и deadlock
 * становятся StorageUnavailableException. Остальное пробрасывается как есть.
 */
template <typename Fn>
auto guarded(const char* component, const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const domain::DomainException&) {
        throw;
    } catch (const pqxx::broken_connection& e) {
        std::cerr << "[" << component << "] " << operation << " connection error: " << e.what() << std::endl;
        throw domain::StorageUnavailableException(std::string(operation) + ": " + e.what());
    } catch (const pqxx::sql_error& e) {
        std::cerr << "[" << component << "] " << operation << " error "
                  << e.sqlstate() << ": " << e.what() << std::endl;

        const auto& state = e.sqlstate();
        if (state == "55P03" || state == "40001" || state == "40P01" || state.rfind("08", 0) == 0) {
            throw domain::StorageUnavailableException(std::string(operation) + ": " + e.what());
        }
        throw;
    }
}

} // namespace hospitality::adapters::secondary::postgres
