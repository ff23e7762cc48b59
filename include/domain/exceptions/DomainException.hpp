#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>
#include <optional>

/**
 * @file DomainException.hpp
 * @brief Бизнес-отказы ядра бронирования, склада и заказов
 *
 * Все отказы синхронны и не повторяются ядром автоматически.
 * Повтор допустим только для StorageUnavailableException, и повторять
 * нужно всю операцию проверки и записи целиком.
 */
namespace hospitality::domain {

enum class ErrorCode {
    VALIDATION,
    NOT_FOUND,
    CONFLICT,
    INSUFFICIENT_STOCK,
    INVALID_TRANSITION,
    STORAGE_UNAVAILABLE
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION:          return "VALIDATION_ERROR";
        case ErrorCode::NOT_FOUND:           return "NOT_FOUND";
        case ErrorCode::CONFLICT:            return "CONFLICT";
        case ErrorCode::INSUFFICIENT_STOCK:  return "INSUFFICIENT_STOCK";
        case ErrorCode::INVALID_TRANSITION:  return "INVALID_TRANSITION";
        case ErrorCode::STORAGE_UNAVAILABLE: return "STORAGE_UNAVAILABLE";
    }
    return "UNKNOWN";
}

/**
 * @brief Базовое исключение ядра
 */
class DomainException : public std::runtime_error {
public:
    DomainException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Некорректные входные данные
 */
class ValidationException : public DomainException {
public:
    explicit ValidationException(const std::string& message)
        : DomainException(ErrorCode::VALIDATION, message) {}
};

/**
 * @brief Сущность не найдена или вне области объекта вызывающего
 */
class NotFoundException : public DomainException {
public:
    NotFoundException(const std::string& entity, const std::string& id)
        : DomainException(ErrorCode::NOT_FOUND, entity + " not found: " + id)
        , entity_(entity), id_(id) {}

    const std::string& entity() const { return entity_; }
    const std::string& id() const { return id_; }

private:
    std::string entity_;
    std::string id_;
};

/**
 * @brief Интервал пересекается с активной бронью ресурса
 */
class ConflictException : public DomainException {
public:
    ConflictException(
        const std::string& resourceId,
        const std::string& requestedInterval,
        const std::optional<std::string>& conflictingReservationId = std::nullopt
    ) : DomainException(ErrorCode::CONFLICT, buildMessage(resourceId, requestedInterval, conflictingReservationId))
      , resourceId_(resourceId)
      , requestedInterval_(requestedInterval)
      , conflictingReservationId_(conflictingReservationId) {}

    const std::string& resourceId() const { return resourceId_; }
    const std::string& requestedInterval() const { return requestedInterval_; }
    const std::optional<std::string>& conflictingReservationId() const { return conflictingReservationId_; }

private:
    std::string resourceId_;
    std::string requestedInterval_;
    std::optional<std::string> conflictingReservationId_;

    static std::string buildMessage(
        const std::string& resourceId,
        const std::string& interval,
        const std::optional<std::string>& conflictingId
    ) {
        std::string message = "Resource " + resourceId + " is not available for " + interval;
        if (conflictingId) {
            message += " (conflicts with reservation " + *conflictingId + ")";
        }
        return message;
    }
};

/**
 * @brief Списание увело бы остаток в минус
 */
class InsufficientStockException : public DomainException {
public:
    InsufficientStockException(const std::string& itemId, int64_t currentStock, int64_t attemptedDelta)
        : DomainException(ErrorCode::INSUFFICIENT_STOCK,
            "Insufficient stock for item " + itemId + ": current " + std::to_string(currentStock) +
            ", attempted delta " + std::to_string(attemptedDelta))
        , itemId_(itemId), currentStock_(currentStock), attemptedDelta_(attemptedDelta) {}

    const std::string& itemId() const { return itemId_; }
    int64_t currentStock() const { return currentStock_; }
    int64_t attemptedDelta() const { return attemptedDelta_; }

private:
    std::string itemId_;
    int64_t currentStock_;
    int64_t attemptedDelta_;
};

/**
 * @brief Переход статуса не разрешён из текущего состояния
 */
class InvalidTransitionException : public DomainException {
public:
    InvalidTransitionException(const std::string& entityId, const std::string& from, const std::string& to)
        : DomainException(ErrorCode::INVALID_TRANSITION,
            "Invalid status transition for " + entityId + " from " + from + " to " + to)
        , entityId_(entityId), from_(from), to_(to) {}

    const std::string& entityId() const { return entityId_; }
    const std::string& from() const { return from_; }
    const std::string& to() const { return to_; }

private:
    std::string entityId_;
    std::string from_;
    std::string to_;
};

/**
 * @brief Инфраструктурный сбой хранилища (соединение, lock timeout, deadlock)
 */
class StorageUnavailableException : public DomainException {
public:
    explicit StorageUnavailableException(const std::string& message)
        : DomainException(ErrorCode::STORAGE_UNAVAILABLE, message) {}
};

} // namespace hospitality::domain
