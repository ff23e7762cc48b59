#pragma once

#include "domain/Order.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hospitality::ports::output {

/**
 * @brief Единица работы над агрегатом "заказ + журнал статусов"
 *
 * Пока объект жив, строка заказа заблокирована.
 * Уничтожение без commit() = откат.
 */
class IOrderUnitOfWork {
public:
    virtual ~IOrderUnitOfWork() = default;

    /**
     * @brief Заказ в состоянии на момент блокировки
     */
    virtual const domain::Order& order() const = 0;

    /**
     * @brief Записать новое состояние заказа
     *
     * Запись привязана к статусу, прочитанному при блокировке.
     * @throws domain::InvalidTransitionException если статус в хранилище уже другой
     */
    virtual void update(const domain::Order& order) = 0;

    virtual void appendHistory(const domain::OrderStatusHistoryEntry& entry) = 0;

    /**
     * @throws domain::InvalidTransitionException если статус в хранилище уже другой
     */
    virtual void commit() = 0;
};

/**
 * @brief Интерфейс хранилища заказов
 */
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    /**
     * @brief Атомарно создать заказ вместе с первой записью журнала
     */
    virtual void create(const domain::Order& order, const domain::OrderStatusHistoryEntry& initialEntry) = 0;

    virtual std::optional<domain::Order> findById(const std::string& orderId) = 0;

    /**
     * @brief Заказы объекта, новые первыми
     */
    virtual std::vector<domain::Order> findByProperty(
        const std::string& propertyId,
        std::optional<domain::OrderStatus> status
    ) = 0;

    /**
     * @brief Журнал статусов в хронологическом порядке
     */
    virtual std::vector<domain::OrderStatusHistoryEntry> findHistory(const std::string& orderId) = 0;

    /**
     * @return nullptr если заказ не найден
     */
    virtual std::unique_ptr<IOrderUnitOfWork> lockOrder(const std::string& orderId) = 0;
};

} // namespace hospitality::ports::output
