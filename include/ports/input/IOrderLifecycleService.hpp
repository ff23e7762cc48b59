#pragma once

#include "domain/Order.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hospitality::ports::input {

/**
 * @brief Позиция в запросе (ID строки назначает сервис)
 */
struct OrderItemRequest {
    std::string menuItemId;
    std::string name;
    int64_t quantity = 1;
    domain::Money unitPrice;
    std::string specialInstructions;
};

/**
 * @brief Запрос на создание заказа
 */
struct CreateOrderRequest {
    std::string propertyId;
    std::string customerId;
    domain::OrderType type = domain::OrderType::DINE_IN;
    std::vector<OrderItemRequest> items;
    domain::Money tipAmount;
    domain::Money deliveryFee;
    std::string actor;
};

/**
 * @brief Интерфейс жизненного цикла заказа
 */
class IOrderLifecycleService {
public:
    virtual ~IOrderLifecycleService() = default;

    virtual domain::Order createOrder(const CreateOrderRequest& request) = 0;

    /**
     * @throws domain::ValidationException если заказ уже не PENDING
     */
    virtual domain::Order addItem(const std::string& orderId, const OrderItemRequest& item) = 0;

    virtual domain::Order removeItem(const std::string& orderId, const std::string& lineItemId) = 0;

    virtual domain::Order repriceItem(
        const std::string& orderId,
        const std::string& lineItemId,
        const domain::Money& unitPrice
    ) = 0;

    /**
     * @brief Перевести заказ в новый статус по таблице переходов
     * @throws domain::InvalidTransitionException если переход запрещён
     */
    virtual domain::Order transitionOrderStatus(
        const std::string& orderId,
        domain::OrderStatus newStatus,
        const std::string& actor,
        const std::optional<std::string>& notes = std::nullopt
    ) = 0;

    virtual std::optional<domain::Order> getOrder(const std::string& orderId) = 0;

    virtual std::vector<domain::Order> listOrders(
        const std::string& propertyId,
        std::optional<domain::OrderStatus> status = std::nullopt
    ) = 0;

    /**
     * @brief Журнал статусов в хронологическом порядке
     */
    virtual std::vector<domain::OrderStatusHistoryEntry> getStatusHistory(const std::string& orderId) = 0;
};

} // namespace hospitality::ports::input
