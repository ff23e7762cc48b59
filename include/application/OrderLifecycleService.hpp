#pragma once

#include "ports/input/IOrderLifecycleService.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IClock.hpp"
#include "settings/OrderSettings.hpp"
#include "domain/exceptions/DomainException.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <string>

namespace hospitality::application {

/**
 * @brief Сервис жизненного цикла заказа
 *
 * Каждое изменение статуса проверяется по фиксированной таблице
 * переходов и пишется вместе с записью журнала статусов.
 * Состав и итоги заказа замораживаются при переходе PENDING -> CONFIRMED.
 */
class OrderLifecycleService : public ports::input::IOrderLifecycleService {
public:
    OrderLifecycleService(
        std::shared_ptr<ports::output::IOrderRepository> repository,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::OrderSettings> settings
    ) : repository_(std::move(repository))
      , clock_(std::move(clock))
      , settings_(std::move(settings))
    {
        std::cout << "[OrderLifecycleService] Created, tax rate "
                  << settings_->getTaxRateBps() << " bps" << std::endl;
    }

    domain::Order createOrder(const ports::input::CreateOrderRequest& request) override {
        if (request.propertyId.empty() || request.customerId.empty()) {
            throw domain::ValidationException("propertyId and customerId are required");
        }
        validateAmount(request.tipAmount, "tipAmount");
        validateAmount(request.deliveryFee, "deliveryFee");

        auto now = clock_->now();
        domain::Order order;
        order.id = utils::UuidGenerator::generate();
        order.orderNumber = utils::UuidGenerator::orderNumber(now);
        order.propertyId = request.propertyId;
        order.customerId = request.customerId;
        order.type = request.type;
        order.status = domain::OrderStatus::PENDING;
        order.tipAmount = request.tipAmount;
        order.deliveryFee = request.deliveryFee;
        order.createdAt = now;
        order.updatedAt = now;
        for (const auto& itemRequest : request.items) {
            order.items.push_back(makeLineItem(itemRequest));
        }
        recomputeTotals(order);

        domain::OrderStatusHistoryEntry entry;
        entry.orderId = order.id;
        entry.status = domain::OrderStatus::PENDING;
        entry.actor = request.actor;
        entry.notes = "order created";
        entry.createdAt = now;

        repository_->create(order, entry);
        std::cout << "[OrderLifecycleService] Order created: " << order.orderNumber
                  << " id=" << order.id << " items=" << order.items.size() << std::endl;
        return order;
    }

    domain::Order addItem(const std::string& orderId, const ports::input::OrderItemRequest& item) override {
        auto lineItem = makeLineItem(item);
        return editItems(orderId, [&lineItem](domain::Order& order) {
            order.items.push_back(lineItem);
        });
    }

    domain::Order removeItem(const std::string& orderId, const std::string& lineItemId) override {
        return editItems(orderId, [&orderId, &lineItemId](domain::Order& order) {
            auto it = std::find_if(order.items.begin(), order.items.end(),
                [&lineItemId](const domain::OrderLineItem& line) { return line.id == lineItemId; });
            if (it == order.items.end()) {
                throw domain::NotFoundException("OrderLineItem", orderId + "/" + lineItemId);
            }
            order.items.erase(it);
        });
    }

    domain::Order repriceItem(
        const std::string& orderId,
        const std::string& lineItemId,
        const domain::Money& unitPrice
    ) override {
        validateAmount(unitPrice, "unitPrice");
        return editItems(orderId, [&orderId, &lineItemId, &unitPrice](domain::Order& order) {
            auto* line = order.findItem(lineItemId);
            if (!line) {
                throw domain::NotFoundException("OrderLineItem", orderId + "/" + lineItemId);
            }
            line->unitPrice = unitPrice;
        });
    }

    domain::Order transitionOrderStatus(
        const std::string& orderId,
        domain::OrderStatus newStatus,
        const std::string& actor,
        const std::optional<std::string>& notes = std::nullopt
    ) override {
        auto unit = lockOrder(orderId);
        domain::Order order = unit->order();
        auto previous = order.status;

        if (!domain::canTransition(previous, newStatus)) {
            std::cout << "[OrderLifecycleService] Rejected transition for " << orderId << ": "
                      << domain::toString(previous) << " -> " << domain::toString(newStatus) << std::endl;
            throw domain::InvalidTransitionException(
                orderId, domain::toString(previous), domain::toString(newStatus));
        }

        if (previous == domain::OrderStatus::PENDING && newStatus == domain::OrderStatus::CONFIRMED) {
            if (order.items.empty()) {
                throw domain::ValidationException("Cannot confirm order " + orderId + " without items");
            }
            recomputeTotals(order);
        }

        auto now = clock_->now();
        order.status = newStatus;
        order.updatedAt = now;

        domain::OrderStatusHistoryEntry entry;
        entry.orderId = orderId;
        entry.previousStatus = previous;
        entry.status = newStatus;
        entry.actor = actor;
        entry.notes = notes.value_or("");
        entry.createdAt = now;

        unit->update(order);
        unit->appendHistory(entry);
        unit->commit();

        std::cout << "[OrderLifecycleService] Order " << order.orderNumber << ": "
                  << domain::toString(previous) << " -> " << domain::toString(newStatus)
                  << " by " << actor << std::endl;
        return order;
    }

    std::optional<domain::Order> getOrder(const std::string& orderId) override {
        return repository_->findById(orderId);
    }

    std::vector<domain::Order> listOrders(
        const std::string& propertyId,
        std::optional<domain::OrderStatus> status = std::nullopt
    ) override {
        return repository_->findByProperty(propertyId, status);
    }

    std::vector<domain::OrderStatusHistoryEntry> getStatusHistory(const std::string& orderId) override {
        if (!repository_->findById(orderId)) {
            throw domain::NotFoundException("Order", orderId);
        }
        return repository_->findHistory(orderId);
    }

private:
    std::shared_ptr<ports::output::IOrderRepository> repository_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<settings::OrderSettings> settings_;

    static constexpr int64_t MAX_ITEM_QUANTITY = 10000;
    static constexpr int64_t MAX_AMOUNT_CENTS = 100000000000000;    // 10^12 в основной валюте

    /**
     * @brief Неотрицательная сумма не больше MAX_AMOUNT_CENTS
     */
    static void validateAmount(const domain::Money& amount, const std::string& field) {
        if (amount.isNegative()) {
            throw domain::ValidationException(field + " must be non-negative");
        }
        if (amount.units > MAX_AMOUNT_CENTS / 100) {
            throw domain::ValidationException(field + " exceeds the maximum amount");
        }
    }

    domain::OrderLineItem makeLineItem(const ports::input::OrderItemRequest& request) const {
        if (request.quantity <= 0 || request.quantity > MAX_ITEM_QUANTITY) {
            throw domain::ValidationException(
                "Item quantity must be in [1, " + std::to_string(MAX_ITEM_QUANTITY) + "]");
        }
        validateAmount(request.unitPrice, "unitPrice");

        domain::OrderLineItem line;
        line.id = utils::UuidGenerator::generate();
        line.menuItemId = request.menuItemId;
        line.name = request.name;
        line.quantity = request.quantity;
        line.unitPrice = request.unitPrice;
        line.specialInstructions = request.specialInstructions;
        return line;
    }

    /**
     * @throws domain::ValidationException если подытог превышает MAX_AMOUNT_CENTS
     */
    void recomputeTotals(domain::Order& order) const {
        int64_t subtotalCents = 0;
        for (const auto& item : order.items) {
            // Цена и количество ограничены в makeLineItem: произведение помещается в int64_t
            int64_t lineCents = item.unitPrice.toCents() * item.quantity;
            if (lineCents > MAX_AMOUNT_CENTS - subtotalCents) {
                throw domain::ValidationException("Order " + order.id + " subtotal exceeds the maximum amount");
            }
            subtotalCents += lineCents;
        }

        order.totals = domain::OrderTotals::compute(
            order.items,
            order.tipAmount,
            order.deliveryFee,
            settings_->getTaxRateBps(),
            settings_->getCurrency()
        );
    }

    std::unique_ptr<ports::output::IOrderUnitOfWork> lockOrder(const std::string& orderId) {
        auto unit = repository_->lockOrder(orderId);
        if (!unit) {
            throw domain::NotFoundException("Order", orderId);
        }
        return unit;
    }

    /**
     * @brief Изменить состав заказа под блокировкой (только PENDING)
     */
    template <typename Edit>
    domain::Order editItems(const std::string& orderId, Edit edit) {
        auto unit = lockOrder(orderId);
        domain::Order order = unit->order();

        if (!order.areItemsEditable()) {
            throw domain::ValidationException(
                "Order items are frozen: order " + orderId + " is " + domain::toString(order.status));
        }

        edit(order);
        recomputeTotals(order);
        order.updatedAt = clock_->now();

        unit->update(order);
        unit->commit();
        return order;
    }
};

} // namespace hospitality::application
