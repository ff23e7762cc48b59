#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "domain/exceptions/DomainException.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <shared_mutex>

namespace hospitality::adapters::secondary {

/**
 * @brief In-memory реализация репозитория заказов
 */
class InMemoryOrderRepository : public ports::output::IOrderRepository {
public:
    void create(const domain::Order& order, const domain::OrderStatusHistoryEntry& initialEntry) override {
        auto slot = std::make_shared<OrderSlot>();
        slot->order = order;
        slot->history.push_back(initialEntry);
        slot->history.back().sequence = ++sequence_;

        auto stored = orders_.insertIfAbsent(order.id, slot);
        if (stored != slot) {
            throw domain::ValidationException("Order already exists: " + order.id);
        }
    }

    std::optional<domain::Order> findById(const std::string& orderId) override {
        auto slot = orders_.find(orderId);
        if (!slot) {
            return std::nullopt;
        }
        std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
        return slot->order;
    }

    std::vector<domain::Order> findByProperty(
        const std::string& propertyId,
        std::optional<domain::OrderStatus> status
    ) override {
        std::vector<domain::Order> result;
        for (const auto& slot : orders_.values()) {
            std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
            if (slot->order.propertyId != propertyId) continue;
            if (status && slot->order.status != *status) continue;
            result.push_back(slot->order);
        }

        // Новые первыми
        std::sort(result.begin(), result.end(),
            [](const domain::Order& a, const domain::Order& b) {
                return a.createdAt > b.createdAt;
            });
        return result;
    }

    std::vector<domain::OrderStatusHistoryEntry> findHistory(const std::string& orderId) override {
        auto slot = orders_.find(orderId);
        if (!slot) {
            return {};
        }
        std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
        return slot->history;
    }

    std::unique_ptr<ports::output::IOrderUnitOfWork> lockOrder(const std::string& orderId) override {
        auto slot = orders_.find(orderId);
        if (!slot) {
            return nullptr;
        }
        return std::make_unique<UnitOfWork>(slot, sequence_);
    }

    void clear() {
        orders_.clear();
    }

private:
    struct OrderSlot {
        std::mutex aggregateMutex;
        mutable std::shared_mutex dataMutex;
        domain::Order order;
        std::vector<domain::OrderStatusHistoryEntry> history;
    };

    class UnitOfWork : public ports::output::IOrderUnitOfWork {
    public:
        UnitOfWork(std::shared_ptr<OrderSlot> slot, std::atomic<int64_t>& sequence)
            : slot_(std::move(slot))
            , guard_(slot_->aggregateMutex)
            , sequence_(sequence)
        {
            std::shared_lock<std::shared_mutex> lock(slot_->dataMutex);
            order_ = slot_->order;
            expectedStatus_ = order_.status;
        }

        const domain::Order& order() const override {
            return order_;
        }

        void update(const domain::Order& order) override {
            staged_ = order;
        }

        void appendHistory(const domain::OrderStatusHistoryEntry& entry) override {
            history_.push_back(entry);
        }

        void commit() override {
            std::unique_lock<std::shared_mutex> lock(slot_->dataMutex);

            // Запись привязана к статусу, прочитанному при блокировке
            if (staged_ && slot_->order.status != expectedStatus_) {
                throw domain::InvalidTransitionException(
                    order_.id,
                    domain::toString(slot_->order.status),
                    domain::toString(staged_->status));
            }

            if (staged_) {
                slot_->order = *staged_;
            }
            for (auto& entry : history_) {
                entry.sequence = ++sequence_;
                slot_->history.push_back(entry);
            }
            staged_.reset();
            history_.clear();
        }

    private:
        std::shared_ptr<OrderSlot> slot_;
        std::lock_guard<std::mutex> guard_;
        std::atomic<int64_t>& sequence_;
        domain::Order order_;
        domain::OrderStatus expectedStatus_ = domain::OrderStatus::PENDING;
        std::optional<domain::Order> staged_;
        std::vector<domain::OrderStatusHistoryEntry> history_;
    };

    ThreadSafeMap<std::string, OrderSlot> orders_;
    std::atomic<int64_t> sequence_{0};
};

} // namespace hospitality::adapters::secondary
