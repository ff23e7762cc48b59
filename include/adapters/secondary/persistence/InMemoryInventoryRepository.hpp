#pragma once

#include "ports/output/IInventoryRepository.hpp"
#include "domain/exceptions/DomainException.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <shared_mutex>

namespace hospitality::adapters::secondary {

/**
 * @brief In-memory реализация склада и журнала движений
 */
class InMemoryInventoryRepository : public ports::output::IInventoryRepository {
public:
    void saveItem(const domain::InventoryItem& item) override {
        auto slot = std::make_shared<ItemSlot>();
        slot->item = item;
        slots_.insert(item.id, slot);
    }

    std::optional<domain::InventoryItem> findItem(const std::string& itemId) override {
        auto slot = slots_.find(itemId);
        if (!slot) {
            return std::nullopt;
        }
        std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
        return slot->item;
    }

    std::vector<domain::InventoryItem> findItemsByProperty(const std::string& propertyId) override {
        std::vector<domain::InventoryItem> result;
        for (const auto& slot : slots_.values()) {
            std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
            if (slot->item.propertyId == propertyId) {
                result.push_back(slot->item);
            }
        }
        std::sort(result.begin(), result.end(),
            [](const domain::InventoryItem& a, const domain::InventoryItem& b) {
                return a.sku < b.sku;
            });
        return result;
    }

    std::vector<domain::StockTransaction> findTransactions(const std::string& itemId, size_t limit) override {
        auto result = findAllTransactions(itemId);
        std::sort(result.begin(), result.end(),
            [](const domain::StockTransaction& a, const domain::StockTransaction& b) {
                if (a.createdAt != b.createdAt) {
                    return a.createdAt > b.createdAt;
                }
                return a.sequence > b.sequence;
            });
        if (result.size() > limit) {
            result.resize(limit);
        }
        return result;
    }

    std::vector<domain::StockTransaction> findAllTransactions(const std::string& itemId) override {
        auto slot = slots_.find(itemId);
        if (!slot) {
            return {};
        }
        std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
        return slot->transactions;
    }

    std::vector<domain::StockTransaction> findExpiringReceipts(
        const std::string& propertyId,
        const domain::Timestamp& before
    ) override {
        std::vector<domain::StockTransaction> result;
        for (const auto& slot : slots_.values()) {
            std::shared_lock<std::shared_mutex> lock(slot->dataMutex);
            if (slot->item.propertyId != propertyId) {
                continue;
            }
            for (const auto& tx : slot->transactions) {
                if (domain::isIncrease(tx.kind) && tx.expiryDate && *tx.expiryDate <= before) {
                    result.push_back(tx);
                }
            }
        }
        std::sort(result.begin(), result.end(),
            [](const domain::StockTransaction& a, const domain::StockTransaction& b) {
                return *a.expiryDate < *b.expiryDate;
            });
        return result;
    }

    std::unique_ptr<ports::output::IStockUnitOfWork> lockItem(const std::string& itemId) override {
        auto slot = slots_.find(itemId);
        if (!slot) {
            return nullptr;
        }
        return std::make_unique<UnitOfWork>(slot, sequence_);
    }

    void clear() {
        slots_.clear();
    }

private:
    struct ItemSlot {
        std::mutex aggregateMutex;
        mutable std::shared_mutex dataMutex;
        domain::InventoryItem item;
        std::vector<domain::StockTransaction> transactions;    // порядок вставки
    };

    class UnitOfWork : public ports::output::IStockUnitOfWork {
    public:
        UnitOfWork(std::shared_ptr<ItemSlot> slot, std::atomic<int64_t>& sequence)
            : slot_(std::move(slot))
            , guard_(slot_->aggregateMutex)
            , sequence_(sequence)
        {
            std::shared_lock<std::shared_mutex> lock(slot_->dataMutex);
            item_ = slot_->item;
        }

        const domain::InventoryItem& item() const override {
            return item_;
        }

        // Номер выдаётся сразу, откат оставляет пропуск, как у BIGSERIAL
        int64_t append(const domain::StockTransaction& transaction) override {
            staged_.push_back(transaction);
            staged_.back().sequence = ++sequence_;
            item_.currentStock = transaction.balanceAfter;
            item_.updatedAt = transaction.createdAt;
            return staged_.back().sequence;
        }

        void commit() override {
            // Аналог CHECK (current_stock >= 0)
            if (item_.currentStock < 0) {
                throw domain::InsufficientStockException(
                    item_.id, item_.currentStock - staged_.back().delta, staged_.back().delta);
            }

            std::unique_lock<std::shared_mutex> lock(slot_->dataMutex);
            for (const auto& tx : staged_) {
                slot_->transactions.push_back(tx);
            }
            slot_->item = item_;
            staged_.clear();
        }

    private:
        std::shared_ptr<ItemSlot> slot_;
        std::lock_guard<std::mutex> guard_;
        std::atomic<int64_t>& sequence_;
        domain::InventoryItem item_;
        std::vector<domain::StockTransaction> staged_;
    };

    ThreadSafeMap<std::string, ItemSlot> slots_;
    std::atomic<int64_t> sequence_{0};
};

} // namespace hospitality::adapters::secondary
