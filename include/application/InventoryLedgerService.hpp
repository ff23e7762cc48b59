#pragma once

#include "ports/input/IInventoryLedgerService.hpp"
#include "ports/output/IInventoryRepository.hpp"
#include "ports/output/IClock.hpp"
#include "domain/exceptions/DomainException.hpp"
#include "utils/UuidGenerator.hpp"
#include <iostream>
#include <limits>
#include <memory>

namespace hospitality::application {

/**
 * @brief Сервис складского журнала
 *
 * Остаток меняется только через запись в журнал. Вставка записи и
 * обновление кэша current_stock выполняются в одной единице работы
 * под блокировкой позиции, поэтому параллельные списания не уводят
 * остаток в минус.
 */
class InventoryLedgerService : public ports::input::IInventoryLedgerService {
public:
    InventoryLedgerService(
        std::shared_ptr<ports::output::IInventoryRepository> repository,
        std::shared_ptr<ports::output::IClock> clock
    ) : repository_(std::move(repository))
      , clock_(std::move(clock))
    {
        std::cout << "[InventoryLedgerService] Created" << std::endl;
    }

    domain::InventoryItem registerItem(const ports::input::RegisterItemRequest& request) override {
        if (request.propertyId.empty() || request.sku.empty() || request.name.empty()) {
            throw domain::ValidationException("propertyId, sku and name are required");
        }
        if (request.minStock < 0 || request.reorderPoint < 0 || request.reorderQuantity < 0) {
            throw domain::ValidationException("Stock thresholds must be non-negative");
        }
        if (request.maxStock && *request.maxStock <= request.minStock) {
            throw domain::ValidationException("maxStock must be greater than minStock");
        }
        if (request.unitCost.isNegative()) {
            throw domain::ValidationException("unitCost must be non-negative");
        }

        auto now = clock_->now();
        domain::InventoryItem item;
        item.id = utils::UuidGenerator::generate();
        item.propertyId = request.propertyId;
        item.sku = request.sku;
        item.name = request.name;
        item.unit = request.unit;
        item.currentStock = 0;
        item.minStock = request.minStock;
        item.maxStock = request.maxStock;
        item.reorderPoint = request.reorderPoint;
        item.reorderQuantity = request.reorderQuantity;
        item.unitCost = request.unitCost;
        item.createdAt = now;
        item.updatedAt = now;

        repository_->saveItem(item);
        std::cout << "[InventoryLedgerService] Item registered: " << item.id
                  << " sku=" << item.sku << " property=" << item.propertyId << std::endl;
        return item;
    }

    domain::StockTransaction recordTransaction(const ports::input::RecordTransactionRequest& request) override {
        if (request.kind == domain::TransactionKind::ADJUSTMENT) {
            throw domain::ValidationException("Adjustments are recorded through adjustStock");
        }
        if (request.quantity <= 0) {
            throw domain::ValidationException("quantity must be positive");
        }

        auto unit = lockItem(request.itemId);
        int64_t delta = domain::signedDelta(request.kind, request.quantity);

        auto transaction = applyDelta(*unit, request.kind, request.quantity, delta,
                                      request.reason, request.actor);
        transaction.referenceId = request.referenceId;
        if (domain::isIncrease(request.kind)) {
            transaction.expiryDate = request.expiryDate;
        }

        transaction.sequence = unit->append(transaction);
        unit->commit();

        std::cout << "[InventoryLedgerService] " << domain::toString(request.kind)
                  << " item=" << request.itemId << " delta=" << delta
                  << " balance=" << transaction.balanceAfter << std::endl;
        return transaction;
    }

    domain::StockTransaction adjustStock(
        const std::string& itemId,
        int64_t targetLevel,
        const std::string& reason,
        const std::string& actor
    ) override {
        if (targetLevel < 0) {
            throw domain::ValidationException("Target stock level must be non-negative");
        }

        auto unit = lockItem(itemId);
        int64_t delta = targetLevel - unit->item().currentStock;

        auto transaction = applyDelta(*unit, domain::TransactionKind::ADJUSTMENT,
                                      delta < 0 ? -delta : delta, delta, reason, actor);
        transaction.sequence = unit->append(transaction);
        unit->commit();

        std::cout << "[InventoryLedgerService] ADJUSTMENT item=" << itemId
                  << " delta=" << delta << " balance=" << transaction.balanceAfter << std::endl;
        return transaction;
    }

    std::vector<domain::StockTransaction> getTransactionHistory(
        const std::string& itemId,
        size_t limit
    ) override {
        requireItem(itemId);
        if (limit == 0) {
            return {};
        }
        return repository_->findTransactions(itemId, limit);
    }

    std::optional<domain::InventoryItem> getItem(const std::string& itemId) override {
        return repository_->findItem(itemId);
    }

    std::vector<domain::InventoryItem> listItems(const std::string& propertyId) override {
        return repository_->findItemsByProperty(propertyId);
    }

    std::vector<domain::InventoryItem> getLowStockItems(const std::string& propertyId) override {
        std::vector<domain::InventoryItem> result;
        for (auto& item : repository_->findItemsByProperty(propertyId)) {
            if (item.isActive() && item.isLowStock()) {
                result.push_back(std::move(item));
            }
        }
        return result;
    }

    std::vector<domain::ExpiringStock> getExpiringStock(
        const std::string& propertyId,
        std::chrono::hours horizon
    ) override {
        auto before = clock_->now().addHours(horizon.count());

        std::vector<domain::ExpiringStock> result;
        for (const auto& receipt : repository_->findExpiringReceipts(propertyId, before)) {
            auto item = repository_->findItem(receipt.itemId);
            if (!item || item->currentStock <= 0 || !receipt.expiryDate) {
                continue;
            }
            result.push_back(domain::ExpiringStock{
                item->id,
                item->name,
                receipt.id,
                receipt.quantity,
                *receipt.expiryDate
            });
        }
        return result;
    }

    domain::InventorySummary getInventorySummary(const std::string& propertyId) override {
        auto items = repository_->findItemsByProperty(propertyId);

        domain::InventorySummary summary;
        summary.propertyId = propertyId;
        summary.totalItems = items.size();
        summary.totalValue = domain::Money::fromCents(0, items.empty() ? "NAD" : items.front().unitCost.currency);

        int64_t stockSum = 0;
        for (const auto& item : items) {
            if (item.isActive()) ++summary.activeItems;
            if (item.isLowStock()) ++summary.lowStockItems;
            if (item.isOutOfStock()) ++summary.outOfStockItems;
            if (item.needsReorder()) ++summary.reorderItems;
            if (item.isOverstock()) ++summary.overstockItems;
            summary.totalValue = summary.totalValue + item.stockValue();
            stockSum += item.currentStock;
        }
        if (!items.empty()) {
            summary.averageStockLevel = static_cast<double>(stockSum) / static_cast<double>(items.size());
        }
        return summary;
    }

    domain::LedgerCheck verifyLedger(const std::string& itemId) override {
        auto item = requireItem(itemId);

        domain::LedgerCheck check;
        check.itemId = itemId;
        check.cachedStock = item.currentStock;
        for (const auto& tx : repository_->findAllTransactions(itemId)) {
            check.replayedStock += tx.delta;
            ++check.transactionCount;
        }

        if (!check.isConsistent()) {
            std::cerr << "[InventoryLedgerService] Ledger mismatch for " << itemId
                      << ": cached=" << check.cachedStock
                      << " replayed=" << check.replayedStock << std::endl;
        }
        return check;
    }

private:
    std::shared_ptr<ports::output::IInventoryRepository> repository_;
    std::shared_ptr<ports::output::IClock> clock_;

    domain::InventoryItem requireItem(const std::string& itemId) {
        auto item = repository_->findItem(itemId);
        if (!item) {
            throw domain::NotFoundException("InventoryItem", itemId);
        }
        return *item;
    }

    std::unique_ptr<ports::output::IStockUnitOfWork> lockItem(const std::string& itemId) {
        auto unit = repository_->lockItem(itemId);
        if (!unit) {
            throw domain::NotFoundException("InventoryItem", itemId);
        }
        return unit;
    }

    /**
     * @brief Построить запись журнала, проверив остаток под блокировкой
     * @throws domain::InsufficientStockException если новый остаток < 0
     * @throws domain::ValidationException если остаток переполнит int64_t
     */
    domain::StockTransaction applyDelta(
        const ports::output::IStockUnitOfWork& unit,
        domain::TransactionKind kind,
        int64_t quantity,
        int64_t delta,
        const std::string& reason,
        const std::string& actor
    ) {
        const auto& item = unit.item();
        if (delta > 0 && item.currentStock > std::numeric_limits<int64_t>::max() - delta) {
            throw domain::ValidationException(
                "Stock of item " + item.id + " would exceed the representable maximum");
        }
        int64_t newStock = item.currentStock + delta;
        if (newStock < 0) {
            std::cout << "[InventoryLedgerService] Insufficient stock: item=" << item.id
                      << " stock=" << item.currentStock << " delta=" << delta << std::endl;
            throw domain::InsufficientStockException(item.id, item.currentStock, delta);
        }

        domain::StockTransaction transaction;
        transaction.id = utils::UuidGenerator::generate();
        transaction.itemId = item.id;
        transaction.kind = kind;
        transaction.quantity = quantity;
        transaction.delta = delta;
        transaction.balanceAfter = newStock;
        transaction.reason = reason;
        transaction.actor = actor;
        transaction.createdAt = clock_->now();
        return transaction;
    }
};

} // namespace hospitality::application
