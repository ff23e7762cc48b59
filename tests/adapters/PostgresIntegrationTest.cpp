/**
 * @file PostgresIntegrationTest.cpp
 * @brief Services over the PostgreSQL repositories
 *
 * Запускается только при HOSPITALITY_TEST_DB=1, подключение берётся
 * из HOSPITALITY_DB_* (см. DbSettings). Каждый тест работает в своём
 * объекте (propertyId = UUID), таблицы не очищаются.
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/PostgresReservationRepository.hpp"
#include "adapters/secondary/persistence/PostgresInventoryRepository.hpp"
#include "adapters/secondary/persistence/PostgresOrderRepository.hpp"
#include "application/AvailabilityService.hpp"
#include "application/InventoryLedgerService.hpp"
#include "application/OrderLifecycleService.hpp"
#include "mocks/FakeClock.hpp"
#include <atomic>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace hospitality;
using namespace hospitality::tests;

using domain::Timestamp;

class PostgresIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!std::getenv("HOSPITALITY_TEST_DB")) {
            GTEST_SKIP() << "HOSPITALITY_TEST_DB not set";
        }
        dbSettings_ = std::make_shared<settings::DbSettings>();
        clock_ = std::make_shared<FakeClock>();
        property_ = utils::UuidGenerator::generate();
    }

    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<FakeClock> clock_;
    std::string property_;
};

// ============================================================================
// Reservations
// ============================================================================

TEST_F(PostgresIntegrationTest, Reservations_OverlapRejectedBackToBackAccepted) {
    auto repository = std::make_shared<adapters::secondary::PostgresReservationRepository>(dbSettings_);
    application::AvailabilityService service(repository, clock_);

    auto room = service.registerResource({
        .propertyId = property_,
        .kind = domain::ResourceKind::ROOM,
        .name = "Room 12",
        .capacity = 2
    });

    auto book = [&](const std::string& start, const std::string& end) {
        return service.createReservation({
            .propertyId = property_,
            .resourceId = room.id,
            .start = Timestamp::fromString(start),
            .end = Timestamp::fromString(end),
            .customerId = "guest-1",
            .partySize = 2
        });
    };

    auto first = book("2025-07-01T14:00:00Z", "2025-07-03T10:00:00Z");
    auto second = book("2025-07-03T10:00:00Z", "2025-07-05T10:00:00Z");
    EXPECT_EQ(second.status, domain::ReservationStatus::HELD);

    EXPECT_THROW(book("2025-07-02T00:00:00Z", "2025-07-04T00:00:00Z"), domain::ConflictException);

    service.cancelReservation(first.id, "guest request");
    auto replacement = book("2025-07-02T00:00:00Z", "2025-07-03T09:00:00Z");

    auto stored = service.getReservation(replacement.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->interval.start, Timestamp::fromString("2025-07-02T00:00:00Z"));
    EXPECT_EQ(service.listReservations(room.id).size(), 3u);

    auto find = [&](int partySize, const std::string& start, const std::string& end) {
        return service.findAvailableResources(property_, domain::ResourceKind::ROOM, partySize,
                                              Timestamp::fromString(start), Timestamp::fromString(end));
    };
    auto touching = find(2, "2025-06-29T14:00:00Z", "2025-07-01T14:00:00Z");
    ASSERT_EQ(touching.size(), 1u);
    EXPECT_EQ(touching[0].id, room.id);
    EXPECT_TRUE(find(3, "2025-06-29T14:00:00Z", "2025-07-01T14:00:00Z").empty());
    EXPECT_TRUE(find(2, "2025-07-04T00:00:00Z", "2025-07-06T00:00:00Z").empty());
}

TEST_F(PostgresIntegrationTest, Reservations_ConcurrentSameInterval_ExactlyOneWins) {
    auto repository = std::make_shared<adapters::secondary::PostgresReservationRepository>(dbSettings_);
    application::AvailabilityService service(repository, clock_);

    auto table = service.registerResource({
        .propertyId = property_,
        .kind = domain::ResourceKind::TABLE,
        .name = "Table 3",
        .capacity = 4
    });

    std::atomic<int> succeeded{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&]() {
            try {
                service.createReservation({
                    .propertyId = property_,
                    .resourceId = table.id,
                    .start = Timestamp::fromString("2025-07-10T19:00:00Z"),
                    .end = Timestamp::fromString("2025-07-10T21:00:00Z"),
                    .customerId = "guest-2",
                    .partySize = 2
                });
                ++succeeded;
            } catch (const domain::ConflictException&) {
                ++conflicts;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded, 1);
    EXPECT_EQ(conflicts, 5);
}

// ============================================================================
// Inventory
// ============================================================================

TEST_F(PostgresIntegrationTest, Inventory_OverdrawRejectedLedgerConsistent) {
    auto repository = std::make_shared<adapters::secondary::PostgresInventoryRepository>(dbSettings_);
    application::InventoryLedgerService service(repository, clock_);

    auto item = service.registerItem({
        .propertyId = property_,
        .sku = "BEER-330",
        .name = "Lager 330ml",
        .unit = domain::UnitOfMeasure::BOTTLE,
        .minStock = 12,
        .unitCost = domain::Money::fromCents(1450)
    });

    service.recordTransaction({
        .itemId = item.id,
        .kind = domain::TransactionKind::PURCHASE,
        .quantity = 10,
        .actor = "store",
        .expiryDate = clock_->now().addHours(12)
    });
    service.recordTransaction({
        .itemId = item.id,
        .kind = domain::TransactionKind::SALE,
        .quantity = 4,
        .referenceId = std::string("order-1")
    });
    EXPECT_THROW(service.recordTransaction({
        .itemId = item.id,
        .kind = domain::TransactionKind::SALE,
        .quantity = 10
    }), domain::InsufficientStockException);

    clock_->advanceMinutes(1);
    auto adjustment = service.adjustStock(item.id, 9, "count", "auditor");
    EXPECT_EQ(adjustment.delta, 3);

    EXPECT_EQ(service.getItem(item.id)->currentStock, 9);

    auto history = service.getTransactionHistory(item.id, 10);
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].kind, domain::TransactionKind::ADJUSTMENT);
    ASSERT_TRUE(history[1].referenceId.has_value());
    EXPECT_EQ(*history[1].referenceId, "order-1");

    EXPECT_TRUE(service.verifyLedger(item.id).isConsistent());
    EXPECT_EQ(service.getLowStockItems(property_).size(), 1u);
    EXPECT_EQ(service.getExpiringStock(property_, std::chrono::hours(24)).size(), 1u);
}

// ============================================================================
// Orders
// ============================================================================

TEST_F(PostgresIntegrationTest, Orders_ItemsAndHistoryPersist) {
    auto repository = std::make_shared<adapters::secondary::PostgresOrderRepository>(dbSettings_);
    auto orderSettings = std::make_shared<settings::OrderSettings>(settings::OrderSettings::fixed(875, "NAD"));
    application::OrderLifecycleService service(repository, clock_, orderSettings);

    auto order = service.createOrder({
        .propertyId = property_,
        .customerId = "guest-9",
        .type = domain::OrderType::TAKEAWAY,
        .items = {{
            .menuItemId = "menu-kapana",
            .name = "Kapana",
            .quantity = 2,
            .unitPrice = domain::Money::fromCents(1250),
            .specialInstructions = "extra chili"
        }},
        .actor = "cashier"
    });

    clock_->advanceMinutes(1);
    service.transitionOrderStatus(order.id, domain::OrderStatus::CONFIRMED, "cashier");
    EXPECT_THROW(service.transitionOrderStatus(order.id, domain::OrderStatus::READY, "kitchen"),
                 domain::InvalidTransitionException);

    auto stored = service.getOrder(order.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, domain::OrderStatus::CONFIRMED);
    ASSERT_EQ(stored->items.size(), 1u);
    EXPECT_EQ(stored->items[0].specialInstructions, "extra chili");
    EXPECT_EQ(stored->totals.subtotal.toCents(), 2500);
    EXPECT_EQ(stored->totals.taxAmount.toCents(), 219);

    auto history = service.getStatusHistory(order.id);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_FALSE(history[0].previousStatus.has_value());
    ASSERT_TRUE(history[1].previousStatus.has_value());
    EXPECT_EQ(*history[1].previousStatus, domain::OrderStatus::PENDING);

    EXPECT_EQ(service.listOrders(property_, domain::OrderStatus::CONFIRMED).size(), 1u);
}
