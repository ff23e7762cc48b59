/**
 * @file OrderLifecycleServiceTest.cpp
 * @brief Unit tests for OrderLifecycleService over the in-memory store
 */

#include <gtest/gtest.h>
#include "application/OrderLifecycleService.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "mocks/FakeClock.hpp"
#include <atomic>
#include <limits>
#include <thread>
#include <vector>

using namespace hospitality;
using namespace hospitality::application;
using namespace hospitality::tests;

class OrderLifecycleServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<adapters::secondary::InMemoryOrderRepository>();
        clock_ = std::make_shared<FakeClock>();
        settings_ = std::make_shared<settings::OrderSettings>(settings::OrderSettings::fixed(875, "NAD"));
        service_ = std::make_shared<OrderLifecycleService>(repository_, clock_, settings_);
    }

    ports::input::OrderItemRequest burger(int64_t quantity = 2) {
        return {
            .menuItemId = "menu-burger",
            .name = "Oryx burger",
            .quantity = quantity,
            .unitPrice = domain::Money::fromCents(1250)
        };
    }

    ports::input::OrderItemRequest soda() {
        return {
            .menuItemId = "menu-soda",
            .name = "Soda",
            .quantity = 1,
            .unitPrice = domain::Money::fromCents(499)
        };
    }

    domain::Order createEmpty(const std::string& customer = "guest-1") {
        return service_->createOrder({
            .propertyId = PROPERTY,
            .customerId = customer,
            .type = domain::OrderType::DINE_IN,
            .actor = "waiter"
        });
    }

    void advance(const std::string& orderId, domain::OrderStatus to) {
        service_->transitionOrderStatus(orderId, to, "kitchen");
    }

    static constexpr const char* PROPERTY = "prop-windhoek";

    std::shared_ptr<adapters::secondary::InMemoryOrderRepository> repository_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<settings::OrderSettings> settings_;
    std::shared_ptr<OrderLifecycleService> service_;
};

// ============================================================================
// CREATE ORDER
// ============================================================================

TEST_F(OrderLifecycleServiceTest, CreateOrder_PendingWithTotals) {
    auto order = service_->createOrder({
        .propertyId = PROPERTY,
        .customerId = "guest-1",
        .type = domain::OrderType::DELIVERY,
        .items = {burger(), soda()},
        .tipAmount = domain::Money::fromCents(300),
        .actor = "waiter"
    });

    EXPECT_FALSE(order.id.empty());
    EXPECT_EQ(order.orderNumber.rfind("ORD-", 0), 0u);
    EXPECT_EQ(order.status, domain::OrderStatus::PENDING);
    ASSERT_EQ(order.items.size(), 2u);
    EXPECT_NE(order.items[0].id, order.items[1].id);

    EXPECT_EQ(order.totals.subtotal.toCents(), 2999);
    EXPECT_EQ(order.totals.taxAmount.toCents(), 262);
    EXPECT_EQ(order.totals.tipAmount.toCents(), 300);
    EXPECT_EQ(order.totals.deliveryFee.toCents(), 0);
    EXPECT_EQ(order.totals.total.toCents(), 3561);

    auto stored = service_->getOrder(order.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->totals.total.toCents(), 3561);
}

TEST_F(OrderLifecycleServiceTest, CreateOrder_WritesCreationHistory) {
    auto order = createEmpty();

    auto history = service_->getStatusHistory(order.id);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_FALSE(history[0].previousStatus.has_value());
    EXPECT_EQ(history[0].status, domain::OrderStatus::PENDING);
    EXPECT_EQ(history[0].actor, "waiter");
}

TEST_F(OrderLifecycleServiceTest, CreateOrder_InvalidInput_Throws) {
    EXPECT_THROW(service_->createOrder({.propertyId = PROPERTY, .customerId = ""}),
                 domain::ValidationException);
    EXPECT_THROW(service_->createOrder({
        .propertyId = PROPERTY,
        .customerId = "guest-1",
        .items = {burger(0)}
    }), domain::ValidationException);
    EXPECT_THROW(service_->createOrder({
        .propertyId = PROPERTY,
        .customerId = "guest-1",
        .tipAmount = domain::Money::fromCents(-1)
    }), domain::ValidationException);
}

// ============================================================================
// ITEM EDITS
// ============================================================================

TEST_F(OrderLifecycleServiceTest, AddItem_RecomputesTotals) {
    auto order = createEmpty();

    order = service_->addItem(order.id, burger());
    EXPECT_EQ(order.totals.subtotal.toCents(), 2500);

    order = service_->addItem(order.id, soda());
    EXPECT_EQ(order.totals.subtotal.toCents(), 2999);
    EXPECT_EQ(order.totals.taxAmount.toCents(), 262);
    EXPECT_EQ(service_->getOrder(order.id)->items.size(), 2u);
}

TEST_F(OrderLifecycleServiceTest, RemoveAndRepriceItem) {
    auto order = createEmpty();
    order = service_->addItem(order.id, burger());
    order = service_->addItem(order.id, soda());
    auto burgerLine = order.items[0].id;
    auto sodaLine = order.items[1].id;

    order = service_->repriceItem(order.id, burgerLine, domain::Money::fromCents(1000));
    EXPECT_EQ(order.totals.subtotal.toCents(), 2499);

    order = service_->removeItem(order.id, sodaLine);
    ASSERT_EQ(order.items.size(), 1u);
    EXPECT_EQ(order.totals.subtotal.toCents(), 2000);
    EXPECT_EQ(order.totals.taxAmount.toCents(), 175);

    EXPECT_THROW(service_->removeItem(order.id, sodaLine), domain::NotFoundException);
}

TEST_F(OrderLifecycleServiceTest, AddItem_QuantityAndPriceBounded) {
    auto order = createEmpty();

    EXPECT_THROW(service_->addItem(order.id, burger(std::numeric_limits<int64_t>::max())),
                 domain::ValidationException);
    EXPECT_THROW(service_->addItem(order.id, burger(10001)), domain::ValidationException);

    auto pricey = soda();
    pricey.unitPrice = domain::Money(std::numeric_limits<int64_t>::max() / 2, 0);
    EXPECT_THROW(service_->addItem(order.id, pricey), domain::ValidationException);

    order = service_->addItem(order.id, burger(10000));
    EXPECT_EQ(order.totals.subtotal.toCents(), 10000 * 1250);
}

// Подытог ограничен, заказ при отказе не меняется
TEST_F(OrderLifecycleServiceTest, AddItem_SubtotalAboveMaximum_Rejected) {
    auto order = createEmpty();

    auto banquet = soda();
    banquet.unitPrice = domain::Money::fromCents(100000000000000);
    order = service_->addItem(order.id, banquet);
    EXPECT_EQ(order.totals.subtotal.toCents(), 100000000000000);

    EXPECT_THROW(service_->addItem(order.id, soda()), domain::ValidationException);
    EXPECT_THROW(service_->repriceItem(order.id, order.items[0].id, domain::Money::fromCents(100000000000100)),
                 domain::ValidationException);

    auto stored = service_->getOrder(order.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->items.size(), 1u);
    EXPECT_EQ(stored->totals.subtotal.toCents(), 100000000000000);
}

TEST_F(OrderLifecycleServiceTest, AddItem_UnknownOrder_NotFound) {
    EXPECT_THROW(service_->addItem("missing", burger()), domain::NotFoundException);
}

// ============================================================================
// STATUS TRANSITIONS
// ============================================================================

// Подтверждение замораживает состав, пропуск шагов и откат запрещены
TEST_F(OrderLifecycleServiceTest, Lifecycle_FreezeSkipAndRevert) {
    auto order = createEmpty();
    service_->addItem(order.id, burger());
    service_->addItem(order.id, soda());

    clock_->advanceMinutes(1);
    auto confirmed = service_->transitionOrderStatus(order.id, domain::OrderStatus::CONFIRMED, "waiter");
    EXPECT_EQ(confirmed.status, domain::OrderStatus::CONFIRMED);
    EXPECT_EQ(confirmed.totals.total.toCents(), 2999 + 262);

    EXPECT_THROW(service_->addItem(order.id, soda()), domain::ValidationException);
    EXPECT_EQ(service_->getOrder(order.id)->items.size(), 2u);

    EXPECT_THROW(service_->transitionOrderStatus(order.id, domain::OrderStatus::COMPLETED, "waiter"),
                 domain::InvalidTransitionException);

    clock_->advanceMinutes(5);
    advance(order.id, domain::OrderStatus::PREPARING);
    clock_->advanceMinutes(10);
    advance(order.id, domain::OrderStatus::READY);
    clock_->advanceMinutes(2);
    advance(order.id, domain::OrderStatus::COMPLETED);

    try {
        service_->transitionOrderStatus(order.id, domain::OrderStatus::PENDING, "waiter");
        FAIL() << "Expected InvalidTransitionException";
    } catch (const domain::InvalidTransitionException& e) {
        EXPECT_EQ(e.from(), "COMPLETED");
        EXPECT_EQ(e.to(), "PENDING");
    }

    auto stored = service_->getOrder(order.id);
    EXPECT_EQ(stored->status, domain::OrderStatus::COMPLETED);
    EXPECT_EQ(stored->totals.total.toCents(), 2999 + 262);
}

TEST_F(OrderLifecycleServiceTest, Transition_HistoryIsChronological) {
    auto order = createEmpty();
    service_->addItem(order.id, burger());

    clock_->advanceMinutes(1);
    advance(order.id, domain::OrderStatus::CONFIRMED);
    clock_->advanceMinutes(1);
    service_->transitionOrderStatus(order.id, domain::OrderStatus::CANCELLED, "manager",
                                    std::string("guest left"));

    auto history = service_->getStatusHistory(order.id);
    ASSERT_EQ(history.size(), 3u);

    EXPECT_EQ(history[0].status, domain::OrderStatus::PENDING);
    ASSERT_TRUE(history[1].previousStatus.has_value());
    EXPECT_EQ(*history[1].previousStatus, domain::OrderStatus::PENDING);
    EXPECT_EQ(history[1].status, domain::OrderStatus::CONFIRMED);
    ASSERT_TRUE(history[2].previousStatus.has_value());
    EXPECT_EQ(*history[2].previousStatus, domain::OrderStatus::CONFIRMED);
    EXPECT_EQ(history[2].status, domain::OrderStatus::CANCELLED);
    EXPECT_EQ(history[2].actor, "manager");
    EXPECT_EQ(history[2].notes, "guest left");
    EXPECT_LT(history[0].sequence, history[1].sequence);
    EXPECT_LT(history[1].sequence, history[2].sequence);
}

TEST_F(OrderLifecycleServiceTest, Transition_ConfirmEmptyOrder_Throws) {
    auto order = createEmpty();

    EXPECT_THROW(advance(order.id, domain::OrderStatus::CONFIRMED), domain::ValidationException);
    EXPECT_EQ(service_->getOrder(order.id)->status, domain::OrderStatus::PENDING);
    EXPECT_EQ(service_->getStatusHistory(order.id).size(), 1u);
}

TEST_F(OrderLifecycleServiceTest, Transition_SameStatus_Invalid) {
    auto order = createEmpty();

    EXPECT_THROW(advance(order.id, domain::OrderStatus::PENDING), domain::InvalidTransitionException);
}

TEST_F(OrderLifecycleServiceTest, Transition_CancelledIsFinal) {
    auto order = createEmpty();
    advance(order.id, domain::OrderStatus::CANCELLED);

    EXPECT_THROW(advance(order.id, domain::OrderStatus::CONFIRMED), domain::InvalidTransitionException);
    EXPECT_THROW(service_->addItem(order.id, burger()), domain::ValidationException);
}

TEST_F(OrderLifecycleServiceTest, Transition_UnknownOrder_NotFound) {
    EXPECT_THROW(advance("missing", domain::OrderStatus::CONFIRMED), domain::NotFoundException);
}

TEST_F(OrderLifecycleServiceTest, Transition_ConcurrentConfirm_ExactlyOneWins) {
    auto order = createEmpty();
    service_->addItem(order.id, burger());

    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([this, &order, &succeeded, &rejected]() {
            try {
                advance(order.id, domain::OrderStatus::CONFIRMED);
                ++succeeded;
            } catch (const domain::InvalidTransitionException&) {
                ++rejected;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded, 1);
    EXPECT_EQ(rejected, 5);
    EXPECT_EQ(service_->getStatusHistory(order.id).size(), 2u);
}

// ============================================================================
// QUERIES
// ============================================================================

TEST_F(OrderLifecycleServiceTest, ListOrders_NewestFirstWithStatusFilter) {
    auto first = createEmpty("guest-1");
    clock_->advanceMinutes(1);
    auto second = createEmpty("guest-2");
    service_->addItem(second.id, soda());
    advance(second.id, domain::OrderStatus::CONFIRMED);

    service_->createOrder({.propertyId = "prop-swakopmund", .customerId = "guest-3"});

    auto all = service_->listOrders(PROPERTY);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, second.id);
    EXPECT_EQ(all[1].id, first.id);

    auto pending = service_->listOrders(PROPERTY, domain::OrderStatus::PENDING);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, first.id);
}

TEST_F(OrderLifecycleServiceTest, GetStatusHistory_UnknownOrder_NotFound) {
    EXPECT_FALSE(service_->getOrder("missing").has_value());
    EXPECT_THROW(service_->getStatusHistory("missing"), domain::NotFoundException);
}
