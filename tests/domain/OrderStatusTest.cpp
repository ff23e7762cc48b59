/**
 * @file OrderStatusTest.cpp
 * @brief Transition table and enum conversions
 */

#include <gtest/gtest.h>
#include "domain/enums/OrderStatus.hpp"
#include "domain/enums/TransactionKind.hpp"
#include "domain/enums/ReservationStatus.hpp"
#include <set>
#include <utility>
#include <vector>

using namespace hospitality::domain;

namespace {

const std::vector<OrderStatus> ALL_STATUSES = {
    OrderStatus::PENDING,
    OrderStatus::CONFIRMED,
    OrderStatus::PREPARING,
    OrderStatus::READY,
    OrderStatus::COMPLETED,
    OrderStatus::CANCELLED
};

} // namespace

TEST(OrderStatusTest, TransitionTable_ExactlyTheAllowedEdges) {
    const std::set<std::pair<OrderStatus, OrderStatus>> allowed = {
        {OrderStatus::PENDING, OrderStatus::CONFIRMED},
        {OrderStatus::PENDING, OrderStatus::CANCELLED},
        {OrderStatus::CONFIRMED, OrderStatus::PREPARING},
        {OrderStatus::CONFIRMED, OrderStatus::CANCELLED},
        {OrderStatus::PREPARING, OrderStatus::READY},
        {OrderStatus::PREPARING, OrderStatus::CANCELLED},
        {OrderStatus::READY, OrderStatus::COMPLETED}
    };

    for (auto from : ALL_STATUSES) {
        for (auto to : ALL_STATUSES) {
            bool expected = allowed.count({from, to}) > 0;
            EXPECT_EQ(canTransition(from, to), expected)
                << toString(from) << " -> " << toString(to);
        }
    }
}

TEST(OrderStatusTest, TerminalStatuses) {
    EXPECT_TRUE(isFinalStatus(OrderStatus::COMPLETED));
    EXPECT_TRUE(isFinalStatus(OrderStatus::CANCELLED));
    EXPECT_FALSE(isFinalStatus(OrderStatus::READY));
    EXPECT_FALSE(isFinalStatus(OrderStatus::PENDING));
}

TEST(OrderStatusTest, ItemsEditableOnlyWhilePending) {
    for (auto status : ALL_STATUSES) {
        EXPECT_EQ(areItemsEditable(status), status == OrderStatus::PENDING) << toString(status);
    }
}

TEST(OrderStatusTest, StringConversion) {
    for (auto status : ALL_STATUSES) {
        EXPECT_EQ(orderStatusFromString(toString(status)), status);
    }
    EXPECT_THROW(orderStatusFromString("SHIPPED"), std::invalid_argument);
}

// ============================================================================
// TRANSACTION KIND / RESERVATION STATUS
// ============================================================================

TEST(TransactionKindTest, SignedDelta) {
    EXPECT_EQ(signedDelta(TransactionKind::PURCHASE, 5), 5);
    EXPECT_EQ(signedDelta(TransactionKind::RETURN, 2), 2);
    EXPECT_EQ(signedDelta(TransactionKind::SALE, 4), -4);
    EXPECT_EQ(signedDelta(TransactionKind::WASTE, 1), -1);
    EXPECT_THROW(signedDelta(TransactionKind::ADJUSTMENT, 3), std::invalid_argument);
}

TEST(ReservationStatusTest, ActiveStatuses) {
    EXPECT_TRUE(isActive(ReservationStatus::HELD));
    EXPECT_TRUE(isActive(ReservationStatus::CONFIRMED));
    EXPECT_FALSE(isActive(ReservationStatus::CANCELLED));
    EXPECT_EQ(reservationStatusFromString("HELD"), ReservationStatus::HELD);
}
