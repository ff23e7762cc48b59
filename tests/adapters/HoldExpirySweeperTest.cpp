/**
 * @file HoldExpirySweeperTest.cpp
 * @brief Unit tests for HoldExpirySweeper
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "adapters/primary/HoldExpirySweeper.hpp"
#include "adapters/secondary/persistence/InMemoryReservationRepository.hpp"
#include "application/AvailabilityService.hpp"
#include "mocks/FakeClock.hpp"
#include <thread>

using namespace hospitality;
using namespace hospitality::adapters::primary;
using namespace hospitality::tests;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

using domain::Timestamp;

// ============================================================================
// Mock
// ============================================================================

class MockAvailabilityService : public ports::input::IAvailabilityService {
public:
    MOCK_METHOD(domain::BookableResource, registerResource,
                (const ports::input::RegisterResourceRequest& request), (override));
    MOCK_METHOD(domain::BookableResource, deactivateResource,
                (const std::string& propertyId, const std::string& resourceId), (override));
    MOCK_METHOD(bool, checkAvailability,
                (const std::string& resourceId, const Timestamp& start, const Timestamp& end), (override));
    MOCK_METHOD(std::vector<domain::BookableResource>, findAvailableResources,
                (const std::string& propertyId, domain::ResourceKind kind, int partySize,
                 const Timestamp& start, const Timestamp& end), (override));
    MOCK_METHOD(domain::Reservation, createReservation,
                (const ports::input::CreateReservationRequest& request), (override));
    MOCK_METHOD(domain::Reservation, confirmReservation, (const std::string& reservationId), (override));
    MOCK_METHOD(domain::Reservation, cancelReservation,
                (const std::string& reservationId, const std::string& reason), (override));
    MOCK_METHOD(std::optional<domain::Reservation>, getReservation,
                (const std::string& reservationId), (override));
    MOCK_METHOD(std::vector<domain::Reservation>, listReservations,
                (const std::string& resourceId), (override));
    MOCK_METHOD(std::vector<domain::Reservation>, listExpiredHolds, (const Timestamp& cutoff), (override));
    MOCK_METHOD(bool, expireHold, (const std::string& reservationId, const Timestamp& cutoff), (override));
};

static domain::Reservation heldReservation(const std::string& id) {
    domain::Reservation reservation;
    reservation.id = id;
    reservation.status = domain::ReservationStatus::HELD;
    return reservation;
}

// ============================================================================
// Sweep against the port
// ============================================================================

class HoldExpirySweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        availability_ = std::make_shared<NiceMock<MockAvailabilityService>>();
        clock_ = std::make_shared<FakeClock>();
        settings_ = std::make_shared<settings::ReservationSettings>();
        sweeper_ = std::make_unique<HoldExpirySweeper>(availability_, clock_, settings_);
    }

    void TearDown() override {
        sweeper_->stop();
    }

    Timestamp expectedCutoff() {
        return clock_->now().addMinutes(-settings_->getHoldWindow().count());
    }

    std::shared_ptr<NiceMock<MockAvailabilityService>> availability_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<settings::ReservationSettings> settings_;
    std::unique_ptr<HoldExpirySweeper> sweeper_;
};

TEST_F(HoldExpirySweeperTest, ManualSweep_ExpiresEachListedHold) {
    auto cutoff = expectedCutoff();

    EXPECT_CALL(*availability_, listExpiredHolds(cutoff))
        .WillOnce(Return(std::vector<domain::Reservation>{
            heldReservation("r-1"), heldReservation("r-2")
        }));
    EXPECT_CALL(*availability_, expireHold("r-1", cutoff)).WillOnce(Return(true));
    EXPECT_CALL(*availability_, expireHold("r-2", cutoff)).WillOnce(Return(true));

    EXPECT_EQ(sweeper_->manualSweep(), 2u);
    EXPECT_EQ(sweeper_->sweepCount(), 1u);
    EXPECT_EQ(sweeper_->cancelledCount(), 2u);
}

// Бронь подтвердили между выборкой и отменой
TEST_F(HoldExpirySweeperTest, ManualSweep_HoldConfirmedMeanwhile_NotCounted) {
    EXPECT_CALL(*availability_, listExpiredHolds(_))
        .WillOnce(Return(std::vector<domain::Reservation>{heldReservation("r-1")}));
    EXPECT_CALL(*availability_, expireHold("r-1", _)).WillOnce(Return(false));

    EXPECT_EQ(sweeper_->manualSweep(), 0u);
    EXPECT_EQ(sweeper_->cancelledCount(), 0u);
}

TEST_F(HoldExpirySweeperTest, ManualSweep_VanishedReservation_ContinuesWithRest) {
    EXPECT_CALL(*availability_, listExpiredHolds(_))
        .WillOnce(Return(std::vector<domain::Reservation>{
            heldReservation("gone"), heldReservation("r-2")
        }));
    EXPECT_CALL(*availability_, expireHold("gone", _))
        .WillOnce(Throw(domain::NotFoundException("Reservation", "gone")));
    EXPECT_CALL(*availability_, expireHold("r-2", _)).WillOnce(Return(true));

    EXPECT_EQ(sweeper_->manualSweep(), 1u);
}

TEST_F(HoldExpirySweeperTest, ManualSweep_StorageUnavailable_Propagates) {
    EXPECT_CALL(*availability_, listExpiredHolds(_))
        .WillOnce(Throw(domain::StorageUnavailableException("connection refused")));

    EXPECT_THROW(sweeper_->manualSweep(), domain::StorageUnavailableException);
    EXPECT_EQ(sweeper_->sweepCount(), 0u);
}

TEST_F(HoldExpirySweeperTest, StartStop_SweepsPeriodically) {
    ON_CALL(*availability_, listExpiredHolds(_))
        .WillByDefault(Return(std::vector<domain::Reservation>{}));

    sweeper_->setInterval(std::chrono::milliseconds(10));
    sweeper_->start();
    EXPECT_TRUE(sweeper_->isRunning());

    for (int i = 0; i < 200 && sweeper_->sweepCount() < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    sweeper_->stop();

    EXPECT_FALSE(sweeper_->isRunning());
    EXPECT_GE(sweeper_->sweepCount(), 3u);
}

// Период меняется на ходу, поток не дожидается старого минутного тика
TEST_F(HoldExpirySweeperTest, SetInterval_WhileRunning_TakesEffect) {
    ON_CALL(*availability_, listExpiredHolds(_))
        .WillByDefault(Return(std::vector<domain::Reservation>{}));

    sweeper_->setInterval(std::chrono::minutes(1));
    sweeper_->start();
    for (int i = 0; i < 200 && sweeper_->sweepCount() < 1; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_GE(sweeper_->sweepCount(), 1u);

    sweeper_->setInterval(std::chrono::milliseconds(10));

    for (int i = 0; i < 200 && sweeper_->sweepCount() < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    sweeper_->stop();

    EXPECT_GE(sweeper_->sweepCount(), 3u);
}

TEST_F(HoldExpirySweeperTest, Start_StorageFailureDoesNotStopLoop) {
    EXPECT_CALL(*availability_, listExpiredHolds(_))
        .WillOnce(Throw(domain::StorageUnavailableException("lock timeout")))
        .WillRepeatedly(Return(std::vector<domain::Reservation>{}));

    sweeper_->setInterval(std::chrono::milliseconds(10));
    sweeper_->start();
    for (int i = 0; i < 200 && sweeper_->sweepCount() < 1; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    sweeper_->stop();

    EXPECT_GE(sweeper_->sweepCount(), 1u);
}

// ============================================================================
// Sweep against the in-memory store
// ============================================================================

TEST(HoldExpirySweeperInMemoryTest, CancelsOnlyStaleHolds) {
    auto repository = std::make_shared<adapters::secondary::InMemoryReservationRepository>();
    auto clock = std::make_shared<FakeClock>();
    auto service = std::make_shared<application::AvailabilityService>(repository, clock);
    auto reservationSettings = std::make_shared<settings::ReservationSettings>();
    HoldExpirySweeper sweeper(service, clock, reservationSettings);

    auto table = service->registerResource({
        .propertyId = "prop-windhoek",
        .kind = domain::ResourceKind::TABLE,
        .name = "Table 7",
        .capacity = 4
    });

    auto reserve = [&](const std::string& start, const std::string& end) {
        return service->createReservation({
            .propertyId = "prop-windhoek",
            .resourceId = table.id,
            .start = Timestamp::fromString(start),
            .end = Timestamp::fromString(end),
            .customerId = "guest-7",
            .partySize = 2
        });
    };

    auto stale = reserve("2025-06-10T18:00:00Z", "2025-06-10T20:00:00Z");
    auto confirmed = reserve("2025-06-11T18:00:00Z", "2025-06-11T20:00:00Z");
    service->confirmReservation(confirmed.id);

    clock->advanceMinutes(20);
    auto fresh = reserve("2025-06-12T18:00:00Z", "2025-06-12T20:00:00Z");

    EXPECT_EQ(sweeper.manualSweep(), 1u);

    auto expired = service->getReservation(stale.id);
    ASSERT_TRUE(expired.has_value());
    EXPECT_EQ(expired->status, domain::ReservationStatus::CANCELLED);
    EXPECT_EQ(expired->cancellationReason, application::AvailabilityService::HOLD_EXPIRED_REASON);

    EXPECT_EQ(service->getReservation(confirmed.id)->status, domain::ReservationStatus::CONFIRMED);
    EXPECT_EQ(service->getReservation(fresh.id)->status, domain::ReservationStatus::HELD);

    // Отменённая бронь освобождает интервал
    EXPECT_TRUE(service->checkAvailability(
        table.id,
        Timestamp::fromString("2025-06-10T18:00:00Z"),
        Timestamp::fromString("2025-06-10T20:00:00Z")));

    EXPECT_EQ(sweeper.manualSweep(), 0u);
}
