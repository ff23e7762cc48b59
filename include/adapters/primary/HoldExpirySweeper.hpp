#pragma once

#include "ports/input/IAvailabilityService.hpp"
#include "ports/output/IClock.hpp"
#include "settings/ReservationSettings.hpp"
#include "domain/exceptions/DomainException.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace hospitality::adapters::primary {

/**
 * @brief Фоновый поток отмены просроченных HELD броней
 *
 * Раз в sweepInterval отменяет брони, которые висят в HELD дольше
 * holdWindow, с причиной "hold expired". Статус перепроверяется под
 * блокировкой ресурса (expireHold): бронь, подтверждённую после
 * выборки, sweeper не трогает.
 */
class HoldExpirySweeper {
public:
    HoldExpirySweeper(
        std::shared_ptr<ports::input::IAvailabilityService> availability,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::ReservationSettings> settings
    ) : availability_(std::move(availability))
      , clock_(std::move(clock))
      , holdWindow_(settings->getHoldWindow())
      , interval_(settings->getSweepInterval())
      , running_(false)
      , sweepCount_(0)
      , cancelledCount_(0)
    {}

    ~HoldExpirySweeper() {
        stop();
    }

    HoldExpirySweeper(const HoldExpirySweeper&) = delete;
    HoldExpirySweeper& operator=(const HoldExpirySweeper&) = delete;

    /**
     * @brief Сменить период; работающий поток прерывает текущее ожидание
     */
    void setInterval(std::chrono::milliseconds interval) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interval_ = interval;
            rescheduled_ = true;
        }
        wakeup_.notify_all();
    }

    void start() {
        if (running_.exchange(true)) return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            rescheduled_ = false;
        }

        std::cout << "[HoldExpirySweeper] Started, window "
                  << holdWindow_.count() << " min" << std::endl;

        thread_ = std::thread([this]() {
            while (running_) {
                try {
                    manualSweep();
                } catch (const domain::StorageUnavailableException& e) {
                    std::cerr << "[HoldExpirySweeper] Storage unavailable, retry next tick: "
                              << e.what() << std::endl;
                }

                std::unique_lock<std::mutex> lock(mutex_);
                wakeup_.wait_for(lock, interval_, [this]() { return !running_ || rescheduled_; });
                rescheduled_ = false;
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        wakeup_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
            std::cout << "[HoldExpirySweeper] Stopped" << std::endl;
        }
    }

    bool isRunning() const { return running_; }

    uint64_t sweepCount() const { return sweepCount_; }

    uint64_t cancelledCount() const { return cancelledCount_; }

    /**
     * @brief Выполнить один проход синхронно (для тестов)
     * @return Сколько броней отменено в этом проходе
     */
    size_t manualSweep() {
        auto cutoff = clock_->now().addSeconds(
            -std::chrono::duration_cast<std::chrono::seconds>(holdWindow_).count());

        size_t cancelled = 0;
        for (const auto& reservation : availability_->listExpiredHolds(cutoff)) {
            try {
                if (availability_->expireHold(reservation.id, cutoff)) {
                    ++cancelled;
                }
            } catch (const domain::NotFoundException& e) {
                std::cerr << "[HoldExpirySweeper] " << e.what() << std::endl;
            }
        }

        ++sweepCount_;
        cancelledCount_ += cancelled;
        if (cancelled > 0) {
            std::cout << "[HoldExpirySweeper] Cancelled " << cancelled << " expired holds" << std::endl;
        }
        return cancelled;
    }

private:
    std::shared_ptr<ports::input::IAvailabilityService> availability_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::chrono::minutes holdWindow_;
    std::chrono::milliseconds interval_;    // под mutex_
    bool rescheduled_ = false;              // под mutex_
    std::atomic<bool> running_;
    std::atomic<uint64_t> sweepCount_;
    std::atomic<uint64_t> cancelledCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wakeup_;
};

} // namespace hospitality::adapters::primary
