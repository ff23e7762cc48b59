#pragma once

#include "ports/output/IClock.hpp"
#include <mutex>

namespace hospitality::tests {

/**
 * @brief Управляемые часы для тестов
 *
 * По умолчанию время стоит на месте; advance() двигает его вперёд.
 */
class FakeClock : public ports::output::IClock {
public:
    explicit FakeClock(const domain::Timestamp& start = domain::Timestamp::fromString("2025-06-01T09:00:00Z"))
        : now_(start) {}

    domain::Timestamp now() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(const domain::Timestamp& ts) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = ts;
    }

    void advanceMinutes(int64_t minutes) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = now_.addMinutes(minutes);
    }

    void advanceSeconds(int64_t seconds) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = now_.addSeconds(seconds);
    }

private:
    std::mutex mutex_;
    domain::Timestamp now_;
};

} // namespace hospitality::tests
