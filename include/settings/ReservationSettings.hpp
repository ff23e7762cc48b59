#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace hospitality::settings {

/**
 * @brief Настройки удержания броней
 *
 * Читает из ENV:
 * - HOSPITALITY_HOLD_WINDOW_MINUTES (default: 15) - сколько живёт HELD бронь
 * - HOSPITALITY_SWEEP_INTERVAL_SECONDS (default: 60) - период фоновой очистки
 * - HOSPITALITY_SWEEPER_ENABLED (default: true)
 */
class ReservationSettings {
public:
    ReservationSettings() {
        if (const char* val = std::getenv("HOSPITALITY_HOLD_WINDOW_MINUTES")) {
            holdWindowMinutes_ = std::stoi(val);
        }
        if (const char* val = std::getenv("HOSPITALITY_SWEEP_INTERVAL_SECONDS")) {
            sweepIntervalSeconds_ = std::stoi(val);
        }
        if (const char* val = std::getenv("HOSPITALITY_SWEEPER_ENABLED")) {
            sweeperEnabled_ = std::string(val) == "true";
        }
    }

    std::chrono::minutes getHoldWindow() const { return std::chrono::minutes(holdWindowMinutes_); }
    std::chrono::seconds getSweepInterval() const { return std::chrono::seconds(sweepIntervalSeconds_); }
    bool isSweeperEnabled() const { return sweeperEnabled_; }

private:
    int holdWindowMinutes_ = 15;
    int sweepIntervalSeconds_ = 60;
    bool sweeperEnabled_ = true;
};

} // namespace hospitality::settings
