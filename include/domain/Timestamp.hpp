#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace hospitality::domain {

/**
 * @brief Временная метка (UTC) в ISO 8601 формате
 *
 * Точность - микросекунды: столько же хранит TIMESTAMPTZ в PostgreSQL,
 * поэтому значение переживает round-trip через БД без потерь.
 */
struct Timestamp {
    using Clock = std::chrono::system_clock;
    using Micros = std::chrono::microseconds;

    Clock::time_point value;

    Timestamp() : value(truncate(Clock::now())) {}

    explicit Timestamp(Clock::time_point tp) : value(truncate(tp)) {}

    /**
     * @brief Создать Timestamp с текущим временем
     */
    static Timestamp now() {
        return Timestamp(Clock::now());
    }

    /**
     * @brief Разобрать ISO 8601 строку
     * @param isoString "2025-06-01T14:00:00Z" или "2025-06-01T14:00:00.250Z"
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M");

        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + isoString);
        }

        int64_t micros = 0;
        if (ss.peek() == ':') {
            ss.get();
            int seconds = 0;
            ss >> seconds;
            if (ss.fail()) {
                throw std::invalid_argument("Invalid timestamp: " + isoString);
            }
            tm.tm_sec = seconds;

            if (ss.peek() == '.') {
                ss.get();
                int64_t scale = 100000;
                while (std::isdigit(ss.peek())) {
                    micros += (ss.get() - '0') * scale;
                    scale /= 10;
                }
            }
        }

        auto seconds = static_cast<int64_t>(timegm(&tm));
        return fromUnixMicros(seconds * 1000000 + micros);
    }

    /**
     * @brief Преобразовать в ISO 8601 строку (UTC)
     */
    std::string toString() const {
        auto time_t_val = Clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        auto micros = toUnixMicros() % 1000000;
        if (micros < 0) {
            micros += 1000000;
        }

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (micros != 0) {
            ss << '.' << std::setw(6) << std::setfill('0') << micros;
        }
        ss << 'Z';
        return ss.str();
    }

    /**
     * @brief Получить Unix timestamp (секунды с 1970)
     */
    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    int64_t toUnixMicros() const {
        return std::chrono::duration_cast<Micros>(value.time_since_epoch()).count();
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(Clock::time_point(std::chrono::seconds(seconds)));
    }

    static Timestamp fromUnixMicros(int64_t micros) {
        return Timestamp(Clock::time_point(Micros(micros)));
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp addMinutes(int64_t minutes) const {
        return Timestamp(value + std::chrono::minutes(minutes));
    }

    Timestamp addHours(int64_t hours) const {
        return Timestamp(value + std::chrono::hours(hours));
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }

private:
    static Clock::time_point truncate(Clock::time_point tp) {
        return Clock::time_point(std::chrono::duration_cast<Micros>(tp.time_since_epoch()));
    }
};

} // namespace hospitality::domain
