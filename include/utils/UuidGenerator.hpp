#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <cstdint>
#include <ctime>

#include "domain/Timestamp.hpp"

namespace hospitality::utils {

/**
 * @brief Генератор UUID v4 и человекочитаемых номеров
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief Генерирует UUID v4
     *
     * Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     * где x - hex digit, y - один из [8, 9, a, b]
     */
    static std::string generate() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t part1 = dist(gen);
        uint64_t part2 = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');

        ss << std::setw(8) << ((part1 >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((part1 >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((part1 & 0x0FFF) | 0x4000) << "-";            // version 4
        ss << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000) << "-";    // variant
        ss << std::setw(12) << (part2 & 0xFFFFFFFFFFFF);

        return ss.str();
    }

    /**
     * @brief Номер заказа для гостя и кухни
     *
     * @return "ORD-YYYYMMDDHHMMSS-XXXXXXXX" (X - первые 8 символов UUID, верхний регистр)
     */
    static std::string orderNumber(const domain::Timestamp& at) {
        auto time = static_cast<std::time_t>(at.toUnixSeconds());
        std::tm tm = {};
        gmtime_r(&time, &tm);

        std::string suffix = generate().substr(0, 8);
        for (auto& c : suffix) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        std::ostringstream ss;
        ss << "ORD-" << std::put_time(&tm, "%Y%m%d%H%M%S") << "-" << suffix;
        return ss.str();
    }
};

} // namespace hospitality::utils
