#pragma once

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace hospitality::settings {

/**
 * @brief Настройки расчёта итогов заказа
 *
 * Читает из ENV:
 * - HOSPITALITY_ORDER_TAX_RATE_BPS (default: 875 = 8.75%)
 * - HOSPITALITY_CURRENCY (default: NAD)
 */
class OrderSettings {
public:
    OrderSettings() {
        if (const char* val = std::getenv("HOSPITALITY_ORDER_TAX_RATE_BPS")) {
            taxRateBps_ = std::stoll(val);
        }
        if (const char* val = std::getenv("HOSPITALITY_CURRENCY")) {
            currency_ = val;
        }
        if (taxRateBps_ < 0 || taxRateBps_ > 10000) {
            throw std::invalid_argument("HOSPITALITY_ORDER_TAX_RATE_BPS must be in [0, 10000]");
        }
    }

    /**
     * @brief Настройки с явными значениями, без чтения ENV
     */
    static OrderSettings fixed(int64_t taxRateBps, const std::string& currency) {
        OrderSettings settings(taxRateBps, currency);
        return settings;
    }

    int64_t getTaxRateBps() const { return taxRateBps_; }
    std::string getCurrency() const { return currency_; }

private:
    OrderSettings(int64_t taxRateBps, const std::string& currency)
        : taxRateBps_(taxRateBps), currency_(currency) {}

    int64_t taxRateBps_ = 875;
    std::string currency_ = "NAD";
};

} // namespace hospitality::settings
