#pragma once

#include <string>
#include <cstdint>
#include <cmath>

namespace hospitality::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Хранит целую часть и дробную в нано-единицах (10^-9).
 * Итоги заказа считаются в центах (minor units), округление half-up.
 */
class Money {
public:
    static constexpr int32_t NANO_PER_UNIT = 1000000000;
    static constexpr int32_t NANO_PER_CENT = 10000000;

    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть (10^-9)
    std::string currency = "NAD";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "NAD")
        : units(u), nano(n), currency(cur) {}

    static Money fromDouble(double value, const std::string& cur = "NAD") {
        return fromCents(static_cast<int64_t>(std::llround(value * 100.0)), cur);
    }

    /**
     * @brief Создать из суммы в центах
     */
    static Money fromCents(int64_t cents, const std::string& cur = "NAD") {
        Money m;
        m.currency = cur;
        m.units = cents / 100;
        m.nano = static_cast<int32_t>((cents % 100) * NANO_PER_CENT);
        return m;
    }

    /**
     * @brief Сумма в центах, дробные остатки округляются half-up
     */
    int64_t toCents() const {
        int64_t cents = units * 100 + nano / NANO_PER_CENT;
        int32_t rest = nano % NANO_PER_CENT;
        if (rest >= NANO_PER_CENT / 2) {
            ++cents;
        } else if (rest <= -NANO_PER_CENT / 2) {
            --cents;
        }
        return cents;
    }

    bool isNegative() const {
        return units < 0 || (units == 0 && nano < 0);
    }

    bool isZero() const {
        return units == 0 && nano == 0;
    }

    Money operator+(const Money& other) const {
        Money result;
        result.currency = currency;
        result.units = units + other.units;
        result.nano = nano + other.nano;
        result.normalize();
        return result;
    }

    Money operator-(const Money& other) const {
        Money result;
        result.currency = currency;
        result.units = units - other.units;
        result.nano = nano - other.nano;
        result.normalize();
        return result;
    }

    Money operator*(int64_t multiplier) const {
        Money result;
        result.currency = currency;
        int64_t totalNano = static_cast<int64_t>(nano) * multiplier;
        result.units = units * multiplier + totalNano / NANO_PER_UNIT;
        result.nano = static_cast<int32_t>(totalNano % NANO_PER_UNIT);
        result.normalize();
        return result;
    }

    /**
     * @brief Доля суммы в базисных пунктах (875 = 8.75%), округлённая до цента
     */
    Money percentOf(int64_t basisPoints) const {
        int64_t scaled = toCents() * basisPoints;
        int64_t cents = scaled / 10000;
        if (scaled % 10000 >= 5000) {
            ++cents;
        }
        return fromCents(cents, currency);
    }

    bool operator<(const Money& other) const {
        return units < other.units || (units == other.units && nano < other.nano);
    }

    bool operator>(const Money& other) const {
        return other < *this;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

private:
    void normalize() {
        if (nano >= NANO_PER_UNIT) {
            units += nano / NANO_PER_UNIT;
            nano %= NANO_PER_UNIT;
        } else if (nano <= -NANO_PER_UNIT) {
            units += nano / NANO_PER_UNIT;
            nano %= NANO_PER_UNIT;
        }
        // Знаки units и nano совпадают
        if (units > 0 && nano < 0) {
            --units;
            nano += NANO_PER_UNIT;
        } else if (units < 0 && nano > 0) {
            ++units;
            nano -= NANO_PER_UNIT;
        }
    }
};

} // namespace hospitality::domain
