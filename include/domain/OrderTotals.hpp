#pragma once

#include "Money.hpp"
#include "OrderLineItem.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace hospitality::domain {

/**
 * @brief Итоги заказа
 */
struct OrderTotals {
    Money subtotal;
    Money taxAmount;
    Money tipAmount;
    Money deliveryFee;
    Money total;

    /**
     * @brief Детерминированный пересчёт из позиций
     *
     * tax = subtotal * taxRateBps / 10000, округление до цента half-up.
     */
    static OrderTotals compute(
        const std::vector<OrderLineItem>& items,
        const Money& tip,
        const Money& fee,
        int64_t taxRateBps,
        const std::string& currency
    ) {
        OrderTotals totals;
        totals.subtotal = Money::fromCents(0, currency);
        for (const auto& item : items) {
            totals.subtotal = totals.subtotal + item.lineTotal();
        }
        totals.subtotal = Money::fromCents(totals.subtotal.toCents(), currency);
        totals.taxAmount = totals.subtotal.percentOf(taxRateBps);
        totals.tipAmount = Money::fromCents(tip.toCents(), currency);
        totals.deliveryFee = Money::fromCents(fee.toCents(), currency);
        totals.total = totals.subtotal + totals.taxAmount + totals.tipAmount + totals.deliveryFee;
        return totals;
    }
};

} // namespace hospitality::domain
