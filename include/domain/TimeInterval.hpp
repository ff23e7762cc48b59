#pragma once

#include "Timestamp.hpp"

namespace hospitality::domain {

/**
 * @brief Полуоткрытый интервал [start, end)
 *
 * Интервалы, у которых конец одного равен началу другого, не пересекаются:
 * выезд в 11:00 и заезд следующего гостя в 11:00 допустимы.
 */
struct TimeInterval {
    Timestamp start;
    Timestamp end;

    TimeInterval() = default;

    TimeInterval(const Timestamp& s, const Timestamp& e) : start(s), end(e) {}

    bool isValid() const {
        return start < end;
    }

    bool overlaps(const TimeInterval& other) const {
        return start < other.end && other.start < end;
    }

    std::string toString() const {
        return "[" + start.toString() + ", " + end.toString() + ")";
    }

    bool operator==(const TimeInterval& other) const {
        return start == other.start && end == other.end;
    }
};

} // namespace hospitality::domain
