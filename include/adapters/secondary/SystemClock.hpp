#pragma once

#include "ports/output/IClock.hpp"

namespace hospitality::adapters::secondary {

/**
 * @brief Системные часы (UTC)
 */
class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() override {
        return domain::Timestamp::now();
    }
};

} // namespace hospitality::adapters::secondary
