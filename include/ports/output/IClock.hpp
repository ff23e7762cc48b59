#pragma once

#include "domain/Timestamp.hpp"

namespace hospitality::ports::output {

/**
 * @brief Источник текущего времени
 *
 * Сервисы берут время только отсюда, чтобы тесты могли его подменять.
 */
class IClock {
public:
    virtual ~IClock() = default;
    virtual domain::Timestamp now() = 0;
};

} // namespace hospitality::ports::output
