#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace hospitality::settings {

/**
 * @brief Выбор хранилища
 *
 * HOSPITALITY_STORAGE:
 * - postgres (default) - PostgreSQL через libpqxx
 * - memory - in-memory хранилище, данные живут до остановки процесса
 */
class StorageSettings {
public:
    enum class Backend { POSTGRES, MEMORY };

    StorageSettings() {
        const char* value = std::getenv("HOSPITALITY_STORAGE");
        std::string backend = value ? value : "postgres";
        if (backend == "postgres") {
            backend_ = Backend::POSTGRES;
        } else if (backend == "memory") {
            backend_ = Backend::MEMORY;
        } else {
            throw std::invalid_argument("Unknown HOSPITALITY_STORAGE: " + backend);
        }
    }

    Backend getBackend() const { return backend_; }

    bool isInMemory() const { return backend_ == Backend::MEMORY; }

private:
    Backend backend_ = Backend::POSTGRES;
};

} // namespace hospitality::settings
