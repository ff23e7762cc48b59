#pragma once

#include <atomic>
#include <memory>

// Forward declarations - Ports
namespace hospitality::ports::input {
    class IAvailabilityService;
    class IInventoryLedgerService;
    class IOrderLifecycleService;
}

namespace hospitality::adapters::primary {
    class HoldExpirySweeper;
}

namespace hospitality::settings {
    class StorageSettings;
    class ReservationSettings;
}

/**
 * @class HospitalityApp
 * @brief Хост ядра доступности и складского учёта
 *
 * Template Method:
 * 1. loadEnvironment() - чтение настроек из ENV
 * 2. configureInjection() - сборка графа объектов через Boost.DI
 * 3. start() - запуск фонового sweeper
 * 4. wait() - ожидание сигнала остановки
 * 5. shutdown() - остановка sweeper
 *
 * Хранилище выбирается по HOSPITALITY_STORAGE: postgres | memory.
 */
class HospitalityApp
{
public:
    HospitalityApp();
    ~HospitalityApp();

    /**
     * @brief Полный жизненный цикл, возвращается после stop()
     */
    void run(int argc, char* argv[]);

    /**
     * @brief Запросить остановку (безопасно из обработчика сигнала)
     */
    void stop();

    std::shared_ptr<hospitality::ports::input::IAvailabilityService> availability() const { return availability_; }
    std::shared_ptr<hospitality::ports::input::IInventoryLedgerService> inventory() const { return inventory_; }
    std::shared_ptr<hospitality::ports::input::IOrderLifecycleService> orders() const { return orders_; }

protected:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    void start();
    void wait();
    void shutdown();

private:
    /**
     * @brief Собрать сервисы поверх конкретных реализаций хранилищ
     */
    template <typename ReservationRepository, typename InventoryRepository, typename OrderRepository>
    void wire();

    void printStartupBanner();

    std::shared_ptr<hospitality::settings::StorageSettings> storageSettings_;
    std::shared_ptr<hospitality::settings::ReservationSettings> reservationSettings_;

    std::shared_ptr<hospitality::ports::input::IAvailabilityService> availability_;
    std::shared_ptr<hospitality::ports::input::IInventoryLedgerService> inventory_;
    std::shared_ptr<hospitality::ports::input::IOrderLifecycleService> orders_;
    std::shared_ptr<hospitality::adapters::primary::HoldExpirySweeper> sweeper_;

    std::atomic<bool> stopRequested_{false};
};
