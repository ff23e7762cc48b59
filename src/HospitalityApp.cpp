#include "HospitalityApp.hpp"

// Primary Adapters
#include "adapters/primary/HoldExpirySweeper.hpp"

// Application Services
#include "application/AvailabilityService.hpp"
#include "application/InventoryLedgerService.hpp"
#include "application/OrderLifecycleService.hpp"

// Secondary Adapters
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/persistence/InMemoryReservationRepository.hpp"
#include "adapters/secondary/persistence/InMemoryInventoryRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "adapters/secondary/persistence/PostgresReservationRepository.hpp"
#include "adapters/secondary/persistence/PostgresInventoryRepository.hpp"
#include "adapters/secondary/persistence/PostgresOrderRepository.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/OrderSettings.hpp"
#include "settings/ReservationSettings.hpp"
#include "settings/StorageSettings.hpp"

#include <boost/di.hpp>
#include <chrono>
#include <iostream>
#include <thread>

namespace di = boost::di;

using namespace hospitality;

// ============================================================================
// HospitalityApp Implementation
// ============================================================================

HospitalityApp::HospitalityApp()
{
    std::cout << "[HospitalityApp] Application created" << std::endl;
}

HospitalityApp::~HospitalityApp()
{
    shutdown();
    std::cout << "[HospitalityApp] Application destroyed" << std::endl;
}

void HospitalityApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    start();
    wait();
    shutdown();
}

void HospitalityApp::stop()
{
    stopRequested_ = true;
}

void HospitalityApp::loadEnvironment(int /*argc*/, char* /*argv*/[])
{
    std::cout << "[HospitalityApp] Loading environment..." << std::endl;

    storageSettings_ = std::make_shared<settings::StorageSettings>();
    reservationSettings_ = std::make_shared<settings::ReservationSettings>();

    std::cout << "[HospitalityApp] Environment loaded successfully" << std::endl;
}

void HospitalityApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[HospitalityApp] Configuring Boost.DI injection..." << std::endl;

    if (storageSettings_->isInMemory()) {
        wire<adapters::secondary::InMemoryReservationRepository,
             adapters::secondary::InMemoryInventoryRepository,
             adapters::secondary::InMemoryOrderRepository>();
    } else {
        wire<adapters::secondary::PostgresReservationRepository,
             adapters::secondary::PostgresInventoryRepository,
             adapters::secondary::PostgresOrderRepository>();
    }

    std::cout << "[HospitalityApp] Injection configured" << std::endl;
}

template <typename ReservationRepository, typename InventoryRepository, typename OrderRepository>
void HospitalityApp::wire()
{
    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings
        // ====================================================================

        di::bind<settings::ReservationSettings>().to(reservationSettings_),

        di::bind<settings::DbSettings>().in(di::singleton),

        di::bind<settings::OrderSettings>().in(di::singleton),

        // ====================================================================
        // Layer 2: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<ports::output::IClock>()
            .to<adapters::secondary::SystemClock>()
            .in(di::singleton),

        di::bind<ports::output::IReservationRepository>()
            .template to<ReservationRepository>()
            .in(di::singleton),

        di::bind<ports::output::IInventoryRepository>()
            .template to<InventoryRepository>()
            .in(di::singleton),

        di::bind<ports::output::IOrderRepository>()
            .template to<OrderRepository>()
            .in(di::singleton),

        // ====================================================================
        // Layer 3: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ports::input::IAvailabilityService>()
            .to<application::AvailabilityService>()
            .in(di::singleton),

        di::bind<ports::input::IInventoryLedgerService>()
            .to<application::InventoryLedgerService>()
            .in(di::singleton),

        di::bind<ports::input::IOrderLifecycleService>()
            .to<application::OrderLifecycleService>()
            .in(di::singleton));

    availability_ = injector.template create<std::shared_ptr<ports::input::IAvailabilityService>>();
    inventory_ = injector.template create<std::shared_ptr<ports::input::IInventoryLedgerService>>();
    orders_ = injector.template create<std::shared_ptr<ports::input::IOrderLifecycleService>>();

    // Layer 4: Primary Adapters
    sweeper_ = injector.template create<std::shared_ptr<adapters::primary::HoldExpirySweeper>>();
}

void HospitalityApp::start()
{
    if (reservationSettings_->isSweeperEnabled()) {
        sweeper_->start();
    } else {
        std::cout << "[HospitalityApp] Hold expiry sweeper disabled" << std::endl;
    }
    std::cout << "[HospitalityApp] Started" << std::endl;
}

void HospitalityApp::wait()
{
    while (!stopRequested_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

void HospitalityApp::shutdown()
{
    if (sweeper_) {
        sweeper_->stop();
    }
}

void HospitalityApp::printStartupBanner()
{
    std::cout << "  Storage:      " << (storageSettings_->isInMemory() ? "memory" : "postgres") << std::endl;
    std::cout << "  Hold window:  " << reservationSettings_->getHoldWindow().count() << " min" << std::endl;
    std::cout << "  Sweep every:  " << reservationSettings_->getSweepInterval().count() << " s" << std::endl;
}
