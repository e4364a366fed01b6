// include/InventoryApp.hpp
#pragma once

#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/EngineSettings.hpp"

// Ports
#include "ports/input/ICostingService.hpp"
#include "ports/input/IGlPostingService.hpp"
#include "ports/input/IInventoryMovementService.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/input/ILotService.hpp"
#include "ports/input/IReconciliationService.hpp"
#include "ports/output/IAuditSink.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IRecipeProvider.hpp"

// Application
#include "application/CostingService.hpp"
#include "application/ExpiryMaintenanceJob.hpp"
#include "application/GlPostingService.hpp"
#include "application/InventoryMovementService.hpp"
#include "application/LedgerService.hpp"
#include "application/LotService.hpp"
#include "application/PostingMappingResolver.hpp"
#include "application/ReconciliationService.hpp"

// Secondary Adapters
#include "adapters/secondary/LoggingAuditSink.hpp"
#include "adapters/secondary/PostgresInventoryStore.hpp"
#include "adapters/secondary/PostgresRecipeProvider.hpp"
#include "adapters/secondary/SystemClock.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>

namespace di = boost::di;

namespace inventory
{

    /**
     * @brief Inventory Engine Application
     *
     * Собирает сервисы учёта через Boost.DI и запускает ExpiryMaintenanceJob:
     * раз в INVENTORY_MAINTENANCE_INTERVAL_SEC помечает просроченные партии
     * организаций из INVENTORY_MAINTENANCE_ORGS. stop() может прийти раньше,
     * чем задача создана; тогда run() не сделает ни одного прохода.
     */
    class InventoryApp
    {
    public:
        InventoryApp() { std::cout << "[InventoryApp] Initializing..." << std::endl; }
        ~InventoryApp() { std::cout << "[InventoryApp] Shutting down..." << std::endl; }

        /**
         * @brief Template Method: loadEnvironment -> configureInjection -> start
         */
        void run(int argc, char *argv[])
        {
            loadEnvironment(argc, argv);
            configureInjection();
            start();
        }

        /**
         * @brief Останавливает цикл обслуживания; безопасно из другого потока
         */
        void stop()
        {
            std::shared_ptr<application::ExpiryMaintenanceJob> job;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stopRequested_ = true;
                job = maintenance_;
            }
            if (job)
            {
                job->stop();
            }
        }

        std::shared_ptr<ports::input::IInventoryMovementService> movements() const { return movements_; }
        std::shared_ptr<ports::input::IReconciliationService> reconciliation() const { return reconciliation_; }

    protected:
        void loadEnvironment(int argc, char *argv[])
        {
            for (int i = 1; i < argc; ++i)
            {
                if (std::string(argv[i]) == "--once")
                {
                    once_ = true;
                }
            }
            std::cout << "[InventoryApp] Environment loaded" << (once_ ? " (single maintenance pass)" : "")
                      << std::endl;
        }

        void configureInjection()
        {
            std::cout << "[InventoryApp] Configuring DI..." << std::endl;

            auto injector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::EngineSettings>().in(di::singleton),

                di::bind<ports::output::IInventoryStore>()
                    .to<adapters::secondary::PostgresInventoryStore>()
                    .in(di::singleton),
                di::bind<ports::output::IRecipeProvider>()
                    .to<adapters::secondary::PostgresRecipeProvider>()
                    .in(di::singleton),
                di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),
                di::bind<ports::output::IAuditSink>().to<adapters::secondary::LoggingAuditSink>().in(di::singleton),

                di::bind<application::PostingMappingResolver>().in(di::singleton),
                di::bind<application::LedgerService>().in(di::singleton),
                di::bind<application::LotService>().in(di::singleton),
                di::bind<application::CostingService>().in(di::singleton),
                di::bind<application::GlPostingService>().in(di::singleton),

                di::bind<ports::input::ILedgerService>().to<application::LedgerService>().in(di::singleton),
                di::bind<ports::input::ILotService>().to<application::LotService>().in(di::singleton),
                di::bind<ports::input::ICostingService>().to<application::CostingService>().in(di::singleton),
                di::bind<ports::input::IGlPostingService>().to<application::GlPostingService>().in(di::singleton),
                di::bind<ports::input::IInventoryMovementService>()
                    .to<application::InventoryMovementService>()
                    .in(di::singleton),
                di::bind<ports::input::IReconciliationService>()
                    .to<application::ReconciliationService>()
                    .in(di::singleton));

            auto engineSettings = injector.create<std::shared_ptr<settings::EngineSettings>>();
            auto lots = injector.create<std::shared_ptr<ports::input::ILotService>>();
            auto job = std::make_shared<application::ExpiryMaintenanceJob>(
                lots, engineSettings->getMaintenanceOrgs(),
                std::chrono::seconds(engineSettings->getMaintenanceIntervalSec()));
            {
                std::lock_guard<std::mutex> lock(mutex_);
                maintenance_ = job;
                if (stopRequested_)
                {
                    job->stop();
                }
            }
            movements_ = injector.create<std::shared_ptr<ports::input::IInventoryMovementService>>();
            reconciliation_ = injector.create<std::shared_ptr<ports::input::IReconciliationService>>();

            std::cout << "[InventoryApp] Ready" << std::endl;
        }

        void start()
        {
            std::cout << "[InventoryApp] Expiry maintenance started" << std::endl;
            maintenance_->run(once_);
            std::cout << "[InventoryApp] Expiry maintenance finished after "
                      << maintenance_->completedPasses() << " pass(es)" << std::endl;
        }

    private:
        std::shared_ptr<ports::input::IInventoryMovementService> movements_;
        std::shared_ptr<ports::input::IReconciliationService> reconciliation_;
        std::shared_ptr<application::ExpiryMaintenanceJob> maintenance_;
        bool once_ = false;
        bool stopRequested_ = false;
        std::mutex mutex_;
    };

} // namespace inventory
