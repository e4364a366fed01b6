#include "InventoryApp.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <pthread.h>
#include <thread>

namespace {

/**
 * @brief Поток, ждущий SIGINT/SIGTERM через sigwait
 *
 * Сигналы заблокированы во всех потоках, поэтому app.stop() вызывается
 * из обычного потока, а не из обработчика сигнала.
 */
class ShutdownWatcher {
public:
    explicit ShutdownWatcher(inventory::InventoryApp& app) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

        thread_ = std::thread([this, &app] {
            int received = 0;
            if (sigwait(&signals_, &received) != 0) {
                return;
            }
            if (!released_) {
                std::cout << "\n[main] Signal " << received << ": stopping expiry maintenance..." << std::endl;
                app.stop();
            }
        });
    }

    ~ShutdownWatcher() {
        released_ = true;
        pthread_kill(thread_.native_handle(), SIGTERM);
        thread_.join();
    }

private:
    sigset_t signals_;
    std::atomic<bool> released_{false};
    std::thread thread_;
};

} // namespace

int main(int argc, char* argv[]) {
    try {
        inventory::InventoryApp app;
        ShutdownWatcher watcher(app);

        std::cout << "========================================" << std::endl;
        std::cout << "  Inventory Movement & Valuation Engine" << std::endl;
        std::cout << "  Expiry maintenance: INVENTORY_MAINTENANCE_ORGS" << std::endl;
        std::cout << "  --once for a single pass, SIGINT/SIGTERM to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        app.run(argc, argv);

        std::cout << "[main] Maintenance loop exited, closing store" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Engine failed to start or crashed: " << e.what() << std::endl;
        return 1;
    }
}
