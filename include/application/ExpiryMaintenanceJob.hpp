#pragma once

#include "ports/input/ILotService.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace inventory::application {

/**
 * @brief Фоновая пометка просроченных партий
 *
 * run() выполняет проход по организациям и ждёт interval до следующего.
 * stop() выставляет флаг под mutex_ и будит ожидание, поэтому сигнал
 * остановки не теряется между проверкой флага и wait_for.
 */
class ExpiryMaintenanceJob {
public:
    ExpiryMaintenanceJob(
        std::shared_ptr<ports::input::ILotService> lots,
        std::vector<std::string> orgIds,
        std::chrono::seconds interval
    ) : lots_(std::move(lots))
      , orgIds_(std::move(orgIds))
      , interval_(interval)
    {}

    /**
     * @brief Цикл обслуживания; при once = true ровно один проход
     */
    void run(bool once) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopRequested_) {
            lock.unlock();
            runPass();
            lock.lock();

            if (once) break;
            cv_.wait_for(lock, interval_, [this] { return stopRequested_; });
        }
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopRequested_ = true;
        }
        cv_.notify_all();
    }

    size_t completedPasses() const { return completedPasses_.load(); }

private:
    std::shared_ptr<ports::input::ILotService> lots_;
    std::vector<std::string> orgIds_;
    std::chrono::seconds interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopRequested_ = false;
    std::atomic<size_t> completedPasses_{0};

    void runPass() {
        for (const auto& orgId : orgIds_) {
            try {
                size_t updated = lots_->updateExpiredLots(orgId);
                std::cout << "[ExpiryMaintenance] " << orgId << ": " << updated
                          << " lot(s) marked EXPIRED" << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[ExpiryMaintenance] Pass failed for " << orgId << ": " << e.what() << std::endl;
            }
        }
        ++completedPasses_;
    }
};

} // namespace inventory::application
