#pragma once

#include "ports/output/IAuditSink.hpp"
#include <iostream>
#include <mutex>

namespace inventory::adapters::secondary {

/**
 * @brief Аудит в stdout: одна JSON-строка на событие
 */
class LoggingAuditSink : public ports::output::IAuditSink {
public:
    LoggingAuditSink() {
        std::cout << "[LoggingAuditSink] Created" << std::endl;
    }

    void record(const domain::AuditEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[Audit] " << event.toJson() << std::endl;
    }

private:
    std::mutex mutex_;
};

} // namespace inventory::adapters::secondary
