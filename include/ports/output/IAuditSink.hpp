#pragma once

#include "domain/AuditEvent.hpp"

namespace inventory::ports::output {

/**
 * @brief Приёмник событий аудита
 *
 * Вызывается после коммита. Ошибки приёмника не влияют на операцию.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;
    virtual void record(const domain::AuditEvent& event) = 0;
};

} // namespace inventory::ports::output
