#pragma once

#include "ports/output/IAuditSink.hpp"
#include "ports/output/IInventoryStore.hpp"
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Отправить событие аудита после коммита транзакции
 *
 * Ошибка приёмника только логируется.
 */
inline void auditAfterCommit(
    ports::output::IStoreSession& session,
    std::shared_ptr<ports::output::IAuditSink> sink,
    domain::AuditEvent event)
{
    if (!sink) return;
    session.onCommit([sink = std::move(sink), event = std::move(event)]() {
        try {
            sink->record(event);
        } catch (const std::exception& e) {
            std::cerr << "[Audit] Failed to record " << event.action << " for "
                      << event.resourceId << ": " << e.what() << std::endl;
        }
    });
}

} // namespace inventory::application
