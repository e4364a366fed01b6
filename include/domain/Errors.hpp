#pragma once

#include <stdexcept>
#include <string>

namespace inventory::domain {

/**
 * @brief Базовое исключение движка учёта запасов
 */
class InventoryException : public std::runtime_error {
public:
    explicit InventoryException(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * @brief Код ошибки для логов и внешних адаптеров
     */
    virtual const char* code() const { return "INVENTORY_ERROR"; }
};

/**
 * @brief Некорректные входные данные
 */
class ValidationError : public InventoryException {
public:
    explicit ValidationError(const std::string& message) : InventoryException(message) {}
    const char* code() const override { return "VALIDATION_ERROR"; }
};

class NotFoundError : public InventoryException {
public:
    explicit NotFoundError(const std::string& message) : InventoryException(message) {}
    const char* code() const override { return "NOT_FOUND"; }
};

/**
 * @brief Нарушение уникального ключа (например, номер партии под другим источником)
 */
class ConflictError : public InventoryException {
public:
    explicit ConflictError(const std::string& message) : InventoryException(message) {}
    const char* code() const override { return "CONFLICT"; }
};

/**
 * @brief Операция увела бы остаток (on-hand или партии) в минус
 */
class InsufficientStockError : public InventoryException {
public:
    explicit InsufficientStockError(const std::string& message) : InventoryException(message) {}
    const char* code() const override { return "INSUFFICIENT_STOCK"; }
};

/**
 * @brief Проводка в закрытом (LOCKED) финансовом периоде
 *
 * Никогда не перехватывается сервисами: откатывает всю транзакцию.
 */
class PeriodLockedError : public InventoryException {
public:
    explicit PeriodLockedError(const std::string& message) : InventoryException(message) {}
    const char* code() const override { return "PERIOD_LOCKED"; }
};

/**
 * @brief Не настроен маппинг счетов GL
 */
class UnconfiguredError : public InventoryException {
public:
    explicit UnconfiguredError(const std::string& message) : InventoryException(message) {}
    const char* code() const override { return "UNCONFIGURED"; }
};

/**
 * @brief Нарушен инвариант (несбалансированная проводка, границы партии)
 */
class InvariantViolationError : public InventoryException {
public:
    explicit InvariantViolationError(const std::string& message) : InventoryException(message) {}
    const char* code() const override { return "INVARIANT_VIOLATION"; }
};

} // namespace inventory::domain
