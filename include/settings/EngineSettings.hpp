#pragma once

#include "domain/Decimal.hpp"
#include "domain/Reconciliation.hpp"
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace inventory::settings {

/**
 * @brief Параметры движка учёта
 *
 * - INVENTORY_EXPIRY_WARNING_DAYS: горизонт getExpiringSoon() по умолчанию
 * - INVENTORY_RECON_TOLERANCE_ABS / _REL: допуск сверки склада и GL
 * - INVENTORY_MAINTENANCE_INTERVAL_SEC: период фоновой пометки просроченных партий
 * - INVENTORY_MAINTENANCE_ORGS: организации через запятую
 */
class EngineSettings {
public:
    EngineSettings() {
        expiryWarningDays_ = std::stoi(getEnvOrDefault("INVENTORY_EXPIRY_WARNING_DAYS", "7"));
        tolerance_.absolute = domain::Decimal::parse(getEnvOrDefault("INVENTORY_RECON_TOLERANCE_ABS", "0.01"));
        tolerance_.relative = domain::Decimal::parse(getEnvOrDefault("INVENTORY_RECON_TOLERANCE_REL", "0"));
        maintenanceIntervalSec_ = std::stoi(getEnvOrDefault("INVENTORY_MAINTENANCE_INTERVAL_SEC", "300"));
        maintenanceOrgs_ = split(getEnvOrDefault("INVENTORY_MAINTENANCE_ORGS", ""));
    }

    int getExpiryWarningDays() const { return expiryWarningDays_; }
    const domain::TolerancePolicy& getTolerancePolicy() const { return tolerance_; }
    int getMaintenanceIntervalSec() const { return maintenanceIntervalSec_; }
    const std::vector<std::string>& getMaintenanceOrgs() const { return maintenanceOrgs_; }

    // Для тестов
    void setTolerancePolicy(const domain::TolerancePolicy& policy) { tolerance_ = policy; }

private:
    int expiryWarningDays_;
    domain::TolerancePolicy tolerance_;
    int maintenanceIntervalSec_;
    std::vector<std::string> maintenanceOrgs_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }

    static std::vector<std::string> split(const std::string& csv) {
        std::vector<std::string> result;
        std::istringstream ss(csv);
        std::string token;
        while (std::getline(ss, token, ',')) {
            if (!token.empty()) {
                result.push_back(token);
            }
        }
        return result;
    }
};

} // namespace inventory::settings
