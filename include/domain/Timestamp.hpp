#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Временная метка (UTC, точность до микросекунд)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разбор ISO 8601: "2024-03-01" или "2024-03-01T10:15:00"
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        if (str.size() <= 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        }
        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
        return Timestamp(tp);
    }

    static Timestamp fromEpochMicros(int64_t micros) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::microseconds(micros))));
    }

    int64_t toEpochMicros() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            value.time_since_epoch()).count();
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    std::string toDateString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d");
        return ss.str();
    }

    Timestamp plusDays(int days) const {
        return Timestamp(value + std::chrono::hours(24 * days));
    }

    Timestamp plusMicros(int64_t micros) const {
        return Timestamp(value + std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(micros)));
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
};

} // namespace inventory::domain
