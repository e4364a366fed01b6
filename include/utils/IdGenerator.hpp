#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace inventory::utils {

/**
 * @brief Генератор идентификаторов строк (UUID v4)
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    static std::string uuid() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t part1 = dist(gen);
        uint64_t part2 = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << ((part1 >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((part1 >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((part1 & 0x0FFF) | 0x4000) << "-";
        ss << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000) << "-";
        ss << std::setw(12) << (part2 & 0xFFFFFFFFFFFF);
        return ss.str();
    }

    /**
     * @brief Номер партии по умолчанию: "LOT-20240301-1a2b3c4d"
     */
    static std::string lotNumber(const std::string& datePart) {
        thread_local std::random_device rd;
        thread_local std::mt19937 gen(rd());
        std::uniform_int_distribution<uint32_t> dist;

        std::ostringstream ss;
        ss << "LOT-" << datePart << "-" << std::hex << std::setfill('0') << std::setw(8) << dist(gen);
        return ss.str();
    }
};

} // namespace inventory::utils
