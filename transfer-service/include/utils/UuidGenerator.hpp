#pragma once

#include <cstdint>
#include <string>
#include <random>
#include <sstream>
#include <iomanip>

namespace transfer::utils {

/**
 * @brief Идентификаторы счетов, переводов, заявок и записей аудита (UUID v4)
 *
 * @note thread_local генератор, вызывать можно из любого потока сервера
 */
class UuidGenerator {
public:
    static std::string generate() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0')
           << std::setw(8) << ((high >> 32) & 0xFFFFFFFF) << "-"
           << std::setw(4) << ((high >> 16) & 0xFFFF) << "-"
           << std::setw(4) << ((high & 0x0FFF) | 0x4000) << "-"
           << std::setw(4) << (((low >> 48) & 0x3FFF) | 0x8000) << "-"
           << std::setw(12) << (low & 0xFFFFFFFFFFFF);
        return ss.str();
    }
};

} // namespace transfer::utils
