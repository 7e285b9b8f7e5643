#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace jellyvr::utils {

/**
 * @brief Генератор идентификаторов сессий
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string uuid() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << ((high >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((high >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((high & 0x0FFF) | 0x4000) << "-";
        ss << std::setw(4) << (((low >> 48) & 0x3FFF) | 0x8000) << "-";
        ss << std::setw(12) << (low & 0xFFFFFFFFFFFF);
        return ss.str();
    }

    /**
     * @brief ID сессии: "sess-" + UUID
     */
    static std::string sessionId() {
        return "sess-" + uuid();
    }
};

} // namespace jellyvr::utils
