#pragma once

#include <string>
#include <stdexcept>

namespace jellyvr::domain {

/**
 * @brief Статус запроса QuickConnect
 *
 * Переходы только Pending → Authorized или Pending → Expired.
 */
enum class QuickConnectStatus {
    PENDING,
    AUTHORIZED,
    EXPIRED
};

inline std::string toString(QuickConnectStatus status) {
    switch (status) {
        case QuickConnectStatus::PENDING: return "PENDING";
        case QuickConnectStatus::AUTHORIZED: return "AUTHORIZED";
        case QuickConnectStatus::EXPIRED: return "EXPIRED";
    }
    return "UNKNOWN";
}

inline QuickConnectStatus parseQuickConnectStatus(const std::string& str) {
    if (str == "PENDING") return QuickConnectStatus::PENDING;
    if (str == "AUTHORIZED") return QuickConnectStatus::AUTHORIZED;
    if (str == "EXPIRED") return QuickConnectStatus::EXPIRED;
    throw std::invalid_argument("Unknown QuickConnect status: " + str);
}

inline bool isTerminal(QuickConnectStatus status) {
    return status != QuickConnectStatus::PENDING;
}

} // namespace jellyvr::domain
