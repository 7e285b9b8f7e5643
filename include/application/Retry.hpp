#pragma once

#include "domain/Errors.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace jellyvr::application {

/**
 * @brief Ограниченный повтор вызова Jellyfin
 *
 * Повторяется только UpstreamUnavailableError, остальные исключения
 * пробрасываются сразу. Задержка растёт линейно: backoff, 2*backoff, ...
 *
 * @param attempts Общее число попыток (минимум 1)
 */
template <typename Fn>
auto withUpstreamRetry(const std::string& operation, int attempts,
                       std::chrono::milliseconds backoff, Fn&& fn) -> decltype(fn()) {
    if (attempts < 1) {
        attempts = 1;
    }

    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const domain::UpstreamUnavailableError& e) {
            if (attempt >= attempts) {
                std::cerr << "[Retry] " << operation << " failed after "
                          << attempt << " attempts: " << e.what() << std::endl;
                throw;
            }
            std::cerr << "[Retry] " << operation << " attempt " << attempt
                      << " failed, retrying" << std::endl;
            if (backoff.count() > 0) {
                std::this_thread::sleep_for(backoff * attempt);
            }
        }
    }
}

} // namespace jellyvr::application
