#pragma once

#include <cstddef>

namespace jellyvr::settings {

/**
 * @brief Параметры кэша метаданных Jellyfin
 */
class ICacheSettings {
public:
    virtual ~ICacheSettings() = default;

    /// Время жизни записи; 0 отключает кэш
    virtual int getTtlSeconds() const = 0;
    /// Страниц библиотеки (по всем пользователям)
    virtual size_t getPageCacheSize() const = 0;
    /// Карточек элементов (по всем пользователям)
    virtual size_t getItemCacheSize() const = 0;
};

} // namespace jellyvr::settings
