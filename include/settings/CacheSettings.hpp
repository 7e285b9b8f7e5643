#pragma once

#include "settings/ICacheSettings.hpp"
#include <cstdlib>
#include <string>

namespace jellyvr::settings {

/**
 * @brief Настройки кэширования метаданных Jellyfin
 *
 * Читает из ENV:
 * - JELLYVR_CACHE_TTL_SECONDS (default: 120, 0 - без кэша)
 * - JELLYVR_CACHE_PAGE_SIZE (default: 256)
 * - JELLYVR_CACHE_ITEM_SIZE (default: 5000)
 */
class CacheSettings : public ICacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("JELLYVR_CACHE_TTL_SECONDS")) {
            ttlSeconds_ = std::stoi(val);
        }
        if (const char* val = std::getenv("JELLYVR_CACHE_PAGE_SIZE")) {
            pageCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("JELLYVR_CACHE_ITEM_SIZE")) {
            itemCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
    }

    int getTtlSeconds() const override { return ttlSeconds_; }
    size_t getPageCacheSize() const override { return pageCacheSize_; }
    size_t getItemCacheSize() const override { return itemCacheSize_; }

private:
    int ttlSeconds_ = 120;
    size_t pageCacheSize_ = 256;
    size_t itemCacheSize_ = 5000;
};

} // namespace jellyvr::settings
