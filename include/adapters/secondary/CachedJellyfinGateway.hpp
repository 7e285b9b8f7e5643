#pragma once

#include "ports/output/IJellyfinGateway.hpp"
#include "settings/ICacheSettings.hpp"
#include "settings/IJellyfinSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <chrono>
#include <memory>
#include <iostream>

namespace jellyvr::adapters::secondary {

/**
 * @brief Декоратор IJellyfinGateway с кэшем метаданных
 *
 * Два кэша с общим TTL, ключи включают userId:
 * - pageCache_: userId|startIndex|limit -> LibraryPage
 * - itemCache_: userId|itemId -> MediaItem (прогревается страницами)
 *
 * НЕ кэширует:
 * - QuickConnect
 * - PlaybackInfo и отчёты о воспроизведении
 * - ошибки и отсутствующие элементы
 *
 * TTL 0 отключает кэш, все вызовы уходят в delegate.
 */
class CachedJellyfinGateway : public ports::output::IJellyfinGateway {
public:
    CachedJellyfinGateway(
        std::shared_ptr<ports::output::IJellyfinGateway> delegate,
        std::shared_ptr<settings::ICacheSettings> cacheSettings,
        std::shared_ptr<settings::IJellyfinSettings> jellyfinSettings
    ) : delegate_(std::move(delegate))
      , cacheSettings_(std::move(cacheSettings))
      , jellyfinSettings_(std::move(jellyfinSettings))
    {
        initCaches();
    }

    // ============================================
    // QUICKCONNECT (без кэширования)
    // ============================================

    ports::output::QuickConnectTicket quickConnectInitiate() override {
        return delegate_->quickConnectInitiate();
    }

    ports::output::QuickConnectPollResult quickConnectPoll(const std::string& secret) override {
        return delegate_->quickConnectPoll(secret);
    }

    // ============================================
    // БИБЛИОТЕКА
    // ============================================

    ports::output::LibraryCursor listLibrary(const domain::JellyfinCredentials& credentials) override {
        // Страницы идут через fetchLibraryPage этого декоратора
        return ports::output::LibraryCursor(
            [this, credentials](int startIndex, int limit) {
                return fetchLibraryPage(credentials, startIndex, limit);
            },
            jellyfinSettings_->getPageSize());
    }

    ports::output::LibraryPage fetchLibraryPage(
        const domain::JellyfinCredentials& credentials,
        int startIndex,
        int limit
    ) override {
        if (!enabled()) {
            return delegate_->fetchLibraryPage(credentials, startIndex, limit);
        }

        const std::string key = pageKey(credentials.userId, startIndex, limit);
        auto cached = pageCache_->get(key);
        if (cached) {
            return *cached;
        }

        auto page = delegate_->fetchLibraryPage(credentials, startIndex, limit);
        pageCache_->put(key, page);

        // Прогреваем кэш карточек
        for (const auto& item : page.items) {
            itemCache_->put(itemKey(credentials.userId, item.id), item);
        }

        return page;
    }

    std::optional<domain::MediaItem> getItem(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId
    ) override {
        if (!enabled()) {
            return delegate_->getItem(credentials, itemId);
        }

        const std::string key = itemKey(credentials.userId, itemId);
        auto cached = itemCache_->get(key);
        if (cached) {
            return *cached;
        }

        auto item = delegate_->getItem(credentials, itemId);
        if (item) {
            itemCache_->put(key, *item);
        }
        return item;
    }

    // ============================================
    // ВОСПРОИЗВЕДЕНИЕ (без кэширования)
    // ============================================

    domain::PlaybackInfo getPlaybackInfo(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId
    ) override {
        return delegate_->getPlaybackInfo(credentials, itemId);
    }

    void reportPlaybackStart(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId,
        const std::string& playSessionId,
        const std::string& mediaSourceId
    ) override {
        delegate_->reportPlaybackStart(credentials, itemId, playSessionId, mediaSourceId);
    }

    void reportProgress(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId,
        int64_t positionTicks,
        domain::PlaybackEventKind kind,
        const std::string& playSessionId
    ) override {
        delegate_->reportProgress(credentials, itemId, positionTicks, kind, playSessionId);
    }

    std::string rewriteMediaUrl(const std::string& url) const override {
        return delegate_->rewriteMediaUrl(url);
    }

    std::string baseUrl() const override {
        return delegate_->baseUrl();
    }

    // ============================================
    // УПРАВЛЕНИЕ КЭШЕМ
    // ============================================

    void clearAllCaches() {
        if (enabled()) {
            pageCache_->clear();
            itemCache_->clear();
        }
    }

    size_t getPageCacheSize() const {
        return enabled() ? pageCache_->size() : 0;
    }

    size_t getItemCacheSize() const {
        return enabled() ? itemCache_->size() : 0;
    }

private:
    bool enabled() const {
        return pageCache_ != nullptr;
    }

    static std::string pageKey(const std::string& userId, int startIndex, int limit) {
        return userId + "|" + std::to_string(startIndex) + "|" + std::to_string(limit);
    }

    static std::string itemKey(const std::string& userId, const std::string& itemId) {
        return userId + "|" + itemId;
    }

    void initCaches() {
        int ttlSeconds = cacheSettings_->getTtlSeconds();
        size_t pageCacheSize = cacheSettings_->getPageCacheSize();
        size_t itemCacheSize = cacheSettings_->getItemCacheSize();

        if (ttlSeconds <= 0) {
            std::cout << "[CachedJellyfinGateway] Created without cache" << std::endl;
            return;
        }

        auto pageBase = std::make_unique<Cache<std::string, ports::output::LibraryPage>>(
            pageCacheSize,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(ttlSeconds))
        );
        pageCache_ = std::make_unique<ThreadSafeCache<std::string, ports::output::LibraryPage>>(
            std::move(pageBase)
        );

        auto itemBase = std::make_unique<Cache<std::string, domain::MediaItem>>(
            itemCacheSize,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(ttlSeconds))
        );
        itemCache_ = std::make_unique<ThreadSafeCache<std::string, domain::MediaItem>>(
            std::move(itemBase)
        );

        std::cout << "[CachedJellyfinGateway] Created with:"
                  << " pageCache=" << pageCacheSize
                  << " itemCache=" << itemCacheSize
                  << " ttl=" << ttlSeconds << "s" << std::endl;
    }

    std::shared_ptr<ports::output::IJellyfinGateway> delegate_;
    std::shared_ptr<settings::ICacheSettings> cacheSettings_;
    std::shared_ptr<settings::IJellyfinSettings> jellyfinSettings_;
    std::unique_ptr<ICache<std::string, ports::output::LibraryPage>> pageCache_;
    std::unique_ptr<ICache<std::string, domain::MediaItem>> itemCache_;
};

} // namespace jellyvr::adapters::secondary
