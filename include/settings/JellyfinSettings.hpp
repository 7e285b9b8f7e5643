#pragma once

#include "settings/IJellyfinSettings.hpp"
#include <cstdlib>
#include <string>

namespace jellyvr::settings {

class JellyfinSettings : public IJellyfinSettings {
public:
    JellyfinSettings() {
        host_ = stripTrailingSlash(getEnvOrDefault("JELLYFIN_HOST", "http://localhost:8096"));
        remoteHost_ = stripTrailingSlash(getEnvOrDefault("JELLYFIN_REMOTE_HOST", ""));
        requestTimeoutMs_ = std::stoi(getEnvOrDefault("JELLYFIN_REQUEST_TIMEOUT_MS", "10000"));
        pollTimeoutMs_ = std::stoi(getEnvOrDefault("JELLYFIN_POLL_TIMEOUT_MS", "5000"));
        pageSize_ = std::stoi(getEnvOrDefault("JELLYFIN_PAGE_SIZE", "200"));
        deviceId_ = getEnvOrDefault("JELLYVR_DEVICE_ID", "jellyvr-gateway");
        maxConcurrentRequests_ = std::stoi(getEnvOrDefault("JELLYFIN_MAX_CONCURRENT_REQUESTS", "8"));
        maxQueuedRequests_ = std::stoi(getEnvOrDefault("JELLYFIN_MAX_QUEUED_REQUESTS", "32"));
    }

    std::string getHost() const override { return host_; }
    std::string getRemoteHost() const override { return remoteHost_; }
    int getRequestTimeoutMs() const override { return requestTimeoutMs_; }
    int getPollTimeoutMs() const override { return pollTimeoutMs_; }
    int getPageSize() const override { return pageSize_; }
    std::string getDeviceId() const override { return deviceId_; }
    int getMaxConcurrentRequests() const override { return maxConcurrentRequests_; }
    int getMaxQueuedRequests() const override { return maxQueuedRequests_; }

private:
    std::string host_;
    std::string remoteHost_;
    int requestTimeoutMs_;
    int pollTimeoutMs_;
    int pageSize_;
    std::string deviceId_;
    int maxConcurrentRequests_;
    int maxQueuedRequests_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }

    static std::string stripTrailingSlash(std::string url) {
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        return url;
    }
};

} // namespace jellyvr::settings
