#pragma once

#include "settings/IGatewaySettings.hpp"
#include <cstdlib>
#include <string>

namespace jellyvr::settings {

class GatewaySettings : public IGatewaySettings {
public:
    GatewaySettings() {
        if (const char* value = std::getenv("JELLYVR_QUICKCONNECT_WINDOW_SECONDS")) {
            quickConnectWindowSeconds_ = std::stoi(value);
        }
        if (const char* value = std::getenv("JELLYVR_PASSWORD_LENGTH")) {
            passwordLength_ = std::stoi(value);
        }
        if (const char* value = std::getenv("JELLYVR_UPSTREAM_RETRY_ATTEMPTS")) {
            upstreamRetryAttempts_ = std::stoi(value);
        }
        if (const char* value = std::getenv("JELLYVR_UPSTREAM_RETRY_BACKOFF_MS")) {
            upstreamRetryBackoffMs_ = std::stoi(value);
        }
        if (const char* value = std::getenv("JELLYVR_SUBTITLES_LANGUAGE")) {
            subtitlesLanguage_ = value;
        }
        if (const char* value = std::getenv("JELLYVR_WATCHED_PERCENT")) {
            watchedPercent_ = std::stoi(value);
        }
        if (const char* value = std::getenv("JELLYVR_STORE_CAS_ATTEMPTS")) {
            storeCasAttempts_ = std::stoi(value);
        }
    }

    int getQuickConnectWindowSeconds() const override { return quickConnectWindowSeconds_; }
    int getPasswordLength() const override { return passwordLength_; }
    int getUpstreamRetryAttempts() const override { return upstreamRetryAttempts_; }
    int getUpstreamRetryBackoffMs() const override { return upstreamRetryBackoffMs_; }
    std::string getSubtitlesLanguage() const override { return subtitlesLanguage_; }
    int getWatchedPercent() const override { return watchedPercent_; }
    int getStoreCasAttempts() const override { return storeCasAttempts_; }

private:
    int quickConnectWindowSeconds_ = 600;
    int passwordLength_ = 6;
    int upstreamRetryAttempts_ = 3;
    int upstreamRetryBackoffMs_ = 250;
    std::string subtitlesLanguage_;
    int watchedPercent_ = 90;
    int storeCasAttempts_ = 8;
};

} // namespace jellyvr::settings
