#pragma once

#include "ports/output/IJellyfinGateway.hpp"
#include "settings/IJellyfinSettings.hpp"
#include "application/UrlRewriter.hpp"
#include "adapters/secondary/RequestExecutor.hpp"
#include "domain/Errors.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <exception>
#include <algorithm>
#include <atomic>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace jellyvr::adapters::secondary {

/**
 * @brief HTTP клиент к Jellyfin
 *
 * Реализует IJellyfinGateway поверх IHttpClient.
 * Каждый запрос ограничен по времени (JELLYFIN_REQUEST_TIMEOUT_MS,
 * для опроса QuickConnect - JELLYFIN_POLL_TIMEOUT_MS) и выполняется
 * в RequestExecutor: число потоков и очередь ограничены, при переполнении
 * запрос сразу завершается UpstreamUnavailableError. Таймаут 0 отключает
 * ограничение, запрос выполняется в вызывающем потоке.
 */
class HttpJellyfinGateway : public ports::output::IJellyfinGateway {
public:
    static constexpr const char* CLIENT_NAME = "jellyvr";
    static constexpr const char* CLIENT_VERSION = "1.0.0";
    static constexpr const char* DEVICE_NAME = "HereSphere";

    HttpJellyfinGateway(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IJellyfinSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
      , executor_(std::make_unique<RequestExecutor>(
            static_cast<size_t>(std::max(1, settings_->getMaxConcurrentRequests())),
            static_cast<size_t>(std::max(0, settings_->getMaxQueuedRequests()))))
    {
        parseBaseUrl(settings_->getHost());
        std::cout << "[HttpJellyfinGateway] Created, target: "
                  << host_ << ":" << port_ << prefix_ << std::endl;
    }

    // ============================================
    // QUICKCONNECT
    // ============================================

    ports::output::QuickConnectTicket quickConnectInitiate() override {
        auto response = execute("POST", "/QuickConnect/Initiate", "", std::nullopt,
                                settings_->getRequestTimeoutMs());
        checkStatus(response, "QuickConnect/Initiate");

        auto json = parseBody(response, "QuickConnect/Initiate");
        ports::output::QuickConnectTicket ticket;
        ticket.secret = str(json, "Secret");
        ticket.code = str(json, "Code");
        if (ticket.secret.empty() || ticket.code.empty()) {
            throw domain::UpstreamUnavailableError("QuickConnect/Initiate returned no secret");
        }
        return ticket;
    }

    ports::output::QuickConnectPollResult quickConnectPoll(const std::string& secret) override {
        auto response = execute("GET", "/QuickConnect/Connect?Secret=" + urlEncode(secret), "",
                                std::nullopt, settings_->getPollTimeoutMs());
        if (response.getStatus() == 404 || response.getStatus() == 400) {
            return ports::output::QuickConnectPollResult::expired();
        }
        checkStatus(response, "QuickConnect/Connect");

        auto json = parseBody(response, "QuickConnect/Connect");
        auto authenticated = json.find("Authenticated");
        if (authenticated == json.end() || !authenticated->is_boolean() || !authenticated->get<bool>()) {
            return ports::output::QuickConnectPollResult::pending();
        }

        return authenticateWithQuickConnect(secret);
    }

    // ============================================
    // БИБЛИОТЕКА
    // ============================================

    ports::output::LibraryCursor listLibrary(const domain::JellyfinCredentials& credentials) override {
        return ports::output::LibraryCursor(
            [this, credentials](int startIndex, int limit) {
                return fetchLibraryPage(credentials, startIndex, limit);
            },
            settings_->getPageSize());
    }

    ports::output::LibraryPage fetchLibraryPage(
        const domain::JellyfinCredentials& credentials,
        int startIndex,
        int limit
    ) override {
        std::string path = "/Users/" + urlEncode(credentials.userId) + "/Items"
            "?SortBy=SortName,ProductionYear&SortOrder=Ascending"
            "&IncludeItemTypes=Movie,Episode&Recursive=true"
            "&Fields=" + ITEM_FIELDS +
            "&ImageTypeLimit=1&EnableImageTypes=Primary,Backdrop&IsMissing=false"
            "&StartIndex=" + std::to_string(startIndex) +
            "&Limit=" + std::to_string(limit);

        auto response = execute("GET", path, "", credentials.accessToken,
                                settings_->getRequestTimeoutMs());
        checkStatus(response, "Users/Items");

        auto json = parseBody(response, "Users/Items");
        ports::output::LibraryPage page;
        page.totalRecordCount = optNum<int>(json, "TotalRecordCount").value_or(0);

        auto items = json.find("Items");
        if (items == json.end() || !items->is_array()) {
            return page;
        }

        page.rawCount = static_cast<int>(items->size());
        for (const auto& itemJson : *items) {
            auto item = parseItem(itemJson);
            if (!item) {
                std::cerr << "[HttpJellyfinGateway] Dropping malformed item in page at "
                          << startIndex << std::endl;
                continue;
            }
            page.items.push_back(std::move(*item));
        }
        return page;
    }

    std::optional<domain::MediaItem> getItem(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId
    ) override {
        std::string path = "/Users/" + urlEncode(credentials.userId) + "/Items/" + urlEncode(itemId) +
                           "?Fields=" + ITEM_FIELDS;
        auto response = execute("GET", path, "", credentials.accessToken,
                                settings_->getRequestTimeoutMs());
        if (response.getStatus() == 404 || response.getStatus() == 400) {
            return std::nullopt;
        }
        checkStatus(response, "Users/Items/{id}");

        return parseItem(parseBody(response, "Users/Items/{id}"));
    }

    // ============================================
    // ВОСПРОИЗВЕДЕНИЕ
    // ============================================

    domain::PlaybackInfo getPlaybackInfo(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId
    ) override {
        std::string path = "/Items/" + urlEncode(itemId) + "/PlaybackInfo?UserId=" +
                           urlEncode(credentials.userId);
        nlohmann::json body{{"UserId", credentials.userId}};
        auto response = execute("POST", path, body.dump(), credentials.accessToken,
                                settings_->getRequestTimeoutMs());
        checkStatus(response, "PlaybackInfo");

        auto json = parseBody(response, "PlaybackInfo");
        domain::PlaybackInfo info;
        info.playSessionId = str(json, "PlaySessionId");
        if (info.playSessionId.empty()) {
            throw domain::UpstreamUnavailableError("PlaybackInfo returned no PlaySessionId");
        }

        auto sources = json.find("MediaSources");
        if (sources != json.end() && sources->is_array() && !sources->empty()) {
            const auto& first = sources->front();
            info.mediaSourceId = str(first, "Id");
            info.transcodingUrl = str(first, "TranscodingUrl");
        }
        return info;
    }

    void reportPlaybackStart(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId,
        const std::string& playSessionId,
        const std::string& mediaSourceId
    ) override {
        nlohmann::json body{
            {"ItemId", itemId},
            {"MediaSourceId", mediaSourceId},
            {"PlaySessionId", playSessionId},
            {"PositionTicks", 0},
            {"CanSeek", true},
            {"IsPaused", true},
            {"PlayMethod", "Transcode"}
        };
        post("/Sessions/Playing", body, credentials, "Sessions/Playing");
    }

    void reportProgress(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId,
        int64_t positionTicks,
        domain::PlaybackEventKind kind,
        const std::string& playSessionId
    ) override {
        nlohmann::json body{
            {"ItemId", itemId},
            {"PositionTicks", positionTicks}
        };
        if (!playSessionId.empty()) {
            body["PlaySessionId"] = playSessionId;
        }

        switch (kind) {
            case domain::PlaybackEventKind::PROGRESS:
                body["IsPaused"] = false;
                body["CanSeek"] = true;
                post("/Sessions/Playing/Progress", body, credentials, "Sessions/Playing/Progress");
                break;

            case domain::PlaybackEventKind::STOP:
                post("/Sessions/Playing/Stopped", body, credentials, "Sessions/Playing/Stopped");
                break;

            case domain::PlaybackEventKind::WATCHED:
                post("/Sessions/Playing/Stopped", body, credentials, "Sessions/Playing/Stopped");
                post("/Users/" + urlEncode(credentials.userId) + "/PlayedItems/" + urlEncode(itemId),
                     nlohmann::json::object(), credentials, "PlayedItems");
                break;
        }
    }

    // ============================================
    // URL
    // ============================================

    std::string rewriteMediaUrl(const std::string& url) const override {
        return application::rewriteMediaUrl(url, settings_->getHost(), settings_->getRemoteHost());
    }

    std::string baseUrl() const override {
        return settings_->getHost();
    }

    static std::string urlEncode(const std::string& value) {
        std::string result;
        result.reserve(value.size());
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                result += static_cast<char>(c);
            } else {
                char buf[4];
                std::snprintf(buf, sizeof(buf), "%%%02X", c);
                result += buf;
            }
        }
        return result;
    }

private:
    static constexpr const char* ITEM_FIELDS =
        "DateCreated,MediaSources,Genres,Tags,Studios,SeriesStudio,People,Chapters,Overview";

    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IJellyfinSettings> settings_;
    std::unique_ptr<RequestExecutor> executor_;
    std::string host_;
    int port_ = 80;
    std::string prefix_;

    /**
     * @brief Общее состояние запроса, переживает вызывающего при таймауте
     */
    struct Exchange {
        Exchange(const std::string& method,
                 const std::string& path,
                 const std::string& body,
                 const std::string& host,
                 int port,
                 const std::map<std::string, std::string>& headers)
            : request(method, path, body, host, port, headers)
        {}

        SimpleRequest request;
        SimpleResponse response;
        bool sent = false;
        std::atomic<bool> abandoned{false};     ///< Вызывающий ушёл по таймауту, ещё не начатый запрос не отправляется
    };

    void parseBaseUrl(const std::string& url) {
        std::string rest = url;
        port_ = 80;
        if (rest.rfind("https://", 0) == 0) {
            rest = rest.substr(8);
            port_ = 443;
        } else if (rest.rfind("http://", 0) == 0) {
            rest = rest.substr(7);
        }

        auto slash = rest.find('/');
        std::string authority = rest.substr(0, slash);
        prefix_ = slash == std::string::npos ? "" : rest.substr(slash);
        while (!prefix_.empty() && prefix_.back() == '/') {
            prefix_.pop_back();
        }

        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host_ = authority.substr(0, colon);
            port_ = std::stoi(authority.substr(colon + 1));
        } else {
            host_ = authority;
        }
    }

    std::string authorizationHeader(const std::optional<std::string>& token) const {
        std::string header = std::string("MediaBrowser Client=\"") + CLIENT_NAME +
            "\", Device=\"" + DEVICE_NAME +
            "\", DeviceId=\"" + settings_->getDeviceId() +
            "\", Version=\"" + CLIENT_VERSION + "\"";
        if (token) {
            header += ", Token=\"" + *token + "\"";
        }
        return header;
    }

    SimpleResponse execute(const std::string& method,
                           const std::string& path,
                           const std::string& body,
                           const std::optional<std::string>& token,
                           int timeoutMs) {
        std::map<std::string, std::string> headers{
            {"X-Emby-Authorization", authorizationHeader(token)},
            {"Accept", "application/json"}
        };
        if (!body.empty()) {
            headers["Content-Type"] = "application/json";
        }

        auto exchange = std::make_shared<Exchange>(method, prefix_ + path, body, host_, port_, headers);

        if (timeoutMs <= 0) {
            exchange->sent = sendSafely(*httpClient_, *exchange, method + " " + path);
        } else {
            auto client = httpClient_;
            auto done = executor_->trySubmit([client, exchange]() {
                if (exchange->abandoned.load()) {
                    return;
                }
                exchange->sent = client->send(exchange->request, exchange->response);
            });

            if (!done) {
                std::cerr << "[HttpJellyfinGateway] " << method << " " << path
                          << " rejected: " << executor_->inFlight() << " requests in flight" << std::endl;
                throw domain::UpstreamUnavailableError(method + " " + path + ": too many requests in flight");
            }

            if (done->wait_for(std::chrono::milliseconds(timeoutMs)) == std::future_status::timeout) {
                exchange->abandoned = true;
                std::cerr << "[HttpJellyfinGateway] " << method << " " << path
                          << " timed out after " << timeoutMs << "ms" << std::endl;
                throw domain::UpstreamUnavailableError(method + " " + path + " timed out");
            }
            try {
                done->get();
            } catch (const std::exception& e) {
                throw domain::UpstreamUnavailableError(method + " " + path + ": " + e.what());
            }
        }

        if (!exchange->sent) {
            std::cerr << "[HttpJellyfinGateway] " << method << " " << path
                      << " transport failure" << std::endl;
            throw domain::UpstreamUnavailableError(method + " " + path + " transport failure");
        }
        return exchange->response;
    }

    static bool sendSafely(IHttpClient& client, Exchange& exchange, const std::string& what) {
        try {
            return client.send(exchange.request, exchange.response);
        } catch (const std::exception& e) {
            throw domain::UpstreamUnavailableError(what + ": " + e.what());
        }
    }

    void post(const std::string& path,
              const nlohmann::json& body,
              const domain::JellyfinCredentials& credentials,
              const std::string& operation) {
        auto response = execute("POST", path, body.dump(), credentials.accessToken,
                                settings_->getRequestTimeoutMs());
        checkStatus(response, operation);
    }

    ports::output::QuickConnectPollResult authenticateWithQuickConnect(const std::string& secret) {
        nlohmann::json body{{"Secret", secret}};
        auto response = execute("POST", "/Users/AuthenticateWithQuickConnect", body.dump(),
                                std::nullopt, settings_->getPollTimeoutMs());
        if (response.getStatus() == 404 || response.getStatus() == 400) {
            return ports::output::QuickConnectPollResult::expired();
        }
        checkStatus(response, "AuthenticateWithQuickConnect");

        auto json = parseBody(response, "AuthenticateWithQuickConnect");
        auto user = json.find("User");
        std::string token = str(json, "AccessToken");
        if (user == json.end() || !user->is_object() || token.empty()) {
            throw domain::UpstreamUnavailableError("AuthenticateWithQuickConnect returned no user");
        }

        auto result = ports::output::QuickConnectPollResult::approved(
            str(*user, "Id"), str(*user, "Name"), token);
        announceCapabilities(token);
        return result;
    }

    /**
     * @brief Сообщить Jellyfin возможности клиента, ошибка не мешает логину
     */
    void announceCapabilities(const std::string& token) {
        nlohmann::json body{
            {"PlayableMediaTypes", nlohmann::json::array({"Video"})},
            {"SupportedCommands", nlohmann::json::array()},
            {"SupportsMediaControl", false},
            {"SupportsPersistentIdentifier", false}
        };
        try {
            auto response = execute("POST", "/Sessions/Capabilities/Full", body.dump(), token,
                                    settings_->getRequestTimeoutMs());
            checkStatus(response, "Sessions/Capabilities/Full");
        } catch (const domain::GatewayError& e) {
            std::cerr << "[HttpJellyfinGateway] Capabilities not announced: " << e.what() << std::endl;
        }
    }

    static void checkStatus(const SimpleResponse& response, const std::string& operation) {
        int status = response.getStatus();
        if (status >= 200 && status < 300) {
            return;
        }
        std::cerr << "[HttpJellyfinGateway] " << operation << " failed: " << status << std::endl;
        if (status == 401) {
            throw domain::AuthExpiredError(operation);
        }
        throw domain::UpstreamUnavailableError(operation + " returned " + std::to_string(status));
    }

    static nlohmann::json parseBody(const SimpleResponse& response, const std::string& operation) {
        try {
            return nlohmann::json::parse(response.getBody());
        } catch (const nlohmann::json::exception& e) {
            throw domain::UpstreamUnavailableError(operation + " returned invalid JSON: " + e.what());
        }
    }

    // ============================================
    // РАЗБОР BaseItemDto
    // ============================================
    // Jellyfin отдаёт null вместо отсутствующих полей, поэтому json::value() не подходит.

    static std::string str(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        return it != j.end() && it->is_string() ? it->get<std::string>() : std::string();
    }

    static std::optional<std::string> optStr(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    }

    template <typename T>
    static std::optional<T> optNum(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number()) return std::nullopt;
        return it->get<T>();
    }

    static std::vector<std::string> strings(const nlohmann::json& j, const char* key) {
        std::vector<std::string> result;
        auto it = j.find(key);
        if (it == j.end() || !it->is_array()) return result;
        for (const auto& v : *it) {
            if (v.is_string()) result.push_back(v.get<std::string>());
        }
        return result;
    }

    static std::optional<domain::MediaItem> parseItem(const nlohmann::json& j) {
        if (!j.is_object()) {
            return std::nullopt;
        }
        domain::MediaItem item;
        item.id = str(j, "Id");
        if (item.id.empty()) {
            return std::nullopt;
        }

        item.name = str(j, "Name");
        item.type = str(j, "Type");
        item.locationType = str(j, "LocationType");
        item.overview = str(j, "Overview");
        item.seriesName = optStr(j, "SeriesName");
        item.seriesStudio = optStr(j, "SeriesStudio");
        item.seasonName = optStr(j, "SeasonName");
        item.indexNumber = optNum<int>(j, "IndexNumber");
        item.parentIndexNumber = optNum<int>(j, "ParentIndexNumber");
        item.productionYear = optNum<int>(j, "ProductionYear");
        item.runTimeTicks = optNum<int64_t>(j, "RunTimeTicks");
        item.communityRating = optNum<double>(j, "CommunityRating");
        item.premiereDate = optStr(j, "PremiereDate");
        item.dateCreated = optStr(j, "DateCreated");
        item.genres = strings(j, "Genres");
        item.tags = strings(j, "Tags");

        if (auto it = j.find("Studios"); it != j.end() && it->is_array()) {
            for (const auto& studio : *it) {
                if (studio.is_object() && !str(studio, "Name").empty()) {
                    item.studios.push_back(str(studio, "Name"));
                }
            }
        }

        if (auto it = j.find("People"); it != j.end() && it->is_array()) {
            for (const auto& p : *it) {
                if (!p.is_object()) continue;
                item.people.push_back({str(p, "Name"), str(p, "Type"), str(p, "Role")});
            }
        }

        if (auto it = j.find("Chapters"); it != j.end() && it->is_array()) {
            for (const auto& c : *it) {
                if (!c.is_object()) continue;
                item.chapters.push_back({str(c, "Name"), optNum<int64_t>(c, "StartPositionTicks").value_or(0)});
            }
        }

        if (auto it = j.find("MediaSources"); it != j.end() && it->is_array()) {
            for (const auto& s : *it) {
                if (!s.is_object()) continue;
                domain::MediaSourceInfo source;
                source.id = str(s, "Id");
                source.container = str(s, "Container");
                if (auto streams = s.find("MediaStreams"); streams != s.end() && streams->is_array()) {
                    for (const auto& st : *streams) {
                        if (!st.is_object()) continue;
                        domain::MediaStream stream;
                        stream.index = optNum<int>(st, "Index").value_or(0);
                        stream.type = str(st, "Type");
                        stream.codec = str(st, "Codec");
                        stream.language = str(st, "Language");
                        stream.displayTitle = str(st, "DisplayTitle");
                        auto isText = st.find("IsTextSubtitleStream");
                        stream.isTextSubtitleStream = isText != st.end() && isText->is_boolean() && isText->get<bool>();
                        source.streams.push_back(std::move(stream));
                    }
                }
                item.mediaSources.push_back(std::move(source));
            }
        }

        if (auto userData = j.find("UserData"); userData != j.end() && userData->is_object()) {
            auto favorite = userData->find("IsFavorite");
            item.isFavorite = favorite != userData->end() && favorite->is_boolean() && favorite->get<bool>();
        }

        return item;
    }
};

} // namespace jellyvr::adapters::secondary
