#pragma once

#include "ports/input/IHereSphereService.hpp"
#include "domain/HereSphere.hpp"
#include <IRequest.hpp>
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace jellyvr::adapters::primary::http {

/**
 * @brief Внешний адрес шлюза, как его видит клиент
 *
 * За reverse proxy схема берётся из X-Forwarded-Proto.
 */
inline std::string requestHost(IRequest& req) {
    std::string scheme = req.getHeader("X-Forwarded-Proto").value_or("http");
    std::string host = req.getHeader("Host").value_or("localhost");
    return scheme + "://" + host;
}

/**
 * @brief Сегменты пути без query: "/a/b?x=1" → {"a", "b"}
 */
inline std::vector<std::string> pathSegments(const std::string& path) {
    std::vector<std::string> segments;
    std::string clean = path.substr(0, path.find('?'));
    size_t start = 0;
    while (start <= clean.size()) {
        size_t end = clean.find('/', start);
        if (end == std::string::npos) end = clean.size();
        if (end > start) {
            segments.push_back(clean.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

inline std::optional<std::string> cookie(IRequest& req, const std::string& name) {
    auto header = req.getHeader("Cookie");
    if (!header) {
        return std::nullopt;
    }

    const std::string& value = *header;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t end = value.find(';', pos);
        if (end == std::string::npos) end = value.size();

        std::string pair = value.substr(pos, end - pos);
        size_t first = pair.find_first_not_of(' ');
        if (first != std::string::npos) {
            pair = pair.substr(first);
            size_t eq = pair.find('=');
            if (eq != std::string::npos && pair.substr(0, eq) == name) {
                std::string result = pair.substr(eq + 1);
                if (!result.empty()) {
                    return result;
                }
            }
        }
        pos = end + 1;
    }
    return std::nullopt;
}

inline std::string htmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

/**
 * @brief Разобрать тело запроса HereSphere; пустое тело - пустой логин
 * @throws nlohmann::json::exception при невалидном JSON
 */
inline domain::heresphere::Request parseHereSphereRequest(IRequest& req) {
    if (req.getBody().empty()) {
        return {};
    }
    return domain::heresphere::parseRequest(nlohmann::json::parse(req.getBody()));
}

inline void writeHereSphere(IResponse& res, const ports::input::HereSphereResponse& response) {
    res.setHeader(domain::heresphere::MAGIC_HEADER, domain::heresphere::MAGIC_VERSION);
    res.setResult(response.status, "application/json", response.body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setHeader(domain::heresphere::MAGIC_HEADER, domain::heresphere::MAGIC_VERSION);
    res.setResult(status, "application/json", error.dump());
}

} // namespace jellyvr::adapters::primary::http
