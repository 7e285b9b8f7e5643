#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <chrono>

namespace jellyvr::adapters::primary {

/**
 * @brief GET /health - liveness, без обращения к хранилищу и Jellyfin
 */
class HealthHandler : public IHttpHandler {
public:
    HealthHandler() : startedAt_(std::chrono::steady_clock::now()) {}

    void handle(IRequest& req, IResponse& res) override {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startedAt_).count();

        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "jellyvr-gateway";
        response["uptime_seconds"] = uptime;

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::chrono::steady_clock::time_point startedAt_;
};

} // namespace jellyvr::adapters::primary
