#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IHereSphereService.hpp"
#include "adapters/primary/HttpUtils.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>

namespace jellyvr::adapters::primary {

/**
 * @brief POST /heresphere/{itemId} - карточка видео
 *
 * Роутер регистрирует с паттерном "/heresphere/*".
 * С needsMediaSource=true открывает сессию воспроизведения в Jellyfin.
 */
class HereSphereVideoHandler : public IHttpHandler {
public:
    explicit HereSphereVideoHandler(std::shared_ptr<ports::input::IHereSphereService> service)
        : service_(std::move(service))
    {
        std::cout << "[HereSphereVideoHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            http::sendError(res, 405, "Method not allowed");
            return;
        }

        auto segments = http::pathSegments(req.getPath());
        if (segments.size() != 2 || segments[0] != "heresphere") {
            http::sendError(res, 404, "Not found");
            return;
        }
        const std::string& itemId = segments[1];

        try {
            auto request = http::parseHereSphereRequest(req);
            http::writeHereSphere(res, service_->video(request, http::requestHost(req), itemId));
        } catch (const nlohmann::json::exception&) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const domain::GatewayError& e) {
            std::cerr << "[HereSphereVideoHandler] Error for " << itemId << ": " << e.what() << std::endl;
            http::sendError(res, 503, "Service unavailable");
        }
    }

private:
    std::shared_ptr<ports::input::IHereSphereService> service_;
};

} // namespace jellyvr::adapters::primary
