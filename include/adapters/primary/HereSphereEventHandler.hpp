#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IHereSphereService.hpp"
#include "adapters/primary/HttpUtils.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>
#include <stdexcept>

namespace jellyvr::adapters::primary {

/**
 * @brief POST /heresphere/events/{sessionId}/{itemId} - события плеера
 *
 * Адрес выдаётся плееру в поле eventServer карточки видео.
 */
class HereSphereEventHandler : public IHttpHandler {
public:
    explicit HereSphereEventHandler(std::shared_ptr<ports::input::IHereSphereService> service)
        : service_(std::move(service))
    {
        std::cout << "[HereSphereEventHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            http::sendError(res, 405, "Method not allowed");
            return;
        }

        auto segments = http::pathSegments(req.getPath());
        if (segments.size() != 4 || segments[0] != "heresphere" || segments[1] != "events") {
            http::sendError(res, 404, "Not found");
            return;
        }

        try {
            auto event = domain::heresphere::parseEvent(nlohmann::json::parse(req.getBody()));
            http::writeHereSphere(res, service_->event(segments[2], segments[3], event));
        } catch (const nlohmann::json::exception&) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::invalid_argument& e) {
            http::sendError(res, 400, e.what());
        } catch (const domain::GatewayError& e) {
            std::cerr << "[HereSphereEventHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 503, "Service unavailable");
        }
    }

private:
    std::shared_ptr<ports::input::IHereSphereService> service_;
};

} // namespace jellyvr::adapters::primary
