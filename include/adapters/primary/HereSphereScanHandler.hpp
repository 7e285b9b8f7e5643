#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IHereSphereService.hpp"
#include "adapters/primary/HttpUtils.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>

namespace jellyvr::adapters::primary {

/**
 * @brief POST /heresphere/scan - метаданные всей библиотеки одним ответом
 */
class HereSphereScanHandler : public IHttpHandler {
public:
    explicit HereSphereScanHandler(std::shared_ptr<ports::input::IHereSphereService> service)
        : service_(std::move(service))
    {
        std::cout << "[HereSphereScanHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            http::sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            auto request = http::parseHereSphereRequest(req);
            http::writeHereSphere(res, service_->scan(request, http::requestHost(req)));
        } catch (const nlohmann::json::exception&) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const domain::GatewayError& e) {
            std::cerr << "[HereSphereScanHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 503, "Service unavailable");
        }
    }

private:
    std::shared_ptr<ports::input::IHereSphereService> service_;
};

} // namespace jellyvr::adapters::primary
