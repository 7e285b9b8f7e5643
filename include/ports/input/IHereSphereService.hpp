#pragma once

#include "domain/HereSphere.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace jellyvr::ports::input {

/**
 * @brief Ответ HereSphere API: HTTP статус + JSON
 */
struct HereSphereResponse {
    int status = 200;
    nlohmann::json body;
};

/**
 * @brief API в формате HereSphere поверх Jellyfin
 *
 * host - внешний адрес шлюза ("https://vr.example.com"),
 * из него строятся ссылки на карточки видео и event server.
 */
class IHereSphereService {
public:
    virtual ~IHereSphereService() = default;

    virtual HereSphereResponse index(
        const domain::heresphere::Request& request,
        const std::string& host
    ) = 0;

    virtual HereSphereResponse scan(
        const domain::heresphere::Request& request,
        const std::string& host
    ) = 0;

    virtual HereSphereResponse video(
        const domain::heresphere::Request& request,
        const std::string& host,
        const std::string& itemId
    ) = 0;

    virtual HereSphereResponse event(
        const std::string& sessionId,
        const std::string& itemId,
        const domain::heresphere::Event& event
    ) = 0;
};

} // namespace jellyvr::ports::input
