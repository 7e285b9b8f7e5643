// include/JellyVrApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/JellyfinSettings.hpp"
#include "settings/GatewaySettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/CacheSettings.hpp"

// Ports
#include "ports/input/IAuthService.hpp"
#include "ports/input/IPlaybackTracker.hpp"
#include "ports/input/IHereSphereService.hpp"
#include "ports/output/IKeyValueStore.hpp"
#include "ports/output/IJellyfinGateway.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "ports/output/IProgressRelay.hpp"

// Application
#include "application/AuthService.hpp"
#include "application/PlaybackTracker.hpp"
#include "application/HereSphereService.hpp"
#include "application/ProgressRelayWorker.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresKeyValueStore.hpp"
#include "adapters/secondary/HttpJellyfinGateway.hpp"
#include "adapters/secondary/CachedJellyfinGateway.hpp"
#include "adapters/secondary/Sha256PasswordHasher.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/RootPageHandler.hpp"
#include "adapters/primary/HereSphereIndexHandler.hpp"
#include "adapters/primary/HereSphereScanHandler.hpp"
#include "adapters/primary/HereSphereVideoHandler.hpp"
#include "adapters/primary/HereSphereEventHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace jellyvr
{

    /**
     * @brief JellyVR Gateway Application
     *
     * Браузер: GET /, GET /relogin - QuickConnect и выдача пароля
     * HereSphere: POST /heresphere, /heresphere/scan, /heresphere/{id},
     *             /heresphere/events/{sessionId}/{id}
     * События воспроизведения уходят в Jellyfin из ProgressRelayWorker.
     */
    class JellyVrApp : public BoostBeastApplication
    {
    public:
        JellyVrApp() { std::cout << "[JellyVrApp] Initializing..." << std::endl; }

        ~JellyVrApp() override
        {
            if (relayWorker_)
            {
                relayWorker_->stop();
            }
            std::cout << "[JellyVrApp] Shutting down..." << std::endl;
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[JellyVrApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[JellyVrApp] Configuring DI..." << std::endl;

            // Шаг 1: клиент Jellyfin - один экземпляр для сервисов и relay worker
            auto upstreamInjector = di::make_injector(
                di::bind<settings::IJellyfinSettings>().to<settings::JellyfinSettings>().in(di::singleton),
                di::bind<settings::ICacheSettings>().to<settings::CacheSettings>().in(di::singleton),
                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<adapters::secondary::HttpJellyfinGateway>().in(di::singleton));
            auto jellyfinSettings = upstreamInjector.create<std::shared_ptr<settings::IJellyfinSettings>>();
            auto cacheSettings = upstreamInjector.create<std::shared_ptr<settings::ICacheSettings>>();
            auto httpJellyfin = upstreamInjector.create<std::shared_ptr<adapters::secondary::HttpJellyfinGateway>>();

            // Метаданные библиотеки через кэш, воспроизведение напрямую
            std::shared_ptr<ports::output::IJellyfinGateway> jellyfin =
                std::make_shared<adapters::secondary::CachedJellyfinGateway>(
                    httpJellyfin, cacheSettings, jellyfinSettings);

            relayWorker_ = std::make_shared<application::ProgressRelayWorker>(jellyfin);

            // Шаг 2: основной injector с instance binding
            auto injector = di::make_injector(
                di::bind<settings::IJellyfinSettings>().to(jellyfinSettings),
                di::bind<ports::output::IJellyfinGateway>().to(jellyfin),
                di::bind<ports::output::IProgressRelay>().to(relayWorker_),

                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::IGatewaySettings>().to<settings::GatewaySettings>().in(di::singleton),

                di::bind<ports::output::IKeyValueStore>()
                    .to<adapters::secondary::PostgresKeyValueStore>()
                    .in(di::singleton),
                di::bind<ports::output::IPasswordHasher>()
                    .to<adapters::secondary::Sha256PasswordHasher>()
                    .in(di::singleton),

                di::bind<ports::input::IAuthService>().to<application::AuthService>().in(di::singleton),
                di::bind<ports::input::IPlaybackTracker>().to<application::PlaybackTracker>().in(di::singleton),
                di::bind<ports::input::IHereSphereService>().to<application::HereSphereService>().in(di::singleton));

            // Шаг 3: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
            auto rootHandler = injector.create<std::shared_ptr<adapters::primary::RootPageHandler>>();
            handlers_[getHandlerKey("GET", "/")] = rootHandler;
            handlers_[getHandlerKey("GET", adapters::primary::RootPageHandler::RELOGIN_PATH)] = rootHandler;

            auto indexHandler = injector.create<std::shared_ptr<adapters::primary::HereSphereIndexHandler>>();
            handlers_[getHandlerKey("GET", "/heresphere")] = indexHandler;
            handlers_[getHandlerKey("POST", "/heresphere")] = indexHandler;

            handlers_[getHandlerKey("POST", "/heresphere/scan")] =
                injector.create<std::shared_ptr<adapters::primary::HereSphereScanHandler>>();
            handlers_[getHandlerKey("POST", "/heresphere/*")] =
                injector.create<std::shared_ptr<adapters::primary::HereSphereVideoHandler>>();
            handlers_[getHandlerKey("POST", "/heresphere/events/*/*")] =
                injector.create<std::shared_ptr<adapters::primary::HereSphereEventHandler>>();

            // Шаг 4: relay worker после регистрации handlers
            relayWorker_->start();

            std::cout << "[JellyVrApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<application::ProgressRelayWorker> relayWorker_;
    };

} // namespace jellyvr
