#include "JellyVrApp.hpp"
#include <csignal>
#include <cstring>
#include <iostream>

namespace
{
    // Живёт только внутри run()
    jellyvr::JellyVrApp *runningApp = nullptr;

    void onTerminate(int signal)
    {
        std::cout << "\n[main] " << (signal == SIGTERM ? "SIGTERM" : "SIGINT")
                  << ": stopping gateway, in-flight Jellyfin calls will be joined" << std::endl;
        if (runningApp)
        {
            runningApp->stop();
        }
    }

    void printUsage()
    {
        std::cout << "jellyvr-gateway: HereSphere API on top of a Jellyfin library\n"
                  << "\n"
                  << "  Open http://<host>:<port>/ in a browser, approve the QuickConnect code\n"
                  << "  in Jellyfin, then enter the shown username and password in HereSphere\n"
                  << "  with http://<host>:<port>/heresphere as the library URL.\n"
                  << "\n"
                  << "Configuration is read from JELLYFIN_*, JELLYVR_* environment variables." << std::endl;
    }
} // namespace

int main(int argc, char *argv[])
{
    if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0))
    {
        printUsage();
        return 0;
    }

    try
    {
        jellyvr::JellyVrApp app;
        runningApp = &app;

        std::signal(SIGINT, onTerminate);
        std::signal(SIGTERM, onTerminate);

        std::cout << "[main] jellyvr-gateway 1.0.0: Jellyfin -> HereSphere" << std::endl;

        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] jellyvr-gateway exited cleanly" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        runningApp = nullptr;
        std::cerr << "[main] jellyvr-gateway failed to start: " << e.what() << std::endl;
        return 1;
    }
}
