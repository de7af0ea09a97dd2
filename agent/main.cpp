#include "../client/ConsoleRenderer.hpp"
#include "../common/Config.hpp"
#include "../common/Log.hpp"
#include "../engine/Engine.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

namespace
{
    std::atomic<bool> g_quit{false};

    void HandleSignal(int)
    {
        g_quit = true;
    }
}

int main(int argc, char *argv[])
{
    devwatch::common::EngineConfig config = devwatch::common::DefaultConfig();
    std::string error;
    bool showHelp = false;

    if (!devwatch::common::ApplyArguments(argc, argv, config, error, showHelp))
    {
        std::cerr << "[Agent] " << error << "\n" << devwatch::common::Usage(argv[0]);
        return 1;
    }
    if (showHelp)
    {
        std::cout << devwatch::common::Usage(argv[0]);
        return 0;
    }

    devwatch::common::SetVerbose(config.verbose);
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try
    {
        auto orchestrator = devwatch::engine::BuildOrchestrator(config);
        orchestrator->AddSink(std::make_shared<devwatch::client::ConsoleRenderer>(std::cout, config.hostnameSuffixes));

        std::cout << "[Agent] Watching " << config.devicesFile << " (reload every "
                  << config.reloadInterval.count() / 1000.0 << "s)\n";
        orchestrator->Start();

        while (!g_quit)
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

        orchestrator->Stop();
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Agent] Fatal: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n[Agent] Stopped.\n";
    return 0;
}
