#include <QApplication>
#include <exception>
#include <iostream>
#include <memory>
#include "HealthMapWindow.hpp"
#include "SnapshotQueue.hpp"
#include "../common/Config.hpp"
#include "../common/Log.hpp"
#include "../engine/Engine.hpp"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    devwatch::common::EngineConfig config = devwatch::common::DefaultConfig();
    std::string error;
    bool showHelp = false;

    if (!devwatch::common::ApplyArguments(argc, argv, config, error, showHelp))
    {
        std::cerr << "[Gui] " << error << "\n" << devwatch::common::Usage(argv[0]);
        return 1;
    }
    if (showHelp)
    {
        std::cout << devwatch::common::Usage(argv[0]);
        return 0;
    }

    devwatch::common::SetVerbose(config.verbose);

    std::unique_ptr<devwatch::engine::CycleOrchestrator> orchestrator;
    try
    {
        orchestrator = devwatch::engine::BuildOrchestrator(config);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Gui] Fatal: " << e.what() << "\n";
        return 1;
    }

    auto queue = std::make_shared<devwatch::client::SnapshotQueue>();
    orchestrator->AddSink(queue);

    std::cout << "[Gui] Watching " << config.devicesFile << " (reload every "
              << config.reloadInterval.count() / 1000.0 << "s)\n";
    orchestrator->Start();

    devwatch::client::HealthMapWindow window(queue, config.hostnameSuffixes);
    window.show();

    int rc = app.exec();
    orchestrator->Stop();
    std::cout << "[Gui] Stopped.\n";
    return rc;
}
