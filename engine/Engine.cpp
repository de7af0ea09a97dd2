#include "Engine.hpp"
#include "../common/Log.hpp"

namespace devwatch::engine
{
    std::unique_ptr<CycleOrchestrator> BuildOrchestrator(const common::EngineConfig &config)
    {
        auto source = std::make_shared<DeviceListFile>(config.devicesFile);
        auto resolver = std::make_shared<Resolver>(std::make_shared<SystemNameLookup>(), config.dnsTtl);
        auto prober = std::make_shared<Prober>(std::make_shared<IcmpProbe>(), config.probeWorkers, config.probeTimeout);

        auto logins = ExpandCredentials(config.credentials);
        if (logins.empty())
            common::LogError("Orchestrator", "no SSH credentials configured; hostnames and models will stay unknown");

        auto opener = std::make_shared<SshSessionOpener>(config.sshPort, config.sshTimeout, config.commandTimeout);
        auto runner = std::make_shared<CredentialedRunner>(opener, std::move(logins));
        auto fetcher = std::make_shared<MetadataFetcher>(runner);

        auto cache = std::make_shared<MetadataCache>(config.hostnameTtl, config.modelTtl);
        auto refresher = std::make_shared<MetadataRefresher>(fetcher, cache, config.fetchWorkers);

        CycleTiming timing;
        timing.cycleInterval = config.cycleInterval;
        timing.reloadInterval = config.reloadInterval;

        return std::make_unique<CycleOrchestrator>(source, resolver, prober, cache, refresher,
                                                   BlinkClock(config.blinkInterval), timing);
    }
}
