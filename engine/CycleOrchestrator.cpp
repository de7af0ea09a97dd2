#include "CycleOrchestrator.hpp"
#include "../common/Log.hpp"
#include <algorithm>
#include <exception>

namespace devwatch::engine
{
    const char *ToString(CycleState state)
    {
        switch (state)
        {
        case CycleState::Idle:
            return "Idle";
        case CycleState::Reloading:
            return "Reloading";
        case CycleState::Probing:
            return "Probing";
        case CycleState::FetchingMetadata:
            return "FetchingMetadata";
        case CycleState::Composing:
            return "Composing";
        case CycleState::Emitted:
            return "Emitted";
        }
        return "?";
    }

    CycleOrchestrator::CycleOrchestrator(std::shared_ptr<DeviceListSource> source,
                                         std::shared_ptr<Resolver> resolver,
                                         std::shared_ptr<Prober> prober,
                                         std::shared_ptr<MetadataCache> cache,
                                         std::shared_ptr<MetadataRefresher> refresher,
                                         BlinkClock blink,
                                         CycleTiming timing,
                                         common::NowFn now)
        : m_source(std::move(source)), m_resolver(std::move(resolver)), m_prober(std::move(prober)),
          m_cache(std::move(cache)), m_refresher(std::move(refresher)), m_blink(std::move(blink)),
          m_timing(timing), m_now(std::move(now)),
          m_running(false), m_stopRequested(false), m_state(CycleState::Idle)
    {
    }

    CycleOrchestrator::~CycleOrchestrator()
    {
        Stop();
    }

    void CycleOrchestrator::AddSink(std::shared_ptr<SnapshotSink> sink)
    {
        if (sink)
            m_sinks.push_back(std::move(sink));
    }

    void CycleOrchestrator::Start()
    {
        if (m_running)
            return;
        m_stopRequested = false;
        m_running = true;
        m_thread = std::thread(&CycleOrchestrator::Loop, this);
    }

    void CycleOrchestrator::Stop()
    {
        m_stopRequested = true;
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
    }

    std::vector<DeviceSpec> CycleOrchestrator::Devices() const
    {
        std::lock_guard<std::mutex> lock(m_devicesMutex);
        return m_devices;
    }

    void CycleOrchestrator::Loop()
    {
        while (m_running)
        {
            try
            {
                RunCycle();
            }
            catch (const std::exception &e)
            {
                common::LogError("Orchestrator", std::string("cycle failed: ") + e.what());
                SetState(CycleState::Idle);
            }

            SleepInterval();
        }
    }

    void CycleOrchestrator::SleepInterval()
    {
        const auto step = std::min<std::chrono::milliseconds>(m_timing.cycleInterval, std::chrono::milliseconds(50));
        const auto deadline = common::Clock::now() + m_timing.cycleInterval;

        while (m_running && common::Clock::now() < deadline)
            std::this_thread::sleep_for(step);
    }

    void CycleOrchestrator::Reload()
    {
        const auto now = m_now();
        if (m_loadedOnce && now - m_lastReload < m_timing.reloadInterval)
            return;
        m_lastReload = now;

        std::vector<std::string> entries;
        auto loaded = m_source->Load();
        if (!loaded)
        {
            if (!m_listMissing)
                common::LogError("DeviceList", "device list not readable; polling an empty set");
            m_listMissing = true;
        }
        else
        {
            if (m_listMissing)
                common::LogInfo("DeviceList", "device list readable again");
            m_listMissing = false;
            entries = std::move(*loaded);
        }

        // Resolution goes through the resolver's TTL cache, so this is cheap until DNS_TTL expires.
        std::vector<DeviceSpec> devices = m_resolver->ResolveAll(entries);

        std::lock_guard<std::mutex> lock(m_devicesMutex);
        const bool listChanged = !m_loadedOnce || entries != m_entries;
        if (listChanged || devices != m_devices)
        {
            if (listChanged)
                common::LogInfo("Orchestrator", "loaded " + std::to_string(entries.size()) + " device(s)");
            m_entries = std::move(entries);
            m_devices = std::move(devices);
        }
        m_loadedOnce = true;
    }

    SnapshotPtr CycleOrchestrator::RunCycle()
    {
        SetState(CycleState::Reloading);
        Reload();
        const std::vector<DeviceSpec> devices = Devices();

        if (m_stopRequested)
        {
            SetState(CycleState::Idle);
            return nullptr;
        }

        SetState(CycleState::Probing);
        std::vector<std::string> targets;
        targets.reserve(devices.size());
        for (const auto &device : devices)
            targets.push_back(device.ProbeTarget());

        const auto reachability = m_prober->ProbeAll(targets, &m_stopRequested);

        if (m_stopRequested)
        {
            SetState(CycleState::Idle);
            return nullptr;
        }

        SetState(CycleState::FetchingMetadata);
        std::vector<std::string> up;
        for (const auto &device : devices)
        {
            if (device.resolvedAddress.empty())
                continue;
            auto it = reachability.find(device.ProbeTarget());
            if (it != reachability.end() && it->second)
                up.push_back(device.resolvedAddress);
        }
        m_refresher->RefreshReachable(up, &m_stopRequested);

        if (m_stopRequested)
        {
            SetState(CycleState::Idle);
            return nullptr;
        }

        SetState(CycleState::Composing);
        SnapshotPtr snapshot = Compose(devices, reachability);

        SetState(CycleState::Emitted);
        for (const auto &sink : m_sinks)
        {
            try
            {
                sink->Emit(snapshot);
            }
            catch (const std::exception &e)
            {
                common::LogError("Orchestrator", std::string("snapshot sink failed: ") + e.what());
            }
        }

        SetState(CycleState::Idle);
        return snapshot;
    }

    SnapshotPtr CycleOrchestrator::Compose(const std::vector<DeviceSpec> &devices,
                                           const std::unordered_map<std::string, bool> &reachability)
    {
        auto snapshot = std::make_shared<Snapshot>();
        snapshot->cycle = ++m_cycle;
        snapshot->blinkPhase = m_blink.Advance();
        snapshot->entries.reserve(devices.size());

        for (const auto &device : devices)
        {
            SnapshotEntry entry;
            entry.device = device;
            entry.blinkPhase = snapshot->blinkPhase;

            auto it = reachability.find(device.ProbeTarget());
            entry.reachable = it != reachability.end() && it->second;

            if (!device.resolvedAddress.empty())
            {
                DeviceMetadata metadata = m_cache->Lookup(device.resolvedAddress);
                entry.hostname = metadata.hostname;
                entry.model = metadata.model;
            }

            auto last = m_lastReachable.find(device.ProbeTarget());
            if (last == m_lastReachable.end() || last->second != entry.reachable)
            {
                common::LogDebug("Orchestrator", device.ProbeTarget() + (entry.reachable ? " is UP" : " is DOWN"));
                m_lastReachable[device.ProbeTarget()] = entry.reachable;
            }

            snapshot->entries.push_back(std::move(entry));
        }

        return snapshot;
    }
}
