#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "BlinkClock.hpp"
#include "DeviceList.hpp"
#include "MetadataCache.hpp"
#include "Prober.hpp"
#include "Resolver.hpp"
#include "Snapshot.hpp"
#include "../common/Clock.hpp"

namespace devwatch::engine
{
    enum class CycleState
    {
        Idle,
        Reloading,
        Probing,
        FetchingMetadata,
        Composing,
        Emitted
    };

    const char *ToString(CycleState state);

    struct CycleTiming
    {
        std::chrono::milliseconds cycleInterval{120};
        std::chrono::milliseconds reloadInterval{10000};
    };

    class CycleOrchestrator
    {
    public:
        CycleOrchestrator(std::shared_ptr<DeviceListSource> source,
                          std::shared_ptr<Resolver> resolver,
                          std::shared_ptr<Prober> prober,
                          std::shared_ptr<MetadataCache> cache,
                          std::shared_ptr<MetadataRefresher> refresher,
                          BlinkClock blink,
                          CycleTiming timing,
                          common::NowFn now = common::SystemNow());
        ~CycleOrchestrator();

        // Sinks must be added before Start().
        void AddSink(std::shared_ptr<SnapshotSink> sink);

        void Start();

        // No new cycle, work item, login attempt or command starts after this. Only network
        // calls already in progress finish (bounded by their timeouts) before the join.
        void Stop();

        bool IsRunning() const { return m_running; }

        // Runs one cycle on the calling thread and emits it. Returns nullptr when a stop
        // request interrupted the cycle before it was composed.
        SnapshotPtr RunCycle();

        CycleState State() const { return m_state; }
        std::vector<DeviceSpec> Devices() const;

    private:
        void Loop();
        void SleepInterval();
        void Reload();
        void SetState(CycleState state) { m_state = state; }
        SnapshotPtr Compose(const std::vector<DeviceSpec> &devices,
                            const std::unordered_map<std::string, bool> &reachability);

        std::shared_ptr<DeviceListSource> m_source;
        std::shared_ptr<Resolver> m_resolver;
        std::shared_ptr<Prober> m_prober;
        std::shared_ptr<MetadataCache> m_cache;
        std::shared_ptr<MetadataRefresher> m_refresher;
        BlinkClock m_blink;
        CycleTiming m_timing;
        common::NowFn m_now;

        std::vector<std::shared_ptr<SnapshotSink>> m_sinks;

        std::atomic<bool> m_running;
        std::atomic<bool> m_stopRequested;
        std::atomic<CycleState> m_state;
        std::thread m_thread;

        mutable std::mutex m_devicesMutex;
        std::vector<std::string> m_entries;
        std::vector<DeviceSpec> m_devices;

        bool m_loadedOnce = false;
        bool m_listMissing = false;
        common::TimePoint m_lastReload;
        std::uint64_t m_cycle = 0;
        std::unordered_map<std::string, bool> m_lastReachable;
    };
}
