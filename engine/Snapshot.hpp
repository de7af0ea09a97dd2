#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "Device.hpp"

namespace devwatch::engine
{
    struct SnapshotEntry
    {
        DeviceSpec device;
        bool reachable = false;
        std::string hostname = UNKNOWN;
        std::string model = UNKNOWN;
        bool blinkPhase = true;

        const std::string &Target() const { return device.ProbeTarget(); }
    };

    // One polling cycle's result, in device-list order.
    struct Snapshot
    {
        std::uint64_t cycle = 0;
        bool blinkPhase = true;
        std::vector<SnapshotEntry> entries;
    };

    using SnapshotPtr = std::shared_ptr<const Snapshot>;

    // Rendering collaborator. Called on the orchestrator thread once per cycle.
    class SnapshotSink
    {
    public:
        virtual ~SnapshotSink() = default;
        virtual void Emit(const SnapshotPtr &snapshot) = 0;
    };
}
