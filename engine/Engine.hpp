#pragma once

#include <memory>
#include "CycleOrchestrator.hpp"
#include "../common/Config.hpp"

namespace devwatch::engine
{
    // Wires the production components (system resolver, libtins ICMP, libssh2 sessions)
    // and the process-lifetime caches from the configuration.
    std::unique_ptr<CycleOrchestrator> BuildOrchestrator(const common::EngineConfig &config);
}
