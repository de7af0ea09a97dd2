#include "Prober.hpp"
#include "../common/Log.hpp"
#include "../common/TaskGroup.hpp"
#include "../common/TextUtil.hpp"
#include <exception>
#include <mutex>
#include <unordered_set>

namespace devwatch::engine
{
    Prober::Prober(std::shared_ptr<ProbeTransport> transport, std::size_t maxParallel, std::chrono::milliseconds timeout)
        : m_transport(std::move(transport)), m_maxParallel(maxParallel), m_timeout(timeout)
    {
    }

    std::unordered_map<std::string, bool> Prober::ProbeAll(const std::vector<std::string> &targets,
                                                           const std::atomic<bool> *cancel)
    {
        std::unordered_map<std::string, bool> results;
        std::vector<std::string> unique;
        std::unordered_set<std::string> seen;

        for (const auto &target : targets)
        {
            if (!seen.insert(target).second)
                continue;

            results[target] = false;
            if (common::IsIpv4Literal(target))
                unique.push_back(target);
        }

        std::mutex resultsMutex;
        common::TaskGroup group(m_maxParallel, cancel);
        group.Run(unique.size(), [&](std::size_t i)
                  {
            const std::string &target = unique[i];
            bool up = false;
            try
            {
                up = m_transport->Probe(target, m_timeout);
            }
            catch (const std::exception &e)
            {
                common::LogDebug("Prober", "probe of " + target + " failed: " + e.what());
                up = false;
            }

            std::lock_guard<std::mutex> lock(resultsMutex);
            results[target] = up; });

        return results;
    }
}
