#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace devwatch::engine
{
    class ProbeTransport
    {
    public:
        virtual ~ProbeTransport() = default;

        // One echo, no retry. True only when a reply arrived within the timeout.
        virtual bool Probe(const std::string &address, std::chrono::milliseconds timeout) = 0;
    };

    // ICMP echo through libtins. Needs raw-socket privileges; without them every probe
    // reports false.
    class IcmpProbe : public ProbeTransport
    {
    public:
        IcmpProbe();
        bool Probe(const std::string &address, std::chrono::milliseconds timeout) override;

    private:
        std::atomic<std::uint16_t> m_nextId;
    };

    class Prober
    {
    public:
        Prober(std::shared_ptr<ProbeTransport> transport, std::size_t maxParallel, std::chrono::milliseconds timeout);

        // Probes each distinct target once. Targets that are not IPv4 literals (unresolved
        // entries) are false without a probe. Returns after all probes finished.
        std::unordered_map<std::string, bool> ProbeAll(const std::vector<std::string> &targets,
                                                       const std::atomic<bool> *cancel = nullptr);

    private:
        std::shared_ptr<ProbeTransport> m_transport;
        std::size_t m_maxParallel;
        std::chrono::milliseconds m_timeout;
    };
}
