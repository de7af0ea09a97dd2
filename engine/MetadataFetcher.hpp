#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "Dialect.hpp"
#include "RemoteShell.hpp"

namespace devwatch::engine
{
    // Fetch-or-fail primitive: runs a command chain against one device and returns the first
    // non-empty parse, or "unknown". Knows nothing about caching or reachability. Once
    // *cancel is set no further command is sent and the result is "unknown".
    class MetadataFetcher
    {
    public:
        explicit MetadataFetcher(std::shared_ptr<CommandRunner> runner,
                                 std::vector<CommandProbe> hostnameChain = DefaultHostnameChain(),
                                 std::vector<CommandProbe> modelChain = DefaultModelChain());

        std::string FetchHostname(const std::string &address, const std::atomic<bool> *cancel = nullptr);
        std::string FetchModel(const std::string &address, const std::atomic<bool> *cancel = nullptr);

    private:
        std::string RunChain(const std::string &address, const std::vector<CommandProbe> &chain, const char *what,
                             const std::atomic<bool> *cancel);

        std::shared_ptr<CommandRunner> m_runner;
        std::vector<CommandProbe> m_hostnameChain;
        std::vector<CommandProbe> m_modelChain;
    };
}
