#include "MetadataFetcher.hpp"
#include "Device.hpp"
#include "../common/Fallback.hpp"
#include "../common/Log.hpp"
#include <exception>
#include <optional>

namespace devwatch::engine
{
    MetadataFetcher::MetadataFetcher(std::shared_ptr<CommandRunner> runner,
                                     std::vector<CommandProbe> hostnameChain,
                                     std::vector<CommandProbe> modelChain)
        : m_runner(std::move(runner)), m_hostnameChain(std::move(hostnameChain)), m_modelChain(std::move(modelChain))
    {
    }

    std::string MetadataFetcher::FetchHostname(const std::string &address, const std::atomic<bool> *cancel)
    {
        return RunChain(address, m_hostnameChain, "hostname", cancel);
    }

    std::string MetadataFetcher::FetchModel(const std::string &address, const std::atomic<bool> *cancel)
    {
        return RunChain(address, m_modelChain, "model", cancel);
    }

    std::string MetadataFetcher::RunChain(const std::string &address, const std::vector<CommandProbe> &chain, const char *what,
                                          const std::atomic<bool> *cancel)
    {
        auto found = common::FirstSuccess(chain, [&](const CommandProbe &probe) -> std::optional<std::string>
                                          {
            if (cancel && cancel->load())
                return std::nullopt;

            std::optional<std::string> output;
            try
            {
                output = m_runner->Run(address, probe.command, cancel);
            }
            catch (const std::exception &e)
            {
                common::LogDebug("MetadataFetcher", address + ": '" + probe.command + "' threw: " + e.what());
                return std::nullopt;
            }

            if (!output || output->empty())
            {
                common::LogDebug("MetadataFetcher", address + ": no output from dialect " +
                                                        ToString(probe.dialect) + " '" + probe.command + "'");
                return std::nullopt;
            }

            std::string value = probe.parse(*output);
            if (value.empty())
            {
                common::LogDebug("MetadataFetcher", address + ": no " + what + " in '" + probe.command + "' output");
                return std::nullopt;
            }
            return value; });

        if (!found)
        {
            if (cancel && cancel->load())
                return UNKNOWN;
            common::LogDebug("MetadataFetcher", address + ": " + what + " unknown after " +
                                                    std::to_string(chain.size()) + " commands");
            return UNKNOWN;
        }
        return *found;
    }
}
