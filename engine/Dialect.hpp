#pragma once

#include <functional>
#include <string>
#include <vector>

namespace devwatch::engine
{
    // Two command-line families: A is NX-OS style, B is IOS-XE style.
    enum class Dialect
    {
        A,
        B
    };

    const char *ToString(Dialect dialect);

    using OutputParser = std::function<std::string(const std::string &output)>;

    struct CommandProbe
    {
        Dialect dialect;
        std::string command;
        OutputParser parse;
    };

    // show hostname (A), then show running-config | include ^hostname (B).
    std::vector<CommandProbe> DefaultHostnameChain();

    // show version (B), show hardware (A), show module (A).
    std::vector<CommandProbe> DefaultModelChain();
}
