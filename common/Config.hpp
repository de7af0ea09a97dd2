#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace devwatch::common
{
    struct Credential
    {
        std::string username;
        std::vector<std::string> passwords;
    };

    struct EngineConfig
    {
        std::string devicesFile;

        std::chrono::milliseconds cycleInterval{120};
        std::chrono::milliseconds reloadInterval{10000};
        std::chrono::milliseconds blinkInterval{1000};

        std::chrono::milliseconds dnsTtl{300000};
        std::chrono::milliseconds hostnameTtl{120000};
        std::chrono::milliseconds modelTtl{300000};

        std::chrono::milliseconds probeTimeout{1000};
        std::size_t probeWorkers = 32;
        std::size_t fetchWorkers = 16;

        int sshPort = 22;
        std::chrono::milliseconds sshTimeout{3000};
        std::chrono::milliseconds commandTimeout{3000};
        std::vector<Credential> credentials;

        std::vector<std::string> hostnameSuffixes;
        bool verbose = false;
    };

    // Built-in defaults; devicesFile points at devices.txt beside the executable.
    EngineConfig DefaultConfig();

    // Applies one scalar setting ("reload_interval", "ssh_port", ...). Durations are seconds.
    bool ApplyConfigValue(EngineConfig &config, const std::string &key, const std::string &value, std::string &error);

    // key = value lines, '#' comments. "credential = user:pw1,pw2" and "hostname_suffix = .x"
    // may repeat; the first occurrence of each replaces the built-in list.
    bool LoadConfigFile(const std::string &path, EngineConfig &config, std::string &error);

    // --config is applied before the other flags so they override the file.
    bool ApplyArguments(int argc, char *argv[], EngineConfig &config, std::string &error, bool &showHelp);

    std::string Usage(const std::string &program);

    std::string ExecutableDir();
}
