#include "Config.hpp"
#include "Log.hpp"
#include "TextUtil.hpp"
#include <climits>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace devwatch::common
{
    namespace
    {
        constexpr double MAX_SECONDS = 365.0 * 24 * 3600;

        bool ParseSeconds(const std::string &value, std::chrono::milliseconds &out, std::string &error)
        {
            double seconds = 0.0;
            try
            {
                std::size_t used = 0;
                seconds = std::stod(value, &used);
                if (used != value.size())
                    throw std::invalid_argument("trailing characters");
            }
            catch (const std::exception &)
            {
                error = "'" + value + "' is not a number of seconds";
                return false;
            }

            if (seconds < 0.0)
            {
                error = "'" + value + "' must not be negative";
                return false;
            }

            // Also catches nan and inf.
            if (!(seconds <= MAX_SECONDS))
            {
                error = "'" + value + "' exceeds one year";
                return false;
            }

            out = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
            return true;
        }

        bool ParseCount(const std::string &value, long minimum, long &out, std::string &error)
        {
            try
            {
                std::size_t used = 0;
                out = std::stol(value, &used);
                if (used != value.size())
                    throw std::invalid_argument("trailing characters");
            }
            catch (const std::exception &)
            {
                error = "'" + value + "' is not an integer";
                return false;
            }

            if (out < minimum)
            {
                error = "'" + value + "' must be at least " + std::to_string(minimum);
                return false;
            }
            return true;
        }

        bool ParseBool(const std::string &value, bool &out, std::string &error)
        {
            std::string v = ToLower(value);
            if (v == "1" || v == "true" || v == "yes" || v == "on")
                out = true;
            else if (v == "0" || v == "false" || v == "no" || v == "off")
                out = false;
            else
            {
                error = "'" + value + "' is not a boolean";
                return false;
            }
            return true;
        }

        // user:pw1,pw2
        bool ParseCredential(const std::string &value, Credential &out, std::string &error)
        {
            auto colon = value.find(':');
            if (colon == std::string::npos || colon == 0)
            {
                error = "credential must look like user:password[,password...]";
                return false;
            }

            out.username = Trim(value.substr(0, colon));
            out.passwords.clear();

            std::stringstream ss(value.substr(colon + 1));
            std::string password;
            while (std::getline(ss, password, ','))
            {
                if (!password.empty())
                    out.passwords.push_back(password);
            }

            if (out.passwords.empty())
            {
                error = "credential for '" + out.username + "' has no password";
                return false;
            }
            return true;
        }
    }

    EngineConfig DefaultConfig()
    {
        EngineConfig config;
        config.devicesFile = ExecutableDir() + "/devices.txt";
        config.credentials = {{"admin", {"cisco", "Admin123"}}};
        config.hostnameSuffixes = {".elements.local", ".intel.com", ".corp.nandps.com"};
        return config;
    }

    bool ApplyConfigValue(EngineConfig &config, const std::string &key, const std::string &value, std::string &error)
    {
        long count = 0;

        if (key == "devices_file")
        {
            if (value.empty())
            {
                error = "devices_file must not be empty";
                return false;
            }
            config.devicesFile = value;
            return true;
        }
        if (key == "cycle_interval")
            return ParseSeconds(value, config.cycleInterval, error);
        if (key == "reload_interval")
            return ParseSeconds(value, config.reloadInterval, error);
        if (key == "blink_interval")
            return ParseSeconds(value, config.blinkInterval, error);
        if (key == "dns_ttl")
            return ParseSeconds(value, config.dnsTtl, error);
        if (key == "hostname_ttl")
            return ParseSeconds(value, config.hostnameTtl, error);
        if (key == "model_ttl")
            return ParseSeconds(value, config.modelTtl, error);
        if (key == "probe_timeout")
            return ParseSeconds(value, config.probeTimeout, error);
        if (key == "ssh_timeout")
            return ParseSeconds(value, config.sshTimeout, error);
        if (key == "command_timeout")
            return ParseSeconds(value, config.commandTimeout, error);
        if (key == "probe_workers")
        {
            if (!ParseCount(value, 1, count, error))
                return false;
            config.probeWorkers = static_cast<std::size_t>(count);
            return true;
        }
        if (key == "fetch_workers")
        {
            if (!ParseCount(value, 1, count, error))
                return false;
            config.fetchWorkers = static_cast<std::size_t>(count);
            return true;
        }
        if (key == "ssh_port")
        {
            if (!ParseCount(value, 1, count, error))
                return false;
            if (count > 65535)
            {
                error = "ssh_port out of range";
                return false;
            }
            config.sshPort = static_cast<int>(count);
            return true;
        }
        if (key == "verbose")
            return ParseBool(value, config.verbose, error);

        error = "unknown setting '" + key + "'";
        return false;
    }

    bool LoadConfigFile(const std::string &path, EngineConfig &config, std::string &error)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            error = "cannot open " + path;
            return false;
        }

        bool credentialsReplaced = false;
        bool suffixesReplaced = false;

        std::string line;
        int lineNo = 0;
        while (std::getline(file, line))
        {
            ++lineNo;
            auto hash = line.find('#');
            if (hash != std::string::npos)
                line.erase(hash);
            line = Trim(line);
            if (line.empty())
                continue;

            auto eq = line.find('=');
            if (eq == std::string::npos)
            {
                error = path + ":" + std::to_string(lineNo) + ": expected key = value";
                return false;
            }

            std::string key = Trim(line.substr(0, eq));
            std::string value = Trim(line.substr(eq + 1));
            std::string why;

            if (key == "credential")
            {
                Credential credential;
                if (!ParseCredential(value, credential, why))
                {
                    error = path + ":" + std::to_string(lineNo) + ": " + why;
                    return false;
                }
                if (!credentialsReplaced)
                {
                    config.credentials.clear();
                    credentialsReplaced = true;
                }
                config.credentials.push_back(credential);
                continue;
            }

            if (key == "hostname_suffix")
            {
                if (!suffixesReplaced)
                {
                    config.hostnameSuffixes.clear();
                    suffixesReplaced = true;
                }
                if (!value.empty())
                    config.hostnameSuffixes.push_back(value);
                continue;
            }

            if (!ApplyConfigValue(config, key, value, why))
            {
                if (why.rfind("unknown setting", 0) == 0)
                {
                    LogError("Config", path + ":" + std::to_string(lineNo) + ": " + why + ", ignored");
                    continue;
                }
                error = path + ":" + std::to_string(lineNo) + ": " + key + ": " + why;
                return false;
            }
        }

        return true;
    }

    bool ApplyArguments(int argc, char *argv[], EngineConfig &config, std::string &error, bool &showHelp)
    {
        showHelp = false;

        for (int i = 1; i < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                if (i + 1 >= argc)
                {
                    error = "--config needs a path";
                    return false;
                }
                if (!LoadConfigFile(argv[i + 1], config, error))
                    return false;
            }
        }

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto needValue = [&](const char *key) -> bool
            {
                if (i + 1 >= argc)
                {
                    error = arg + " needs a value";
                    return false;
                }
                std::string why;
                if (!ApplyConfigValue(config, key, argv[++i], why))
                {
                    error = arg + ": " + why;
                    return false;
                }
                return true;
            };

            if (arg == "--help" || arg == "-h")
            {
                showHelp = true;
                return true;
            }
            else if (arg == "--config")
            {
                ++i;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--devices")
            {
                if (!needValue("devices_file"))
                    return false;
            }
            else if (arg == "--interval")
            {
                if (!needValue("cycle_interval"))
                    return false;
            }
            else if (arg == "--reload")
            {
                if (!needValue("reload_interval"))
                    return false;
            }
            else
            {
                error = "unknown argument '" + arg + "'";
                return false;
            }
        }

        return true;
    }

    std::string Usage(const std::string &program)
    {
        std::stringstream ss;
        ss << "Usage: " << program << " [options]\n"
           << "  --config <file>     key = value settings file\n"
           << "  --devices <file>    device list (default: devices.txt beside the executable)\n"
           << "  --interval <sec>    pause between polling cycles\n"
           << "  --reload <sec>      device list reload interval\n"
           << "  --verbose           per-device debug output\n";
        return ss.str();
    }

    std::string ExecutableDir()
    {
        char buffer[PATH_MAX];
        ssize_t n = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
        if (n <= 0)
            return ".";

        std::string path(buffer, static_cast<std::size_t>(n));
        auto slash = path.find_last_of('/');
        if (slash == std::string::npos)
            return ".";
        if (slash == 0)
            return "/";
        return path.substr(0, slash);
    }
}
