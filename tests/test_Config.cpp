#include <doctest/doctest.h>
#include "../common/Config.hpp"
#include <cstdio>
#include <fstream>
#include <unistd.h>

using namespace devwatch;
using namespace std::chrono_literals;

namespace
{
    struct Args
    {
        explicit Args(std::vector<std::string> words) : storage(std::move(words))
        {
            for (auto &w : storage)
                pointers.push_back(&w[0]);
        }

        int argc() const { return static_cast<int>(pointers.size()); }
        char **argv() { return pointers.data(); }

        std::vector<std::string> storage;
        std::vector<char *> pointers;
    };

    std::string WriteTemp(const char *name, const std::string &contents)
    {
        std::string path = "/tmp/devwatch_" + std::to_string(::getpid()) + "_" + name;
        std::ofstream out(path);
        out << contents;
        return path;
    }
}

TEST_SUITE("Config")
{
    TEST_CASE("Built-in defaults")
    {
        auto config = common::DefaultConfig();
        CHECK(config.cycleInterval == 120ms);
        CHECK(config.reloadInterval == 10s);
        CHECK(config.blinkInterval == 1s);
        CHECK(config.dnsTtl == 300s);
        CHECK(config.hostnameTtl == 120s);
        CHECK(config.modelTtl == 300s);
        CHECK(config.probeWorkers == 32);
        CHECK(config.fetchWorkers == 16);
        CHECK(config.sshPort == 22);
        CHECK(config.sshTimeout == 3s);
        REQUIRE(config.credentials.size() == 1);
        CHECK(config.credentials[0].username == "admin");
        CHECK(config.credentials[0].passwords == std::vector<std::string>{"cisco", "Admin123"});
        CHECK(config.hostnameSuffixes.size() == 3);
        CHECK(config.devicesFile.size() > std::string("/devices.txt").size());
    }

    TEST_CASE("Scalar settings are validated")
    {
        auto config = common::DefaultConfig();
        std::string error;

        CHECK(common::ApplyConfigValue(config, "reload_interval", "2.5", error));
        CHECK(config.reloadInterval == 2500ms);

        CHECK(common::ApplyConfigValue(config, "probe_workers", "8", error));
        CHECK(config.probeWorkers == 8);

        CHECK_FALSE(common::ApplyConfigValue(config, "probe_workers", "0", error));
        CHECK_FALSE(common::ApplyConfigValue(config, "ssh_port", "70000", error));
        CHECK_FALSE(common::ApplyConfigValue(config, "dns_ttl", "-1", error));
        CHECK_FALSE(common::ApplyConfigValue(config, "dns_ttl", "5s", error));

        CHECK_FALSE(common::ApplyConfigValue(config, "ssh_timeout", "1e300", error));
        CHECK(error == "'1e300' exceeds one year");
        CHECK_FALSE(common::ApplyConfigValue(config, "ssh_timeout", "inf", error));
        CHECK_FALSE(common::ApplyConfigValue(config, "ssh_timeout", "nan", error));
        CHECK(config.sshTimeout == 3s);
        CHECK(common::ApplyConfigValue(config, "model_ttl", "31536000", error));

        CHECK_FALSE(common::ApplyConfigValue(config, "colour", "red", error));
        CHECK(error == "unknown setting 'colour'");
    }

    TEST_CASE("Config file replaces list settings on first occurrence")
    {
        const std::string path = WriteTemp("devwatch.conf",
                                           "# comment\n"
                                           "devices_file = /etc/devwatch/devices.txt\n"
                                           "hostname_ttl = 60   # seconds\n"
                                           "credential = ops:one,two\n"
                                           "credential = admin:three\n"
                                           "hostname_suffix = .lab.local\n"
                                           "something_else = 1\n");

        auto config = common::DefaultConfig();
        std::string error;
        REQUIRE(common::LoadConfigFile(path, config, error));

        CHECK(config.devicesFile == "/etc/devwatch/devices.txt");
        CHECK(config.hostnameTtl == 60s);
        REQUIRE(config.credentials.size() == 2);
        CHECK(config.credentials[0].username == "ops");
        CHECK(config.credentials[0].passwords == std::vector<std::string>{"one", "two"});
        CHECK(config.credentials[1].passwords == std::vector<std::string>{"three"});
        CHECK(config.hostnameSuffixes == std::vector<std::string>{".lab.local"});

        std::remove(path.c_str());
    }

    TEST_CASE("Malformed config lines are errors")
    {
        auto config = common::DefaultConfig();
        std::string error;

        const std::string noEquals = WriteTemp("bad1.conf", "reload_interval 5\n");
        CHECK_FALSE(common::LoadConfigFile(noEquals, config, error));
        CHECK(error.find(":1:") != std::string::npos);

        const std::string badCredential = WriteTemp("bad2.conf", "credential = nobody\n");
        CHECK_FALSE(common::LoadConfigFile(badCredential, config, error));

        CHECK_FALSE(common::LoadConfigFile("/nonexistent/devwatch.conf", config, error));

        std::remove(noEquals.c_str());
        std::remove(badCredential.c_str());
    }

    TEST_CASE("Command-line flags override the config file")
    {
        const std::string path = WriteTemp("flags.conf", "reload_interval = 30\ncycle_interval = 1\n");
        Args args({"devwatch", "--reload", "5", "--config", path, "--devices", "/tmp/list.txt", "-v"});

        auto config = common::DefaultConfig();
        std::string error;
        bool showHelp = true;
        REQUIRE(common::ApplyArguments(args.argc(), args.argv(), config, error, showHelp));

        CHECK_FALSE(showHelp);
        CHECK(config.reloadInterval == 5s);
        CHECK(config.cycleInterval == 1s);
        CHECK(config.devicesFile == "/tmp/list.txt");
        CHECK(config.verbose);

        std::remove(path.c_str());
    }

    TEST_CASE("Bad arguments")
    {
        auto config = common::DefaultConfig();
        std::string error;
        bool showHelp = false;

        Args unknown({"devwatch", "--frobnicate"});
        CHECK_FALSE(common::ApplyArguments(unknown.argc(), unknown.argv(), config, error, showHelp));
        CHECK(error == "unknown argument '--frobnicate'");

        Args missing({"devwatch", "--interval"});
        CHECK_FALSE(common::ApplyArguments(missing.argc(), missing.argv(), config, error, showHelp));

        Args help({"devwatch", "--help"});
        CHECK(common::ApplyArguments(help.argc(), help.argv(), config, error, showHelp));
        CHECK(showHelp);
        CHECK(common::Usage("devwatch").find("--devices") != std::string::npos);
    }
}
