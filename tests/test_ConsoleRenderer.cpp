#include <doctest/doctest.h>
#include "../client/ConsoleRenderer.hpp"
#include "../client/DisplayName.hpp"
#include <memory>
#include <sstream>

using namespace devwatch;

namespace
{
    const std::vector<std::string> SUFFIXES{".elements.local", ".intel.com", ".corp.nandps.com"};

    engine::SnapshotEntry Entry(const std::string &original, const std::string &address, const std::string &hint,
                                bool up, const std::string &hostname = engine::UNKNOWN,
                                const std::string &model = engine::UNKNOWN)
    {
        engine::SnapshotEntry e;
        e.device = {original, address, hint};
        e.reachable = up;
        e.hostname = hostname;
        e.model = model;
        return e;
    }
}

TEST_SUITE("DisplayName")
{
    TEST_CASE("Suffixes are stripped case-insensitively")
    {
        CHECK(client::CleanHostname("core1.elements.local", SUFFIXES) == "core1");
        CHECK(client::CleanHostname("  LEAF2.INTEL.COM ", SUFFIXES) == "LEAF2");
        CHECK(client::CleanHostname("edge.example.org", SUFFIXES) == "edge.example.org");
        CHECK(client::CleanHostname(".intel.com", SUFFIXES) == engine::UNKNOWN);
        CHECK(client::CleanHostname("   ", SUFFIXES) == engine::UNKNOWN);
    }

    TEST_CASE("SSH hostname beats the DNS name")
    {
        CHECK(client::DisplayName(Entry("sw1", "10.0.0.1", "sw1.intel.com", true, "CORE-SW-1"), SUFFIXES) == "CORE-SW-1");
        CHECK(client::DisplayName(Entry("sw1", "10.0.0.1", "sw1.intel.com", true), SUFFIXES) == "sw1");
        CHECK(client::DisplayName(Entry("10.0.0.2", "10.0.0.2", "", false), SUFFIXES) == engine::UNKNOWN);
    }

    TEST_CASE("Labels wrap at separators past the eighth character")
    {
        CHECK(client::WrapLabel("short") == "short");
        CHECK(client::WrapLabel("datacenter-core-switch-01") == "datacenter-core\nswitch-01");
        CHECK(client::WrapLabel("abc-defghijklmnopqrstu") == "abc-defghijklmno\npqrstu");
        CHECK(client::WrapLabel("abcdefgh", 0) == "abcdefgh");
    }
}

TEST_SUITE("ConsoleRenderer")
{
    TEST_CASE("One aligned row per device in list order")
    {
        engine::Snapshot snapshot;
        snapshot.entries.push_back(Entry("10.0.0.1", "10.0.0.1", "", true, "CORE-SW-1", "C9300-48P"));
        snapshot.entries.push_back(Entry("bogus.invalid", "", "", false));

        std::stringstream out;
        client::ConsoleRenderer renderer(out, SUFFIXES, false);
        renderer.Emit(std::make_shared<const engine::Snapshot>(snapshot));

        const std::string text = out.str();
        CHECK(text.find("\033[2J") == std::string::npos);
        CHECK(text.find("Network Device Health Probe (auto-reload & DNS aware)\n") == 0);
        CHECK(text.find("10.0.0.1            UP    hostname: CORE-SW-1  model: C9300-48P\n") != std::string::npos);
        CHECK(text.find("bogus.invalid       DOWN  hostname: unknown\n") != std::string::npos);
        CHECK(text.find("10.0.0.1") < text.find("bogus.invalid"));
    }

    TEST_CASE("Screen is cleared before each frame")
    {
        std::stringstream out;
        client::ConsoleRenderer renderer(out, SUFFIXES);
        renderer.Emit(std::make_shared<const engine::Snapshot>());
        CHECK(out.str().find("\033[2J\033[H") == 0);
    }

    TEST_CASE("Null snapshots are ignored")
    {
        std::stringstream out;
        client::ConsoleRenderer renderer(out, SUFFIXES);
        renderer.Emit(nullptr);
        CHECK(out.str().empty());
    }
}
