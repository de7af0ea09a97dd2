#include <doctest/doctest.h>
#include "Fakes.hpp"
#include "../engine/MetadataCache.hpp"

using namespace devwatch;
using namespace std::chrono_literals;

namespace
{
    struct Fixture
    {
        test::ManualClock clock;
        std::shared_ptr<test::FakeOpener> opener = std::make_shared<test::FakeOpener>();
        std::shared_ptr<engine::MetadataCache> cache =
            std::make_shared<engine::MetadataCache>(120s, 300s, clock.Fn());
        std::shared_ptr<engine::MetadataRefresher> refresher;

        Fixture()
        {
            auto runner = std::make_shared<engine::CredentialedRunner>(
                opener, engine::ExpandCredentials({{"admin", {"cisco"}}}));
            auto fetcher = std::make_shared<engine::MetadataFetcher>(runner);
            refresher = std::make_shared<engine::MetadataRefresher>(fetcher, cache, 4);
        }
    };
}

TEST_SUITE("MetadataCache")
{
    TEST_CASE("Never-fetched devices look up as unknown")
    {
        test::ManualClock clock;
        engine::MetadataCache cache(120s, 300s, clock.Fn());
        auto md = cache.Lookup("10.0.0.1");
        CHECK(md.hostname == engine::UNKNOWN);
        CHECK(md.model == engine::UNKNOWN);
        CHECK(cache.HostnameStale("10.0.0.1"));
        CHECK(cache.ModelStale("10.0.0.1"));
    }

    TEST_CASE("Hostname and model have separate TTLs")
    {
        test::ManualClock clock;
        engine::MetadataCache cache(120s, 300s, clock.Fn());
        cache.StoreHostname("10.0.0.1", "SW1");
        cache.StoreModel("10.0.0.1", "C9300-48P");

        clock.Advance(120s);
        CHECK(cache.HostnameStale("10.0.0.1"));
        CHECK_FALSE(cache.ModelStale("10.0.0.1"));

        clock.Advance(180s);
        CHECK(cache.ModelStale("10.0.0.1"));
        CHECK(cache.Lookup("10.0.0.1").hostname == "SW1");
    }

    TEST_CASE("A failed fetch keeps the previous value and renews the stamp")
    {
        test::ManualClock clock;
        engine::MetadataCache cache(120s, 300s, clock.Fn());
        cache.StoreHostname("10.0.0.1", "SW1");

        clock.Advance(130s);
        cache.StoreHostname("10.0.0.1", engine::UNKNOWN);
        CHECK(cache.Lookup("10.0.0.1").hostname == "SW1");
        CHECK_FALSE(cache.HostnameStale("10.0.0.1"));

        cache.StoreHostname("10.0.0.1", "SW1-NEW");
        CHECK(cache.Lookup("10.0.0.1").hostname == "SW1-NEW");
    }

    TEST_CASE("Refresh only touches stale entries")
    {
        Fixture f;
        f.opener->Accept("10.0.0.1", "cisco",
                         {{"show hostname", "SW1"}, {"show version", "Model Number : C9300-48P"}});

        CHECK(f.refresher->RefreshReachable({"10.0.0.1"}) == 1);
        CHECK(f.cache->Lookup("10.0.0.1").hostname == "SW1");
        CHECK(f.cache->Lookup("10.0.0.1").model == "C9300-48P");

        f.opener->Reset();
        f.clock.Advance(60s);
        CHECK(f.refresher->RefreshReachable({"10.0.0.1"}) == 0);
        CHECK(f.opener->Attempts().empty());

        // Hostname expires first; only its chain runs.
        f.clock.Advance(60s);
        CHECK(f.refresher->RefreshReachable({"10.0.0.1"}) == 1);
        CHECK(f.opener->AttemptsFor("10.0.0.1") == 1);
    }

    TEST_CASE("Duplicate and empty addresses are fetched at most once")
    {
        Fixture f;
        f.opener->Accept("10.0.0.1", "cisco", {{"show hostname", "SW1"}});

        CHECK(f.refresher->RefreshReachable({"10.0.0.1", "", "10.0.0.1"}) == 1);
    }

    TEST_CASE("Values survive while a device is unreachable")
    {
        Fixture f;
        f.opener->Accept("10.0.0.1", "cisco", {{"show hostname", "SW1"}});
        f.refresher->RefreshReachable({"10.0.0.1"});

        // Down devices are never passed to the refresher, so the value stays frozen.
        f.clock.Advance(24h);
        CHECK(f.cache->Lookup("10.0.0.1").hostname == "SW1");
    }

    TEST_CASE("Cancelled refresh does no work")
    {
        Fixture f;
        f.opener->Accept("10.0.0.1", "cisco", {{"show hostname", "SW1"}});
        std::atomic<bool> cancel{true};

        CHECK(f.refresher->RefreshReachable({"10.0.0.1"}, &cancel) == 0);
        CHECK(f.opener->Attempts().empty());
    }
}
