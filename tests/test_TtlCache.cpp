#include <doctest/doctest.h>
#include "Fakes.hpp"
#include "../engine/TtlCache.hpp"

using namespace devwatch;
using namespace std::chrono_literals;

TEST_SUITE("TtlCache")
{
    TEST_CASE("Entry is fresh until the TTL has fully elapsed")
    {
        test::ManualClock clock;
        engine::TtlCache<std::string, std::string> cache(100ms);

        cache.Put("10.0.0.1", "SW1", clock.Now());
        CHECK(cache.IsFresh("10.0.0.1", clock.Now()));

        clock.Advance(99ms);
        REQUIRE(cache.GetFresh("10.0.0.1", clock.Now()).has_value());
        CHECK(*cache.GetFresh("10.0.0.1", clock.Now()) == "SW1");

        clock.Advance(1ms);
        CHECK_FALSE(cache.IsFresh("10.0.0.1", clock.Now()));
        CHECK_FALSE(cache.GetFresh("10.0.0.1", clock.Now()).has_value());
    }

    TEST_CASE("Stale entries are still readable")
    {
        test::ManualClock clock;
        engine::TtlCache<std::string, int> cache(10ms);
        cache.Put("a", 7, clock.Now());
        clock.Advance(1h);

        auto entry = cache.Get("a");
        REQUIRE(entry.has_value());
        CHECK(entry->value == 7);
        CHECK(cache.Size() == 1);
        CHECK_FALSE(cache.Get("b").has_value());
    }

    TEST_CASE("Put replaces value and stamp")
    {
        test::ManualClock clock;
        engine::TtlCache<std::string, int> cache(50ms);
        cache.Put("a", 1, clock.Now());
        clock.Advance(60ms);
        CHECK_FALSE(cache.IsFresh("a", clock.Now()));

        cache.Put("a", 2, clock.Now());
        CHECK(cache.IsFresh("a", clock.Now()));
        CHECK(cache.Get("a")->value == 2);
        CHECK(cache.Size() == 1);
    }
}
