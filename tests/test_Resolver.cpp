#include <doctest/doctest.h>
#include "Fakes.hpp"
#include "../engine/Resolver.hpp"

using namespace devwatch;
using namespace std::chrono_literals;

TEST_SUITE("Resolver")
{
    TEST_CASE("IPv4 literal resolves to itself with its PTR name")
    {
        test::ManualClock clock;
        auto lookup = std::make_shared<test::FakeLookup>();
        lookup->reverse["10.0.0.1"] = "core1.elements.local";
        engine::Resolver resolver(lookup, 300s, clock.Fn());

        auto r = resolver.Resolve("10.0.0.1");
        CHECK(r.address == "10.0.0.1");
        CHECK(r.canonicalName == "core1.elements.local");
        CHECK(lookup->forwardCalls == 0);
    }

    TEST_CASE("IPv4 literal without PTR keeps an empty name")
    {
        test::ManualClock clock;
        auto lookup = std::make_shared<test::FakeLookup>();
        engine::Resolver resolver(lookup, 300s, clock.Fn());

        auto r = resolver.Resolve("10.0.0.9");
        CHECK(r.address == "10.0.0.9");
        CHECK(r.canonicalName.empty());
    }

    TEST_CASE("Host name uses forward address and canonical name")
    {
        test::ManualClock clock;
        auto lookup = std::make_shared<test::FakeLookup>();
        lookup->forward["sw1"] = "10.1.1.1";
        lookup->canonical["sw1"] = "sw1.corp.nandps.com";
        lookup->forward["sw2"] = "10.1.1.2";
        engine::Resolver resolver(lookup, 300s, clock.Fn());

        auto r = resolver.Resolve("sw1");
        CHECK(r.address == "10.1.1.1");
        CHECK(r.canonicalName == "sw1.corp.nandps.com");

        SUBCASE("Without a canonical name the entry itself is the hint")
        {
            auto r2 = resolver.Resolve("sw2");
            CHECK(r2.address == "10.1.1.2");
            CHECK(r2.canonicalName == "sw2");
        }
    }

    TEST_CASE("Failures resolve to empty strings and never throw")
    {
        test::ManualClock clock;
        auto lookup = std::make_shared<test::FakeLookup>();
        lookup->throwing.insert("boom.invalid");
        engine::Resolver resolver(lookup, 300s, clock.Fn());

        engine::Resolution r;
        CHECK_NOTHROW(r = resolver.Resolve("bogus.invalid"));
        CHECK(r.address.empty());
        CHECK(r.canonicalName.empty());

        CHECK_NOTHROW(r = resolver.Resolve("boom.invalid"));
        CHECK(r.address.empty());
    }

    TEST_CASE("Results are cached for the TTL")
    {
        test::ManualClock clock;
        auto lookup = std::make_shared<test::FakeLookup>();
        lookup->forward["sw1"] = "10.1.1.1";
        engine::Resolver resolver(lookup, 300s, clock.Fn());

        resolver.Resolve("sw1");
        resolver.Resolve("sw1");
        CHECK(lookup->forwardCalls == 1);

        lookup->forward["sw1"] = "10.1.1.50";
        clock.Advance(299s);
        CHECK(resolver.Resolve("sw1").address == "10.1.1.1");

        clock.Advance(1s);
        CHECK(resolver.Resolve("sw1").address == "10.1.1.50");
        CHECK(lookup->forwardCalls == 2);
    }

    TEST_CASE("Failed lookups are cached too")
    {
        test::ManualClock clock;
        auto lookup = std::make_shared<test::FakeLookup>();
        engine::Resolver resolver(lookup, 300s, clock.Fn());

        resolver.Resolve("bogus.invalid");
        resolver.Resolve("bogus.invalid");
        CHECK(lookup->forwardCalls == 1);
    }

    TEST_CASE("ResolveAll keeps list order and the raw entry")
    {
        test::ManualClock clock;
        auto lookup = std::make_shared<test::FakeLookup>();
        lookup->forward["sw1"] = "10.1.1.1";
        engine::Resolver resolver(lookup, 300s, clock.Fn());

        auto devices = resolver.ResolveAll({"sw1", "bogus.invalid", "10.0.0.1"});
        REQUIRE(devices.size() == 3);
        CHECK(devices[0].original == "sw1");
        CHECK(devices[0].ProbeTarget() == "10.1.1.1");
        CHECK(devices[1].original == "bogus.invalid");
        CHECK(devices[1].resolvedAddress.empty());
        CHECK(devices[1].ProbeTarget() == "bogus.invalid");
        CHECK(devices[2].ProbeTarget() == "10.0.0.1");
    }
}
