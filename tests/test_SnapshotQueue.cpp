#include <doctest/doctest.h>
#include "../client/SnapshotQueue.hpp"
#include <memory>

using namespace devwatch;

namespace
{
    engine::SnapshotPtr Numbered(std::uint64_t cycle)
    {
        auto snapshot = std::make_shared<engine::Snapshot>();
        snapshot->cycle = cycle;
        return snapshot;
    }
}

TEST_SUITE("SnapshotQueue")
{
    TEST_CASE("Nothing pending")
    {
        client::SnapshotQueue queue;
        CHECK(queue.TakeLatest() == nullptr);
    }

    TEST_CASE("Only the newest snapshot reaches the UI")
    {
        client::SnapshotQueue queue(2);
        for (std::uint64_t i = 1; i <= 5; ++i)
            queue.Emit(Numbered(i));

        auto latest = queue.TakeLatest();
        REQUIRE(latest);
        CHECK(latest->cycle == 5);
        CHECK(queue.TakeLatest() == nullptr);
    }

    TEST_CASE("Depth is bounded while the consumer is away")
    {
        common::ThreadSafeQueue<int> queue;
        for (int i = 0; i < 10; ++i)
            queue.PushLatest(i, 3);

        CHECK(queue.Size() == 3);
        CHECK(*queue.TryPop() == 7);
    }

    TEST_CASE("Null snapshots are not queued")
    {
        client::SnapshotQueue queue;
        queue.Emit(nullptr);
        CHECK(queue.TakeLatest() == nullptr);
    }
}
