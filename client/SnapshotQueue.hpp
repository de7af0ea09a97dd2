#pragma once

#include <optional>
#include "../common/ThreadSafeQueue.hpp"
#include "../engine/Snapshot.hpp"

namespace devwatch::client
{
    // Hands snapshots from the orchestrator thread to a UI thread. Only the newest few are
    // kept when the UI falls behind.
    class SnapshotQueue : public engine::SnapshotSink
    {
    public:
        explicit SnapshotQueue(std::size_t maxDepth = 2) : m_maxDepth(maxDepth) {}

        void Emit(const engine::SnapshotPtr &snapshot) override
        {
            if (snapshot)
                m_queue.PushLatest(snapshot, m_maxDepth);
        }

        // Newest pending snapshot, discarding older ones.
        engine::SnapshotPtr TakeLatest()
        {
            engine::SnapshotPtr latest;
            while (auto next = m_queue.TryPop())
                latest = *next;
            return latest;
        }

    private:
        std::size_t m_maxDepth;
        common::ThreadSafeQueue<engine::SnapshotPtr> m_queue;
    };
}
