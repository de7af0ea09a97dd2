#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>

namespace devwatch::common
{
    // Fan-out / fan-in over a fixed number of threads. Run() returns only after every
    // started task has returned. Once *cancel is set, tasks not yet started are skipped.
    class TaskGroup
    {
    public:
        explicit TaskGroup(std::size_t maxWorkers, const std::atomic<bool> *cancel = nullptr);
        virtual ~TaskGroup() = default;

        // Returns the number of tasks that actually ran. If the system refuses more threads,
        // the workers already started take the whole load (or the caller's thread does).
        std::size_t Run(std::size_t count, const std::function<void(std::size_t)> &task);

        std::size_t WorkersFor(std::size_t count) const;

    protected:
        virtual std::thread Spawn(const std::function<void()> &body);

    private:
        std::size_t m_maxWorkers;
        const std::atomic<bool> *m_cancel;
    };
}
