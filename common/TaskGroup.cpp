#include "TaskGroup.hpp"
#include "Log.hpp"
#include <algorithm>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace devwatch::common
{
    TaskGroup::TaskGroup(std::size_t maxWorkers, const std::atomic<bool> *cancel)
        : m_maxWorkers(std::max<std::size_t>(1, maxWorkers)), m_cancel(cancel)
    {
    }

    std::thread TaskGroup::Spawn(const std::function<void()> &body)
    {
        return std::thread(body);
    }

    std::size_t TaskGroup::WorkersFor(std::size_t count) const
    {
        return std::min(m_maxWorkers, count);
    }

    std::size_t TaskGroup::Run(std::size_t count, const std::function<void(std::size_t)> &task)
    {
        if (count == 0)
            return 0;

        std::atomic<std::size_t> next{0};
        std::atomic<std::size_t> ran{0};

        auto drain = [&]()
        {
            while (true)
            {
                if (m_cancel && m_cancel->load())
                    return;

                std::size_t index = next.fetch_add(1);
                if (index >= count)
                    return;

                task(index);
                ++ran;
            }
        };

        const std::size_t workers = WorkersFor(count);
        if (workers == 1)
        {
            drain();
            return ran;
        }

        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i)
        {
            try
            {
                threads.push_back(Spawn(drain));
            }
            catch (const std::system_error &e)
            {
                LogError("TaskGroup", "started " + std::to_string(threads.size()) + " of " +
                                          std::to_string(workers) + " workers: " + e.what());
                break;
            }
        }

        if (threads.empty())
            drain();

        for (auto &t : threads)
        {
            if (t.joinable())
                t.join();
        }

        return ran;
    }
}
