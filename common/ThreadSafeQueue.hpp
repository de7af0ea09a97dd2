#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace devwatch::common
{
    // Non-blocking handoff between a producer thread and a polling consumer.
    template <typename T>
    class ThreadSafeQueue
    {
    public:
        // Drops the oldest items so a slow consumer only ever sees the newest maxDepth.
        void PushLatest(T value, std::size_t maxDepth)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_queue.push(std::move(value));
            while (maxDepth > 0 && m_queue.size() > maxDepth)
                m_queue.pop();
        }

        std::optional<T> TryPop()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }

        std::size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

    private:
        std::queue<T> m_queue;
        mutable std::mutex m_mutex;
    };
}
