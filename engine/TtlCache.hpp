#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <unordered_map>
#include "../common/Clock.hpp"

namespace devwatch::engine
{
    // Mutex-guarded map of timestamped values. Entries are never evicted; freshness is
    // decided by the reader against the cache's TTL.
    template <typename Key, typename Value>
    class TtlCache
    {
    public:
        struct Entry
        {
            Value value;
            common::TimePoint stamp;
        };

        explicit TtlCache(std::chrono::milliseconds ttl) : m_ttl(ttl) {}

        std::optional<Entry> Get(const Key &key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_entries.find(key);
            if (it == m_entries.end())
                return std::nullopt;
            return it->second;
        }

        std::optional<Value> GetFresh(const Key &key, common::TimePoint now) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_entries.find(key);
            if (it == m_entries.end() || !IsFreshLocked(it->second, now))
                return std::nullopt;
            return it->second.value;
        }

        bool IsFresh(const Key &key, common::TimePoint now) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_entries.find(key);
            return it != m_entries.end() && IsFreshLocked(it->second, now);
        }

        void Put(const Key &key, Value value, common::TimePoint stamp)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_entries[key] = Entry{std::move(value), stamp};
        }

        std::size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_entries.size();
        }

        std::chrono::milliseconds Ttl() const { return m_ttl; }

    private:
        bool IsFreshLocked(const Entry &entry, common::TimePoint now) const
        {
            return now - entry.stamp < m_ttl;
        }

        std::chrono::milliseconds m_ttl;
        mutable std::mutex m_mutex;
        std::unordered_map<Key, Entry> m_entries;
    };
}
