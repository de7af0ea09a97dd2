#include "MetadataCache.hpp"
#include "Device.hpp"
#include "../common/Log.hpp"
#include "../common/TaskGroup.hpp"
#include <exception>
#include <unordered_set>

namespace devwatch::engine
{
    MetadataCache::MetadataCache(std::chrono::milliseconds hostnameTtl, std::chrono::milliseconds modelTtl,
                                 common::NowFn now)
        : m_now(std::move(now)), m_hostnames(hostnameTtl), m_models(modelTtl)
    {
    }

    bool MetadataCache::HostnameStale(const std::string &address) const
    {
        return !m_hostnames.IsFresh(address, m_now());
    }

    bool MetadataCache::ModelStale(const std::string &address) const
    {
        return !m_models.IsFresh(address, m_now());
    }

    void MetadataCache::Store(TtlCache<std::string, std::string> &cache, const std::string &address,
                              const std::string &value, common::TimePoint now)
    {
        if (value == UNKNOWN)
        {
            auto previous = cache.Get(address);
            if (previous && previous->value != UNKNOWN)
            {
                cache.Put(address, previous->value, now);
                return;
            }
        }
        cache.Put(address, value, now);
    }

    void MetadataCache::StoreHostname(const std::string &address, const std::string &hostname)
    {
        Store(m_hostnames, address, hostname, m_now());
    }

    void MetadataCache::StoreModel(const std::string &address, const std::string &model)
    {
        Store(m_models, address, model, m_now());
    }

    DeviceMetadata MetadataCache::Lookup(const std::string &address) const
    {
        DeviceMetadata metadata{UNKNOWN, UNKNOWN};
        if (auto h = m_hostnames.Get(address))
            metadata.hostname = h->value;
        if (auto m = m_models.Get(address))
            metadata.model = m->value;
        return metadata;
    }

    MetadataRefresher::MetadataRefresher(std::shared_ptr<MetadataFetcher> fetcher, std::shared_ptr<MetadataCache> cache,
                                         std::size_t maxWorkers)
        : m_fetcher(std::move(fetcher)), m_cache(std::move(cache)), m_maxWorkers(maxWorkers)
    {
    }

    void MetadataRefresher::RefreshOne(const std::string &address, bool hostnameStale, bool modelStale,
                                       const std::atomic<bool> *cancel)
    {
        auto cancelled = [cancel]
        { return cancel && cancel->load(); };

        if (hostnameStale)
        {
            std::string hostname = UNKNOWN;
            try
            {
                hostname = m_fetcher->FetchHostname(address, cancel);
            }
            catch (const std::exception &e)
            {
                common::LogError("MetadataFetcher", address + ": hostname fetch failed: " + e.what());
            }

            // An interrupted fetch is not a failed one; leave the entry stale.
            if (cancelled())
                return;
            m_cache->StoreHostname(address, hostname);
        }

        if (modelStale && !cancelled())
        {
            std::string model = UNKNOWN;
            try
            {
                model = m_fetcher->FetchModel(address, cancel);
            }
            catch (const std::exception &e)
            {
                common::LogError("MetadataFetcher", address + ": model fetch failed: " + e.what());
            }
            if (cancelled())
                return;
            m_cache->StoreModel(address, model);
        }
    }

    std::size_t MetadataRefresher::RefreshReachable(const std::vector<std::string> &reachableAddresses,
                                                    const std::atomic<bool> *cancel)
    {
        struct Work
        {
            std::string address;
            bool hostnameStale;
            bool modelStale;
        };

        std::vector<Work> work;
        std::unordered_set<std::string> seen;
        for (const auto &address : reachableAddresses)
        {
            if (address.empty() || !seen.insert(address).second)
                continue;

            bool hostnameStale = m_cache->HostnameStale(address);
            bool modelStale = m_cache->ModelStale(address);
            if (hostnameStale || modelStale)
                work.push_back({address, hostnameStale, modelStale});
        }

        if (work.empty())
            return 0;

        common::LogDebug("MetadataFetcher", "refreshing " + std::to_string(work.size()) + " device(s)");

        common::TaskGroup group(m_maxWorkers, cancel);
        return group.Run(work.size(), [&](std::size_t i)
                         { RefreshOne(work[i].address, work[i].hostnameStale, work[i].modelStale, cancel); });
    }
}
