#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "MetadataFetcher.hpp"
#include "TtlCache.hpp"
#include "../common/Clock.hpp"

namespace devwatch::engine
{
    struct DeviceMetadata
    {
        std::string hostname;
        std::string model;
    };

    // Last-known hostname and model per resolved address, each with its own TTL. Values
    // are only written by a fetch, and fetches only happen for reachable devices, so a
    // device that goes down keeps showing what it last reported.
    class MetadataCache
    {
    public:
        MetadataCache(std::chrono::milliseconds hostnameTtl, std::chrono::milliseconds modelTtl,
                      common::NowFn now = common::SystemNow());

        bool HostnameStale(const std::string &address) const;
        bool ModelStale(const std::string &address) const;

        // A failed fetch ("unknown") keeps an earlier real value and only renews its stamp.
        void StoreHostname(const std::string &address, const std::string &hostname);
        void StoreModel(const std::string &address, const std::string &model);

        // Last-known values, "unknown" for anything never fetched.
        DeviceMetadata Lookup(const std::string &address) const;

    private:
        static void Store(TtlCache<std::string, std::string> &cache, const std::string &address,
                          const std::string &value, common::TimePoint now);

        common::NowFn m_now;
        TtlCache<std::string, std::string> m_hostnames;
        TtlCache<std::string, std::string> m_models;
    };

    // Cache-access layer around MetadataFetcher: refreshes the stale entries of reachable
    // devices concurrently, one work item per device.
    class MetadataRefresher
    {
    public:
        MetadataRefresher(std::shared_ptr<MetadataFetcher> fetcher, std::shared_ptr<MetadataCache> cache,
                          std::size_t maxWorkers);

        // Returns the number of devices that were fetched. A stop request abandons the device
        // being fetched without storing anything for it.
        std::size_t RefreshReachable(const std::vector<std::string> &reachableAddresses,
                                     const std::atomic<bool> *cancel = nullptr);

    private:
        void RefreshOne(const std::string &address, bool hostnameStale, bool modelStale,
                        const std::atomic<bool> *cancel);

        std::shared_ptr<MetadataFetcher> m_fetcher;
        std::shared_ptr<MetadataCache> m_cache;
        std::size_t m_maxWorkers;
    };
}
