#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "Device.hpp"
#include "NameLookup.hpp"
#include "TtlCache.hpp"
#include "../common/Clock.hpp"

namespace devwatch::engine
{
    struct Resolution
    {
        std::string address;
        std::string canonicalName;

        bool operator==(const Resolution &other) const
        {
            return address == other.address && canonicalName == other.canonicalName;
        }
    };

    // Device-list entry -> (address, canonical name). Forward and reverse results are each
    // cached for the DNS TTL; lookups never throw and failures resolve to empty strings.
    class Resolver
    {
    public:
        Resolver(std::shared_ptr<NameLookup> lookup, std::chrono::milliseconds ttl,
                 common::NowFn now = common::SystemNow());

        Resolution Resolve(const std::string &entry);
        std::string ReverseName(const std::string &address);

        std::vector<DeviceSpec> ResolveAll(const std::vector<std::string> &entries);

    private:
        std::shared_ptr<NameLookup> m_lookup;
        common::NowFn m_now;

        TtlCache<std::string, Resolution> m_forward;
        TtlCache<std::string, std::string> m_reverse;
    };
}
