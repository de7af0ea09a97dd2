#include "Resolver.hpp"
#include "../common/Log.hpp"
#include "../common/TextUtil.hpp"
#include <exception>

namespace devwatch::engine
{
    Resolver::Resolver(std::shared_ptr<NameLookup> lookup, std::chrono::milliseconds ttl, common::NowFn now)
        : m_lookup(std::move(lookup)), m_now(std::move(now)), m_forward(ttl), m_reverse(ttl)
    {
    }

    std::string Resolver::ReverseName(const std::string &address)
    {
        const auto now = m_now();
        if (auto cached = m_reverse.GetFresh(address, now))
            return *cached;

        std::string name;
        try
        {
            name = m_lookup->Reverse(address).value_or("");
        }
        catch (const std::exception &e)
        {
            common::LogDebug("Resolver", "reverse lookup for " + address + " failed: " + e.what());
            name.clear();
        }

        m_reverse.Put(address, name, now);
        return name;
    }

    Resolution Resolver::Resolve(const std::string &entry)
    {
        const auto now = m_now();
        if (auto cached = m_forward.GetFresh(entry, now))
            return *cached;

        Resolution result;
        if (common::IsIpv4Literal(entry))
        {
            result.address = entry;
            result.canonicalName = ReverseName(entry);
        }
        else
        {
            try
            {
                auto address = m_lookup->Forward(entry);
                if (address)
                {
                    result.address = *address;
                    result.canonicalName = m_lookup->CanonicalName(entry).value_or(entry);
                }
            }
            catch (const std::exception &e)
            {
                common::LogDebug("Resolver", "lookup for " + entry + " failed: " + e.what());
                result = Resolution{};
            }

            if (result.address.empty())
                common::LogDebug("Resolver", entry + " did not resolve");
        }

        m_forward.Put(entry, result, now);
        return result;
    }

    std::vector<DeviceSpec> Resolver::ResolveAll(const std::vector<std::string> &entries)
    {
        std::vector<DeviceSpec> devices;
        devices.reserve(entries.size());

        for (const auto &entry : entries)
        {
            Resolution r = Resolve(entry);
            devices.push_back({entry, r.address, r.canonicalName});
        }
        return devices;
    }
}
