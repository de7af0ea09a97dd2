#include "NameLookup.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <memory>
#include <netdb.h>
#include <sys/socket.h>

namespace devwatch::engine
{
    namespace
    {
        struct AddrInfoDeleter
        {
            void operator()(addrinfo *info) const
            {
                if (info)
                    freeaddrinfo(info);
            }
        };

        using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

        AddrInfoPtr Lookup(const std::string &host, int flags)
        {
            addrinfo hints;
            std::memset(&hints, 0, sizeof(hints));
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_STREAM;
            hints.ai_flags = flags;

            addrinfo *result = nullptr;
            if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0)
                return nullptr;
            return AddrInfoPtr(result);
        }
    }

    std::optional<std::string> SystemNameLookup::Forward(const std::string &host)
    {
        auto info = Lookup(host, 0);
        for (addrinfo *p = info.get(); p != nullptr; p = p->ai_next)
        {
            if (p->ai_family != AF_INET)
                continue;

            char ip_str[INET_ADDRSTRLEN];
            auto *sin = reinterpret_cast<sockaddr_in *>(p->ai_addr);
            if (inet_ntop(AF_INET, &sin->sin_addr, ip_str, sizeof(ip_str)))
                return std::string(ip_str);
        }
        return std::nullopt;
    }

    std::optional<std::string> SystemNameLookup::CanonicalName(const std::string &host)
    {
        auto info = Lookup(host, AI_CANONNAME);
        if (!info || !info->ai_canonname || info->ai_canonname[0] == '\0')
            return std::nullopt;
        return std::string(info->ai_canonname);
    }

    std::optional<std::string> SystemNameLookup::Reverse(const std::string &address)
    {
        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1)
            return std::nullopt;

        char host[NI_MAXHOST];
        int rc = getnameinfo(reinterpret_cast<sockaddr *>(&addr), sizeof(addr),
                             host, sizeof(host), nullptr, 0, NI_NAMEREQD);
        if (rc != 0)
            return std::nullopt;
        return std::string(host);
    }
}
