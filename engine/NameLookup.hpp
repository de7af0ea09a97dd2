#pragma once

#include <optional>
#include <string>

namespace devwatch::engine
{
    class NameLookup
    {
    public:
        virtual ~NameLookup() = default;

        // First IPv4 address for a host name.
        virtual std::optional<std::string> Forward(const std::string &host) = 0;

        // Fully qualified name for a host name, if the resolver knows one.
        virtual std::optional<std::string> CanonicalName(const std::string &host) = 0;

        // PTR name for an IPv4 literal.
        virtual std::optional<std::string> Reverse(const std::string &address) = 0;
    };

    // getaddrinfo / getnameinfo against the system resolver.
    class SystemNameLookup : public NameLookup
    {
    public:
        std::optional<std::string> Forward(const std::string &host) override;
        std::optional<std::string> CanonicalName(const std::string &host) override;
        std::optional<std::string> Reverse(const std::string &address) override;
    };
}
