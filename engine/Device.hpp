#pragma once

#include <string>

namespace devwatch::engine
{
    inline constexpr const char *UNKNOWN = "unknown";

    struct DeviceSpec
    {
        std::string original;        // trimmed line from the device list
        std::string resolvedAddress; // empty when name resolution failed
        std::string displayNameHint; // canonical DNS name, may be empty

        // Address to probe; the raw entry when unresolved.
        const std::string &ProbeTarget() const
        {
            return resolvedAddress.empty() ? original : resolvedAddress;
        }

        bool operator==(const DeviceSpec &other) const
        {
            return original == other.original &&
                   resolvedAddress == other.resolvedAddress &&
                   displayNameHint == other.displayNameHint;
        }

        bool operator!=(const DeviceSpec &other) const { return !(*this == other); }
    };
}
