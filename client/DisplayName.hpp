#pragma once

#include <string>
#include <vector>
#include "../engine/Snapshot.hpp"

namespace devwatch::client
{
    // Trims and strips the first matching domain suffix (case-insensitive); "unknown" if
    // nothing is left.
    std::string CleanHostname(const std::string &name, const std::vector<std::string> &suffixes);

    // SSH hostname, else cleaned DNS name, else "unknown".
    std::string DisplayName(const engine::SnapshotEntry &entry, const std::vector<std::string> &suffixes);

    // Soft wrap at the last '-' or '.' inside the window when it falls at index 8 or later,
    // otherwise a hard cut at width.
    std::string WrapLabel(const std::string &text, std::size_t width = 16);
}
