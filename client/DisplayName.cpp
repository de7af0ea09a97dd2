#include "DisplayName.hpp"
#include "../common/TextUtil.hpp"
#include <algorithm>

namespace devwatch::client
{
    std::string CleanHostname(const std::string &name, const std::vector<std::string> &suffixes)
    {
        std::string h = common::Trim(name);
        if (h.empty())
            return engine::UNKNOWN;

        for (const auto &suffix : suffixes)
        {
            if (!suffix.empty() && common::EndsWithIgnoreCase(h, suffix))
            {
                h.erase(h.size() - suffix.size());
                break;
            }
        }
        return h.empty() ? engine::UNKNOWN : h;
    }

    std::string DisplayName(const engine::SnapshotEntry &entry, const std::vector<std::string> &suffixes)
    {
        if (entry.hostname != engine::UNKNOWN && !entry.hostname.empty())
            return CleanHostname(entry.hostname, suffixes);
        if (!entry.device.displayNameHint.empty())
            return CleanHostname(entry.device.displayNameHint, suffixes);
        return engine::UNKNOWN;
    }

    std::string WrapLabel(const std::string &text, std::size_t width)
    {
        if (width == 0 || text.size() <= width)
            return text;

        std::string wrapped;
        std::string rest = text;
        while (rest.size() > width)
        {
            std::string window = rest.substr(0, width);
            auto dash = window.rfind('-');
            auto dot = window.rfind('.');

            std::size_t cut = std::string::npos;
            if (dash != std::string::npos && dot != std::string::npos)
                cut = std::max(dash, dot);
            else if (dash != std::string::npos)
                cut = dash;
            else
                cut = dot;

            if (cut != std::string::npos && cut >= 8)
            {
                wrapped += rest.substr(0, cut) + "\n";
                rest = rest.substr(cut + 1);
            }
            else
            {
                wrapped += window + "\n";
                rest = rest.substr(width);
            }
        }
        return wrapped + rest;
    }
}
