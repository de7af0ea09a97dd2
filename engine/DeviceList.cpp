#include "DeviceList.hpp"
#include "../common/TextUtil.hpp"
#include <fstream>

namespace devwatch::engine
{
    std::vector<std::string> ParseDeviceLines(std::istream &in)
    {
        std::vector<std::string> entries;
        std::string line;
        while (std::getline(in, line))
        {
            std::string entry = common::Trim(line);
            if (!entry.empty())
                entries.push_back(entry);
        }
        return entries;
    }

    DeviceListFile::DeviceListFile(std::string path) : m_path(std::move(path))
    {
    }

    std::optional<std::vector<std::string>> DeviceListFile::Load()
    {
        std::ifstream file(m_path);
        if (!file.is_open())
            return std::nullopt;
        return ParseDeviceLines(file);
    }
}
