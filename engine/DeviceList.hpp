#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace devwatch::engine
{
    class DeviceListSource
    {
    public:
        virtual ~DeviceListSource() = default;

        // Trimmed, non-blank lines; nullopt when the list cannot be read.
        virtual std::optional<std::vector<std::string>> Load() = 0;
    };

    std::vector<std::string> ParseDeviceLines(std::istream &in);

    class DeviceListFile : public DeviceListSource
    {
    public:
        explicit DeviceListFile(std::string path);

        std::optional<std::vector<std::string>> Load() override;

        const std::string &Path() const { return m_path; }

    private:
        std::string m_path;
    };
}
