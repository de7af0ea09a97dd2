#include "ConsoleRenderer.hpp"
#include "DisplayName.hpp"
#include "../common/Log.hpp"
#include <iomanip>
#include <mutex>
#include <sstream>

namespace devwatch::client
{
    ConsoleRenderer::ConsoleRenderer(std::ostream &out, std::vector<std::string> hostnameSuffixes, bool clearScreen)
        : m_out(out), m_suffixes(std::move(hostnameSuffixes)), m_clearScreen(clearScreen)
    {
    }

    std::string ConsoleRenderer::Format(const engine::Snapshot &snapshot) const
    {
        std::stringstream ss;
        ss << "Network Device Health Probe (auto-reload & DNS aware)\n"
           << std::string(72, '-') << "\n";

        for (const auto &entry : snapshot.entries)
        {
            ss << std::left << std::setw(18) << entry.Target() << "  "
               << (entry.reachable ? "UP  " : "DOWN")
               << "  hostname: " << DisplayName(entry, m_suffixes);
            if (entry.model != engine::UNKNOWN)
                ss << "  model: " << entry.model;
            ss << "\n";
        }

        ss << std::string(72, '-') << "\n";
        return ss.str();
    }

    void ConsoleRenderer::Emit(const engine::SnapshotPtr &snapshot)
    {
        if (!snapshot)
            return;

        std::string body = Format(*snapshot);

        std::lock_guard<std::mutex> lock(common::OutputMutex());
        if (m_clearScreen)
            m_out << "\033[2J\033[H";
        m_out << body << std::flush;
    }
}
