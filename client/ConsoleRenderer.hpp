#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "../engine/Snapshot.hpp"

namespace devwatch::client
{
    class ConsoleRenderer : public engine::SnapshotSink
    {
    public:
        ConsoleRenderer(std::ostream &out, std::vector<std::string> hostnameSuffixes, bool clearScreen = true);

        void Emit(const engine::SnapshotPtr &snapshot) override;

        // The table body without the screen-clear sequence.
        std::string Format(const engine::Snapshot &snapshot) const;

    private:
        std::ostream &m_out;
        std::vector<std::string> m_suffixes;
        bool m_clearScreen;
    };
}
