#pragma once

#include <chrono>
#include "../common/Clock.hpp"

namespace devwatch::engine
{
    // Dim/full phase for DOWN devices. Starts in the "full" phase.
    class BlinkClock
    {
    public:
        explicit BlinkClock(std::chrono::milliseconds interval, common::NowFn now = common::SystemNow());

        // Flips at most once per call, when a full interval has passed since the last flip.
        bool Advance();

        bool Phase() const { return m_phase; }

    private:
        std::chrono::milliseconds m_interval;
        common::NowFn m_now;
        common::TimePoint m_lastFlip;
        bool m_phase;
    };
}
