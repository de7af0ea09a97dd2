#include "BlinkClock.hpp"

namespace devwatch::engine
{
    BlinkClock::BlinkClock(std::chrono::milliseconds interval, common::NowFn now)
        : m_interval(interval), m_now(std::move(now)), m_phase(true)
    {
        m_lastFlip = m_now();
    }

    bool BlinkClock::Advance()
    {
        const auto now = m_now();
        if (now - m_lastFlip >= m_interval)
        {
            m_phase = !m_phase;
            m_lastFlip = now;
        }
        return m_phase;
    }
}
