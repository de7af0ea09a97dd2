#pragma once

#include <chrono>
#include <functional>

namespace devwatch::common
{
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    // Injected wherever a TTL or interval is checked so tests can move time by hand.
    using NowFn = std::function<TimePoint()>;

    inline NowFn SystemNow()
    {
        return []
        { return Clock::now(); };
    }
}
