#pragma once

#include "common.hpp"

#include <functional>

namespace wsnsim
{
    struct TimeStamp
    {
        SimTime time = 0;
        std::uint64_t sequence = 0;

        friend constexpr bool operator<(const TimeStamp &lhs, const TimeStamp &rhs)
        {
            return (lhs.time < rhs.time) || ((lhs.time == rhs.time) && (lhs.sequence < rhs.sequence));
        }
        friend constexpr bool operator==(const TimeStamp &lhs, const TimeStamp &rhs)
        {
            return (lhs.time == rhs.time) && (lhs.sequence == rhs.sequence);
        }
    };

    // Returned by the scheduler; identifies where an event sits on the timeline.
    // There is no cancellation, so the handle is informational only.
    using EventHandle = TimeStamp;

    struct Event
    {
        TimeStamp ts{};
        std::function<void()> continuation;
    };
}
