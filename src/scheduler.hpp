#pragma once

#include "errors.hpp"
#include "event.hpp"
#include "log.hpp"

#include <functional>
#include <limits>
#include <queue>
#include <string>
#include <utility>
#include <vector>

namespace wsnsim
{
    struct SchedulerConfig
    {
        // Optional observer invoked for every fired event, before its continuation runs.
        // Intended for determinism checks: two equivalent runs fire identical stamps.
        std::function<void(TimeStamp)> firedEventSink;

        // Enable extra runtime invariant checks (throws on violation).
#if defined(WSNSIM_ENABLE_INVARIANT_CHECKS_DEFAULT)
        bool enableInvariantChecks = (WSNSIM_ENABLE_INVARIANT_CHECKS_DEFAULT != 0);
#else
        bool enableInvariantChecks = false;
#endif
    };

    // Sequential discrete-event scheduler with a single timeline.
    //
    // Events are ordered by (time, sequence). The sequence is a scheduler-wide counter
    // assigned at scheduling time, so events scheduled for the same tick fire in the
    // order they were scheduled. In particular, a zero-delay event scheduled from
    // inside a handler runs after every same-tick event that was already queued.
    class Scheduler
    {
    public:
        struct Stats
        {
            SimTime now = 0;
            std::size_t pending = 0;
            std::uint64_t scheduled = 0;
            std::uint64_t fired = 0;
            TimeStamp lastFired{0, 0};
        };

        Scheduler() = default;
        explicit Scheduler(SchedulerConfig cfg) : m_cfg(std::move(cfg)) {}

        Scheduler(const Scheduler &) = delete;
        Scheduler &operator=(const Scheduler &) = delete;

        SimTime now() const noexcept { return m_now; }

        bool idle() const noexcept { return m_pending.empty(); }

        std::size_t pending() const noexcept { return m_pending.size(); }

        EventHandle schedule_after(SimDuration delay, std::function<void()> continuation)
        {
            if (delay < 0)
            {
                throw InvalidDelay("schedule_after: negative delay " + std::to_string(delay));
            }
            if (static_cast<std::uint64_t>(delay) > std::numeric_limits<SimTime>::max() - m_now)
            {
                throw InvalidDelay("schedule_after: delay overflows simulated time");
            }
            return enqueue_(m_now + static_cast<SimTime>(delay), std::move(continuation));
        }

        EventHandle schedule_at(SimTime time, std::function<void()> continuation)
        {
            if (time < m_now)
            {
                throw InvalidDelay("schedule_at: time " + std::to_string(time) + " is before now " + std::to_string(m_now));
            }
            return enqueue_(time, std::move(continuation));
        }

        // Fire at most one event. Returns false if the queue was empty.
        bool run_one()
        {
            if (m_pending.empty())
            {
                return false;
            }

            Event ev = m_pending.top();
            m_pending.pop();

            invariant_or_throw_(!(ev.ts.time < m_now), "invariant: event scheduled in the past");
            invariant_or_throw_(m_lastFired < ev.ts || m_fired == 0, "invariant: events fired out of order");

            m_now = ev.ts.time;
            m_lastFired = ev.ts;
            ++m_fired;

            if (m_cfg.firedEventSink)
            {
                m_cfg.firedEventSink(ev.ts);
            }

            Logger::instance().logf(LogLevel::Trace, m_now, "Sched", 0, "fire seq=%llu pending=%zu",
                                    static_cast<unsigned long long>(ev.ts.sequence), m_pending.size());

            // A throwing continuation propagates; the event is already consumed.
            ev.continuation();
            return true;
        }

        // Drain every event. The run terminates when the queue is exhausted.
        void run_until_idle()
        {
            while (run_one())
            {
            }
        }

        // Fire events with time <= limit. Events beyond the limit stay queued.
        void run_until(SimTime limit)
        {
            while (!m_pending.empty() && m_pending.top().ts.time <= limit)
            {
                run_one();
            }
        }

        Stats stats() const
        {
            Stats out;
            out.now = m_now;
            out.pending = m_pending.size();
            out.scheduled = m_nextSeq - 1;
            out.fired = m_fired;
            out.lastFired = m_lastFired;
            return out;
        }

    private:
        struct PendingOrder
        {
            bool operator()(const Event &a, const Event &b) const
            {
                // priority_queue is max-heap, so invert
                return b.ts < a.ts;
            }
        };

        EventHandle enqueue_(SimTime time, std::function<void()> continuation)
        {
            if (!continuation)
            {
                throw std::invalid_argument("Scheduler: null continuation");
            }
            const std::uint64_t seq = m_nextSeq++;
            if (seq == 0)
            {
                throw std::runtime_error("Scheduler: sequence counter overflow (exhausted 2^64-1 sequences)");
            }

            Event ev;
            ev.ts = TimeStamp{time, seq};
            ev.continuation = std::move(continuation);
            m_pending.push(std::move(ev));
            return TimeStamp{time, seq};
        }

        void invariant_or_throw_(bool ok, const char *msg) const
        {
            if (!m_cfg.enableInvariantChecks)
            {
                return;
            }
            if (!ok)
            {
                throw std::runtime_error(msg);
            }
        }

        SchedulerConfig m_cfg;
        std::priority_queue<Event, std::vector<Event>, PendingOrder> m_pending;
        SimTime m_now = 0;
        std::uint64_t m_nextSeq = 1;
        std::uint64_t m_fired = 0;
        TimeStamp m_lastFired{0, 0};
    };

    // Suspend-on-timeout helper for process code: resume `continuation` after `duration`.
    inline EventHandle sleep(Scheduler &sched, SimDuration duration, std::function<void()> continuation)
    {
        return sched.schedule_after(duration, std::move(continuation));
    }
}
