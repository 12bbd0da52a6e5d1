#pragma once

#include "frame.hpp"
#include "scheduler.hpp"

#include <deque>
#include <functional>
#include <limits>
#include <stdexcept>

namespace wsnsim
{
    // Per-node inbound FIFO through which the medium delivers frames.
    //
    // A receiver that calls get() on an empty endpoint blocks: its continuation is
    // parked until the next put(). Resumptions always go through the scheduler with
    // zero delay, so a delivery never runs receive logic re-entrantly inside the
    // medium's resolution.
    class ChannelEndpoint
    {
    public:
        using Receiver = std::function<void(FramePtr)>;

        static constexpr std::size_t Unbounded = std::numeric_limits<std::size_t>::max();

        ChannelEndpoint(Scheduler &sched, NodeId owner, std::size_t capacity = Unbounded)
            : m_sched(&sched), m_owner(owner), m_capacity(capacity)
        {
            if (m_capacity == 0)
            {
                throw std::invalid_argument("ChannelEndpoint: capacity must be > 0");
            }
        }

        ChannelEndpoint(const ChannelEndpoint &) = delete;
        ChannelEndpoint &operator=(const ChannelEndpoint &) = delete;

        NodeId owner() const noexcept { return m_owner; }
        std::size_t capacity() const noexcept { return m_capacity; }

        // Frames queued and readable now.
        std::size_t size() const noexcept { return m_items.size(); }

        // Frames waiting for space (finite capacity only).
        std::size_t overflow() const noexcept { return m_overflow.size(); }

        // Receivers blocked in get().
        std::size_t waiting() const noexcept { return m_getters.size(); }

        std::uint64_t delivered() const noexcept { return m_delivered; }

        void put(FramePtr frame)
        {
            if (!frame)
            {
                throw std::invalid_argument("ChannelEndpoint::put: null frame");
            }
            ++m_delivered;

            if (m_items.size() < m_capacity)
            {
                m_items.push_back(std::move(frame));
            }
            else
            {
                m_overflow.push_back(std::move(frame));
            }
            serve_();
        }

        void get(Receiver receiver)
        {
            if (!receiver)
            {
                throw std::invalid_argument("ChannelEndpoint::get: null receiver");
            }
            m_getters.push_back(std::move(receiver));
            serve_();
        }

    private:
        // Match queued frames to blocked receivers, FIFO on both sides.
        void serve_()
        {
            while (!m_items.empty() && !m_getters.empty())
            {
                FramePtr frame = std::move(m_items.front());
                m_items.pop_front();
                Receiver receiver = std::move(m_getters.front());
                m_getters.pop_front();

                if (!m_overflow.empty())
                {
                    m_items.push_back(std::move(m_overflow.front()));
                    m_overflow.pop_front();
                }

                m_sched->schedule_after(0, [receiver = std::move(receiver), frame = std::move(frame)]()
                                        { receiver(frame); });
            }
        }

        Scheduler *m_sched = nullptr;
        NodeId m_owner = 0;
        std::size_t m_capacity = Unbounded;
        std::deque<FramePtr> m_items;
        std::deque<FramePtr> m_overflow;
        std::deque<Receiver> m_getters;
        std::uint64_t m_delivered = 0;
    };
}
