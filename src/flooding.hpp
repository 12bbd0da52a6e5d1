#pragma once

#include "frame.hpp"
#include "node.hpp"
#include "random.hpp"

#include <cstdint>
#include <memory>

namespace wsnsim
{
    namespace detail
    {
        inline void flood_loop(Node &node, FramePtr frame, std::int64_t remaining)
        {
            if (remaining <= 0)
            {
                return;
            }
            sleep(node.scheduler(), node.config().guardTime, [&node, frame = std::move(frame), remaining]() mutable
                  {
                      node.send(frame);
                      flood_loop(node, std::move(frame), remaining - 1); });
        }
    }

    // Relay `frame` `remaining` more times, sleeping one guard time before each send.
    // The loop starts one zero-delay step after the call. A send that lands while the
    // radio is still locked is skipped by the radio itself, so back-to-back relays
    // alternate between sent and skipped.
    inline void run_flood_process(Node &node, FramePtr frame, std::int64_t remaining)
    {
        node.scheduler().schedule_after(0, [&node, frame = std::move(frame), remaining]() mutable
                                        { detail::flood_loop(node, std::move(frame), remaining); });
    }

    // Relays every flood it sees for the first time.
    class SensorBehavior final : public INodeBehavior
    {
    public:
        const char *name() const noexcept override { return "Sensor"; }

        void on_frame(Node &node, const FramePtr &frame, bool newFlood) override
        {
            if (frame->type == FrameType::FloodBeacon && newFlood)
            {
                run_flood_process(node, frame, node.config().maxTransmissions);
            }
        }
    };

    // Initiates a single flood `startDelay` ticks after start, then behaves like a relay
    // for floods it has not seen.
    class SinkBehavior final : public INodeBehavior
    {
    public:
        static constexpr SimDuration DefaultStartDelay = 100;

        explicit SinkBehavior(RandomStream &rng, SimDuration startDelay = DefaultStartDelay)
            : m_rng(&rng), m_startDelay(startDelay)
        {
        }

        const char *name() const noexcept override { return "Sink"; }

        std::int64_t sequence() const noexcept { return m_seq; }

        // Flood id of the last triggered flood (0 before the first).
        std::uint64_t last_flood_id() const noexcept { return m_lastFloodId; }

        void on_start(Node &node) override
        {
            sleep(node.scheduler(), m_startDelay, [this, &node]()
                  { trigger_flood(node); });
        }

        void on_frame(Node &node, const FramePtr &frame, bool newFlood) override
        {
            if (frame->type == FrameType::FloodBeacon && newFlood)
            {
                run_flood_process(node, frame, node.config().maxTransmissions);
            }
        }

        void trigger_flood(Node &node)
        {
            ++m_seq;

            // 0 would be indistinguishable from "no flood yet".
            std::uint64_t floodId = 0;
            while (floodId == 0)
            {
                floodId = m_rng->next_u64();
            }
            m_lastFloodId = floodId;

            node.record_flood(floodId);

            FramePtr frame = make_flood_beacon(node.id(), m_seq, floodId);
            node.debug_log("->  flooding %s", describe(*frame).c_str());
            node.send(frame);
            run_flood_process(node, std::move(frame), node.config().maxTransmissions);
        }

    private:
        RandomStream *m_rng = nullptr;
        SimDuration m_startDelay = DefaultStartDelay;
        std::int64_t m_seq = -1;
        std::uint64_t m_lastFloodId = 0;
    };
}
