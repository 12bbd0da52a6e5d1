#pragma once

#include "channel.hpp"
#include "errors.hpp"
#include "frame.hpp"
#include "log.hpp"
#include "medium.hpp"
#include "radio.hpp"
#include "scheduler.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace wsnsim
{
    struct NodeConfig
    {
        NodeId id = 0;
        Position position{};

        // Chebyshev distance to the sink (informational, used in logs and results).
        std::uint32_t hop = 0;

        // Number of relays a node performs after first reception of a flood.
        std::int64_t maxTransmissions = 1;

        // Ticks the radio stays in Transmitting after a send; also the spacing between relays.
        SimDuration guardTime = 50;

        double txRange = 1.5;
        ChannelId channel = 7;

        bool debugPosition = false;
        bool debugRadio = false;
        bool debugSensor = false;
    };

    class Node;

    // Protocol layered on top of the radio core. Sink and Sensor differ only here.
    class INodeBehavior
    {
    public:
        virtual ~INodeBehavior() = default;

        virtual const char *name() const noexcept = 0;

        // Called once when the node starts (optional hook).
        virtual void on_start(Node &) {}

        // A frame passed admission. `newFlood` is true if it is a flood beacon whose id
        // this node had not seen before this reception.
        virtual void on_frame(Node &node, const FramePtr &frame, bool newFlood) = 0;
    };

    // Per-node process: half-duplex radio, admission filter and flood bookkeeping.
    class Node
    {
    public:
        enum class RadioState : std::uint8_t
        {
            Listening = 0,
            Transmitting = 1,
        };

        struct Stats
        {
            std::uint64_t txCount = 0;
            std::uint64_t txIgnoredBusy = 0;
            std::uint64_t rxAdmitted = 0;
            std::uint64_t rxDroppedBusy = 0;
            std::uint64_t rxDroppedNotForUs = 0;
        };

        Node(Scheduler &sched, Medium &medium, NodeConfig cfg, std::unique_ptr<INodeBehavior> behavior)
            : m_sched(&sched), m_medium(&medium), m_cfg(cfg), m_behavior(std::move(behavior))
        {
            if (m_cfg.id == BroadcastId)
            {
                throw std::invalid_argument("Node: id 0 is reserved for broadcast");
            }
            if (!m_behavior)
            {
                throw std::invalid_argument("Node: null behavior");
            }
            if (m_cfg.guardTime < 0)
            {
                throw InvalidDelay("Node: negative guard time");
            }
            m_radio.position = m_cfg.position;
            m_radio.txRange = m_cfg.txRange;
            m_radio.channel = m_cfg.channel;
        }

        Node(const Node &) = delete;
        Node &operator=(const Node &) = delete;

        NodeId id() const noexcept { return m_cfg.id; }
        const NodeConfig &config() const noexcept { return m_cfg; }
        const RadioProfile &radio() const noexcept { return m_radio; }
        const INodeBehavior &behavior() const noexcept { return *m_behavior; }

        Scheduler &scheduler() noexcept { return *m_sched; }
        SimTime now() const noexcept { return m_sched->now(); }

        RadioState radio_state() const noexcept { return m_state; }
        bool rx_enabled() const noexcept { return m_state == RadioState::Listening; }

        const Stats &stats() const noexcept { return m_stats; }
        std::uint64_t tx_count() const noexcept { return m_stats.txCount; }

        const std::set<std::uint64_t> &flood_ids() const noexcept { return m_floodIds; }
        const std::map<std::uint64_t, std::set<SimTime>> &flood_times() const noexcept { return m_floodTimes; }

        bool has_seen_flood(std::uint64_t floodId) const { return m_floodIds.count(floodId) != 0; }

        std::optional<SimTime> first_reception(std::uint64_t floodId) const
        {
            auto it = m_floodTimes.find(floodId);
            if (it == m_floodTimes.end() || it->second.empty())
            {
                return std::nullopt;
            }
            return *it->second.begin();
        }

        bool started() const noexcept { return m_started; }

        // Attach to the medium, then start the receive loop and the behavior. Idempotent.
        // A node that has not started is invisible to the medium.
        void start()
        {
            if (m_started)
            {
                return;
            }
            m_started = true;
            m_inbox = &m_medium->attach_endpoint(m_cfg.id);

            if (m_cfg.debugPosition)
            {
                debug_log("    new %s node (%g|%g)", m_behavior->name(), m_cfg.position.x, m_cfg.position.y);
            }

            receive_next_();
            m_behavior->on_start(*this);
        }

        void set_channel(ChannelId channel) noexcept { m_radio.channel = channel; }

        // Listening -> Transmitting. Ignored (returns false) while the radio is still
        // inside the guard time of a previous send, including the tick it ends on when
        // the caller's wake-up was queued before the re-enable.
        bool send(const FramePtr &frame)
        {
            if (m_state != RadioState::Listening)
            {
                ++m_stats.txIgnoredBusy;
                return false;
            }

            m_state = RadioState::Transmitting;
            ++m_stats.txCount;
            if (m_cfg.debugRadio)
            {
                debug_log("DBG %u -> %u", static_cast<unsigned>(m_cfg.id), static_cast<unsigned>(frame->dst));
            }
            m_medium->send(frame, m_cfg.id);

            // The re-enable timer is armed one zero-delay step after the send. A relay loop
            // that sleeps right after this send therefore wakes first on the re-enable tick
            // and finds the radio still locked.
            m_sched->schedule_after(0, [this]()
                                    { m_sched->schedule_after(m_cfg.guardTime, [this]()
                                                              { m_state = RadioState::Listening; }); });
            return true;
        }

        // Admission filter for a frame pulled from the endpoint. Returns true if admitted.
        // Flood bookkeeping for admitted beacons happens here, before any protocol logic.
        bool receive(const Frame &frame)
        {
            if (m_state != RadioState::Listening)
            {
                ++m_stats.rxDroppedBusy;
                if (m_cfg.debugRadio)
                {
                    debug_log("DBG discard frame (radio busy with tx)");
                }
                return false;
            }
            if (frame.dst != BroadcastId && frame.dst != m_cfg.id)
            {
                ++m_stats.rxDroppedNotForUs;
                if (m_cfg.debugRadio)
                {
                    debug_log("DBG discard frame (not logical destination)");
                }
                return false;
            }

            ++m_stats.rxAdmitted;
            if (auto beacon = flood_beacon_of(frame))
            {
                record_flood(beacon->floodId);
            }
            return true;
        }

        // Mark `floodId` as seen now.
        void record_flood(std::uint64_t floodId)
        {
            m_floodIds.insert(floodId);
            m_floodTimes[floodId].insert(m_sched->now());
        }

        template <class... Args>
        void debug_log(const char *fmt, Args... args) const
        {
            Logger::instance().logf_hop(LogLevel::Debug, m_sched->now(), m_behavior->name(), m_cfg.id, m_cfg.hop,
                                        fmt, args...);
        }

    private:
        void receive_next_()
        {
            m_inbox->get([this](FramePtr frame)
                         {
                on_inbound_(frame);
                receive_next_(); });
        }

        void on_inbound_(const FramePtr &frame)
        {
            const auto beacon = flood_beacon_of(*frame);
            const bool isNew = beacon && !has_seen_flood(beacon->floodId);

            if (!receive(*frame))
            {
                return;
            }
            if (m_cfg.debugSensor)
            {
                Logger::instance().logf_hop(LogLevel::Info, m_sched->now(), m_behavior->name(), m_cfg.id, m_cfg.hop,
                                            "<-  receiving %s", describe(*frame).c_str());
            }
            m_behavior->on_frame(*this, frame, isNew);
        }

        Scheduler *m_sched = nullptr;
        Medium *m_medium = nullptr;
        NodeConfig m_cfg;
        std::unique_ptr<INodeBehavior> m_behavior;
        ChannelEndpoint *m_inbox = nullptr;
        RadioProfile m_radio{};

        RadioState m_state = RadioState::Listening;
        bool m_started = false;

        std::set<std::uint64_t> m_floodIds;
        std::map<std::uint64_t, std::set<SimTime>> m_floodTimes;

        Stats m_stats;
    };
}
