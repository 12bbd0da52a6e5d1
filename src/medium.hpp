#pragma once

#include "channel.hpp"
#include "errors.hpp"
#include "frame.hpp"
#include "log.hpp"
#include "radio.hpp"
#include "random.hpp"
#include "scheduler.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace wsnsim
{
    struct MediumConfig
    {
        // Probability that a lone transmission is lost to fading, in [0,1].
        double baseLossRate = 0.6;

        // If true, concurrent identical frames combine constructively; otherwise any
        // two or more concurrent candidates collide.
        bool enableInterference = true;

        // Log every loss (fading, collision, wrong channel) at Debug level.
        bool debug = false;
    };

    // Effective loss probability for k >= 1 simultaneous identical transmissions.
    // Decreases sub-linearly with k (receiver-side power combining); k == 1 gives `base`.
    inline double effective_loss_rate(double base, std::size_t k) noexcept
    {
        if (k == 0)
        {
            return 1.0;
        }
        return std::pow(base, std::log2(static_cast<double>(k) + 1.0));
    }

    enum class Reception : std::uint8_t
    {
        Silent = 0,    // no candidate reached the receiver
        Delivered = 1, // one copy delivered
        Faded = 2,     // lost to the loss draw
        Collided = 3,  // destructive collision, no draw consumed
    };

    struct ReceptionResult
    {
        Reception outcome = Reception::Silent;
        FramePtr frame;              // set iff outcome == Delivered
        bool constructive = false;   // >= 2 identical candidates combined
        std::size_t distinctFrames = 0;
        double lossProbability = 0.0;
    };

    inline std::size_t count_distinct_frames(const std::vector<const Transmission *> &candidates)
    {
        std::vector<const Frame *> seen;
        for (const Transmission *tx : candidates)
        {
            bool known = false;
            for (const Frame *f : seen)
            {
                if (*f == *tx->frame)
                {
                    known = true;
                    break;
                }
            }
            if (!known)
            {
                seen.push_back(tx->frame.get());
            }
        }
        return seen.size();
    }

    // Loss/interference law for the transmissions that passed the range and channel
    // filters of one receiver. Consumes at most one draw from `rng`.
    inline ReceptionResult resolve_reception(const std::vector<const Transmission *> &candidates,
                                             double baseLossRate,
                                             bool enableInterference,
                                             RandomStream &rng)
    {
        ReceptionResult out;
        if (candidates.empty())
        {
            return out;
        }

        out.distinctFrames = count_distinct_frames(candidates);

        if (candidates.size() == 1)
        {
            out.lossProbability = baseLossRate;
        }
        else if (enableInterference && out.distinctFrames == 1)
        {
            out.constructive = true;
            out.lossProbability = effective_loss_rate(baseLossRate, candidates.size());
        }
        else
        {
            out.outcome = Reception::Collided;
            out.lossProbability = 1.0;
            return out;
        }

        if (rng.bernoulli(out.lossProbability))
        {
            out.outcome = Reception::Faded;
            return out;
        }
        out.outcome = Reception::Delivered;
        out.frame = candidates.front()->frame;
        return out;
    }

    // Shared slotted broadcast medium.
    //
    // Per tick: Idle -> Buffering (first send schedules a zero-delay resolution) ->
    // Resolving (every send of the tick is already buffered) -> Idle. Resolving after
    // the whole batch is known makes the outcome independent of send order within a tick.
    class Medium
    {
    public:
        enum class State : std::uint8_t
        {
            Idle = 0,
            Buffering = 1,
            Resolving = 2,
        };

        struct Stats
        {
            std::uint64_t batches = 0;
            std::uint64_t transmissions = 0;
            std::uint64_t duplicateSends = 0;
            std::uint64_t deliveries = 0;
            std::uint64_t constructiveDeliveries = 0;
            std::uint64_t fadingLosses = 0;
            std::uint64_t collisions = 0;
            std::uint64_t outOfRange = 0;
            std::uint64_t wrongChannel = 0;
        };

        Medium(Scheduler &sched, const IRadioDirectory &directory, RandomStream &rng, MediumConfig cfg = {})
            : m_sched(&sched), m_directory(&directory), m_rng(&rng), m_cfg(cfg)
        {
            if (!(m_cfg.baseLossRate >= 0.0 && m_cfg.baseLossRate <= 1.0))
            {
                throw ConfigurationError("Medium: base loss rate must be within [0, 1]");
            }
        }

        Medium(const Medium &) = delete;
        Medium &operator=(const Medium &) = delete;

        const MediumConfig &config() const noexcept { return m_cfg; }
        State state() const noexcept { return m_state; }
        const Stats &stats() const noexcept { return m_stats; }
        std::size_t pending() const noexcept { return m_pending.size(); }
        std::size_t endpoint_count() const noexcept { return m_endpoints.size(); }

        // Register a receiver. Endpoints are swept in registration order.
        ChannelEndpoint &attach_endpoint(NodeId id, std::size_t capacity = ChannelEndpoint::Unbounded)
        {
            if (m_endpointIndex.count(id) != 0)
            {
                throw DuplicateNodeError("Medium::attach_endpoint: node " + std::to_string(id) + " already attached");
            }
            m_endpointIndex.emplace(id, m_endpoints.size());
            m_endpoints.push_back(std::make_unique<ChannelEndpoint>(*m_sched, id, capacity));
            return *m_endpoints.back();
        }

        ChannelEndpoint &endpoint(NodeId id)
        {
            auto it = m_endpointIndex.find(id);
            if (it == m_endpointIndex.end())
            {
                throw NotFoundError("Medium::endpoint: node " + std::to_string(id) + " not attached");
            }
            return *m_endpoints[it->second];
        }

        // Buffer `frame` from `senderId` for the current tick. A second send by the same
        // sender in the same tick is ignored.
        void send(FramePtr frame, NodeId senderId)
        {
            if (m_endpoints.empty())
            {
                throw ChannelUnavailable("Medium::send: there are no output endpoints");
            }
            if (!frame)
            {
                throw std::invalid_argument("Medium::send: null frame");
            }
            if (m_state == State::Resolving)
            {
                throw std::logic_error("Medium::send: re-entrant send during resolution");
            }

            const SimTime now = m_sched->now();
            auto it = m_lastTx.find(senderId);
            if (it != m_lastTx.end() && it->second == now)
            {
                ++m_stats.duplicateSends;
                return;
            }
            m_lastTx[senderId] = now;

            m_pending.push_back(Transmission{std::move(frame), senderId});
            ++m_stats.transmissions;

            if (m_state == State::Idle)
            {
                m_state = State::Buffering;
                m_sched->schedule_after(0, [this]()
                                        { resolve_(); });
            }
        }

    private:
        void resolve_()
        {
            m_state = State::Resolving;
            ++m_stats.batches;

            const SimTime now = m_sched->now();

            std::unordered_set<NodeId> senders;
            for (const auto &tx : m_pending)
            {
                senders.insert(tx.senderId);
            }

            std::vector<const Transmission *> candidates;
            candidates.reserve(m_pending.size());

            for (auto &ep : m_endpoints)
            {
                const NodeId receiverId = ep->owner();

                // Half-duplex: a node that transmitted this tick cannot receive.
                if (senders.count(receiverId) != 0)
                {
                    continue;
                }

                const RadioProfile &receiver = m_directory->radio_of(receiverId);

                candidates.clear();
                for (const auto &tx : m_pending)
                {
                    const RadioProfile &sender = m_directory->radio_of(tx.senderId);
                    if (!in_range(sender, receiver))
                    {
                        ++m_stats.outOfRange;
                        continue;
                    }
                    if (!on_channel(sender, receiver))
                    {
                        ++m_stats.wrongChannel;
                        debug_(now, "%u -> %u frame lost (wrong channel)",
                               static_cast<unsigned>(tx.senderId), static_cast<unsigned>(receiverId));
                        continue;
                    }
                    candidates.push_back(&tx);
                }

                const ReceptionResult r = resolve_reception(candidates, m_cfg.baseLossRate, m_cfg.enableInterference, *m_rng);
                switch (r.outcome)
                {
                case Reception::Silent:
                    break;
                case Reception::Delivered:
                    ++m_stats.deliveries;
                    if (r.constructive)
                    {
                        ++m_stats.constructiveDeliveries;
                    }
                    ep->put(r.frame);
                    break;
                case Reception::Faded:
                    ++m_stats.fadingLosses;
                    debug_(now, "%s -> %u frame lost (fading, p=%.4f)",
                           sender_list_(candidates).c_str(), static_cast<unsigned>(receiverId), r.lossProbability);
                    break;
                case Reception::Collided:
                    ++m_stats.collisions;
                    debug_(now, "%s -> %u frame(s) lost (collision of %zu distinct frames)",
                           sender_list_(candidates).c_str(), static_cast<unsigned>(receiverId), r.distinctFrames);
                    break;
                }
            }

            m_pending.clear();
            for (auto it = m_lastTx.begin(); it != m_lastTx.end();)
            {
                if (it->second != now)
                {
                    it = m_lastTx.erase(it);
                }
                else
                {
                    ++it;
                }
            }
            m_state = State::Idle;
        }

        template <class... Args>
        void debug_(SimTime now, const char *fmt, Args... args) const
        {
            if (!m_cfg.debug)
            {
                return;
            }
            Logger::instance().logf(LogLevel::Debug, now, "Medium", 0, fmt, args...);
        }

        static std::string sender_list_(const std::vector<const Transmission *> &candidates)
        {
            if (candidates.size() == 1)
            {
                return std::to_string(candidates.front()->senderId);
            }
            std::string out = "{";
            for (std::size_t i = 0; i < candidates.size(); ++i)
            {
                if (i != 0)
                {
                    out += ", ";
                }
                out += std::to_string(candidates[i]->senderId);
            }
            out += "}";
            return out;
        }

        Scheduler *m_sched = nullptr;
        const IRadioDirectory *m_directory = nullptr;
        RandomStream *m_rng = nullptr;
        MediumConfig m_cfg;

        State m_state = State::Idle;
        std::vector<Transmission> m_pending;

        // Sender -> tick of its last buffered transmission (per-tick dedup).
        std::unordered_map<NodeId, SimTime> m_lastTx;

        std::vector<std::unique_ptr<ChannelEndpoint>> m_endpoints;
        std::unordered_map<NodeId, std::size_t> m_endpointIndex;

        Stats m_stats;
    };
}
