/*
Purpose: Destructive collisions at the medium level.

What this tests: with interference modelling off, two identical concurrent frames
collide at a receiver that hears both, while a receiver that hears only one of them
still gets its copy. With it on, the same layout delivers to both receivers.
*/

#include "medium.hpp"

#include <cassert>
#include <unordered_map>
#include <vector>

namespace
{
    struct MapDirectory final : public wsnsim::IRadioDirectory
    {
        std::unordered_map<wsnsim::NodeId, wsnsim::RadioProfile> radios;

        const wsnsim::RadioProfile &radio_of(wsnsim::NodeId id) const override
        {
            return radios.at(id);
        }
    };

    void drain(wsnsim::ChannelEndpoint &ep, std::vector<wsnsim::FramePtr> &out)
    {
        ep.get([&ep, &out](wsnsim::FramePtr f)
               {
            out.push_back(std::move(f));
            drain(ep, out); });
    }

    struct Outcome
    {
        std::size_t middle = 0;
        std::size_t far = 0;
        wsnsim::Medium::Stats stats;
    };

    // 1 and 2 transmit the same beacon; 3 sits between them, 4 hears only 2.
    Outcome run(bool enableInterference)
    {
        wsnsim::Scheduler sched;
        MapDirectory dir;
        dir.radios[1] = wsnsim::RadioProfile{{0, 0}};
        dir.radios[2] = wsnsim::RadioProfile{{2, 0}};
        dir.radios[3] = wsnsim::RadioProfile{{1, 0}};
        dir.radios[4] = wsnsim::RadioProfile{{3, 0}};
        wsnsim::RandomStream rng(99);
        wsnsim::Medium medium(sched, dir, rng,
                              wsnsim::MediumConfig{.baseLossRate = 0.0, .enableInterference = enableInterference});

        std::vector<wsnsim::FramePtr> got[5];
        for (wsnsim::NodeId id = 1; id <= 4; ++id)
        {
            drain(medium.attach_endpoint(id), got[id]);
        }

        const auto beacon = wsnsim::make_flood_beacon(7, 3, 0xfeed);
        sched.schedule_at(50, [&]()
                          {
            medium.send(beacon, 1);
            medium.send(beacon, 2); });
        sched.run_until_idle();

        return Outcome{got[3].size(), got[4].size(), medium.stats()};
    }
}

int main()
{
    const Outcome off = run(false);
    assert(off.middle == 0);
    assert(off.far == 1);
    assert(off.stats.collisions == 1);
    assert(off.stats.deliveries == 1);

    const Outcome on = run(true);
    assert(on.middle == 1);
    assert(on.far == 1);
    assert(on.stats.collisions == 0);
    assert(on.stats.constructiveDeliveries == 1);

    return 0;
}
