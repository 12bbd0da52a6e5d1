/*
Purpose: Boundary loss rates on a single link.

What this tests: with loss 0 a lone transmission is always delivered exactly once; with
loss 1 it is never delivered, for many seeds.
*/

#include "medium.hpp"

#include <cassert>
#include <cstdint>
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

    std::size_t deliveries(double loss, std::uint64_t seed)
    {
        wsnsim::Scheduler sched;
        MapDirectory dir;
        dir.radios[1] = wsnsim::RadioProfile{{0, 0}};
        dir.radios[2] = wsnsim::RadioProfile{{0, 1}};
        wsnsim::RandomStream rng(seed);
        wsnsim::Medium medium(sched, dir, rng, wsnsim::MediumConfig{.baseLossRate = loss});

        medium.attach_endpoint(1);
        auto &ep = medium.attach_endpoint(2);

        std::size_t got = 0;
        ep.get([&got](wsnsim::FramePtr)
               { ++got; });

        sched.schedule_at(100, [&]()
                          { medium.send(wsnsim::make_flood_beacon(1, 0, seed + 1), 1); });
        sched.run_until_idle();
        assert(rng.draws() == 1);
        return got;
    }
}

int main()
{
    for (std::uint64_t seed = 0; seed < 100; ++seed)
    {
        assert(deliveries(0.0, seed) == 1);
        assert(deliveries(1.0, seed) == 0);
    }
    return 0;
}
