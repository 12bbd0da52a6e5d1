/*
Purpose: Flood bookkeeping on admission.

What this tests: an admitted beacon records its flood id together with the reception
time, later receptions add times without changing the first one, a dropped beacon
records nothing, and non-beacon frames never touch the flood tables. Also checks that
behaviors see `newFlood` only on the first reception of an id.
*/

#include "network.hpp"

#include <cassert>
#include <cstdint>
#include <memory>
#include <vector>

namespace
{
    struct FloodRecorder final : public wsnsim::INodeBehavior
    {
        std::vector<bool> *newFlags = nullptr;

        explicit FloodRecorder(std::vector<bool> &out) : newFlags(&out) {}

        const char *name() const noexcept override { return "Recorder"; }

        void on_frame(wsnsim::Node &, const wsnsim::FramePtr &, bool newFlood) override
        {
            newFlags->push_back(newFlood);
        }
    };
}

int main()
{
    constexpr std::uint64_t floodId = 0xc0ffee;

    // Direct admission calls.
    {
        wsnsim::Scheduler sched;
        wsnsim::RandomStream rng(1);
        wsnsim::Network network;
        wsnsim::Medium medium(sched, network, rng);

        std::vector<bool> flags;
        wsnsim::NodeConfig cfg;
        cfg.id = 4;
        cfg.guardTime = 20;
        wsnsim::Node &n = network.add_node(
            std::make_unique<wsnsim::Node>(sched, medium, cfg, std::make_unique<FloodRecorder>(flags)));

        const auto beacon = wsnsim::make_flood_beacon(1, 0, floodId);

        sched.schedule_at(30, [&]()
                          { n.receive(*beacon); });
        sched.schedule_at(70, [&]()
                          { n.receive(*beacon); });
        sched.schedule_at(80, [&]()
                          { n.receive(*wsnsim::make_frame(wsnsim::FrameType::Data, 1, 0, 1, {})); });
        sched.run_until_idle();

        assert(n.has_seen_flood(floodId));
        assert(n.flood_ids().size() == 1);
        assert(n.first_reception(floodId).value() == 30);
        assert(n.flood_times().at(floodId).size() == 2);
        assert(!n.first_reception(floodId + 1).has_value());
        assert(n.stats().rxAdmitted == 3);
    }

    // Through the medium: the behavior sees newFlood once; a busy node records nothing.
    {
        wsnsim::Scheduler sched;
        wsnsim::RandomStream rng(1);
        wsnsim::Network network;
        wsnsim::Medium medium(sched, network, rng, wsnsim::MediumConfig{.baseLossRate = 0.0});

        std::vector<bool> flagsA, flagsB;
        wsnsim::NodeConfig ca;
        ca.id = 1;
        ca.guardTime = 5;
        wsnsim::NodeConfig cb = ca;
        cb.id = 2;
        cb.position = {1, 0};

        wsnsim::Node &a = network.add_node(
            std::make_unique<wsnsim::Node>(sched, medium, ca, std::make_unique<FloodRecorder>(flagsA)));
        wsnsim::Node &b = network.add_node(
            std::make_unique<wsnsim::Node>(sched, medium, cb, std::make_unique<FloodRecorder>(flagsB)));
        network.start_all();

        const auto beacon = wsnsim::make_flood_beacon(1, 0, floodId);
        sched.schedule_at(10, [&]()
                          { a.send(beacon); });
        sched.schedule_at(20, [&]()
                          { a.send(beacon); });
        sched.schedule_at(40, [&]()
                          { b.send(wsnsim::make_frame(wsnsim::FrameType::Data, 2, 0, 9, {})); });
        sched.schedule_at(41, [&]()
                          {
            // B is locked until 45; this beacon is dropped there.
            a.send(wsnsim::make_flood_beacon(1, 1, floodId + 1)); });
        sched.run_until_idle();

        assert((flagsB == std::vector<bool>{true, false}));
        assert(b.first_reception(floodId).value() == 10);
        assert(!b.has_seen_flood(floodId + 1));
        assert(b.stats().rxDroppedBusy == 1);
        assert((flagsA == std::vector<bool>{false}));
    }

    return 0;
}
