#pragma once

#include "config.hpp"
#include "determinism.hpp"
#include "flooding.hpp"
#include "log.hpp"
#include "medium.hpp"
#include "network.hpp"
#include "random.hpp"
#include "results.hpp"
#include "scheduler.hpp"
#include "topology.hpp"

#include <memory>
#include <random>

namespace wsnsim
{
    struct ExperimentOutcome
    {
        SimulationResults results;
        RunDigest digest;
        Medium::Stats medium;
        Scheduler::Stats scheduler;
    };

    inline std::uint64_t resolve_seed(const ExperimentConfig &cfg)
    {
        if (cfg.debug)
        {
            return 0;
        }
        if (cfg.seed)
        {
            return *cfg.seed;
        }
        std::random_device rd;
        return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
    }

    // Populate `network` with the grid: a Sink at (0,0), Sensors everywhere else.
    inline void build_grid_network(Network &network,
                                   Scheduler &sched,
                                   Medium &medium,
                                   RandomStream &rng,
                                   const ExperimentConfig &cfg)
    {
        for (const GridSlot &slot : chebyshev_grid(static_cast<std::int32_t>(cfg.maxHops)))
        {
            NodeConfig nc;
            nc.id = slot.id;
            nc.position = slot.position();
            nc.hop = slot.hop;
            nc.maxTransmissions = cfg.maxTransmissions;
            nc.guardTime = static_cast<SimDuration>(cfg.guardTime);
            nc.debugPosition = cfg.debug;
            nc.debugRadio = cfg.debug;
            nc.debugSensor = cfg.debug;

            std::unique_ptr<INodeBehavior> behavior;
            if (slot.is_sink())
            {
                behavior = std::make_unique<SinkBehavior>(rng);
            }
            else
            {
                behavior = std::make_unique<SensorBehavior>();
            }
            network.add_node(std::make_unique<Node>(sched, medium, nc, std::move(behavior)));
        }
    }

    // One complete run: validate, build, drain the event queue, collect results.
    inline ExperimentOutcome run_experiment(const ExperimentConfig &cfg)
    {
        validate(cfg);

        const std::uint64_t seed = resolve_seed(cfg);
        Logger::instance().set_level(cfg.debug ? LogLevel::Debug : cfg.logLevel);

        DeterminismAccumulator determinism;
        SchedulerConfig scfg;
        scfg.firedEventSink = [&determinism](TimeStamp ts)
        { determinism.on_fired_event(ts); };

        Scheduler sched(std::move(scfg));
        RandomStream rng(seed);
        Network network;

        MediumConfig mcfg;
        mcfg.baseLossRate = cfg.lossRate;
        mcfg.enableInterference = cfg.enableInterference;
        mcfg.debug = cfg.debug;
        Medium medium(sched, network, rng, mcfg);

        build_grid_network(network, sched, medium, rng, cfg);
        network.start_all();

        Logger::instance().logf(LogLevel::Info, sched.now(), "Sim", 0, "start: nodes=%zu seed=%llu loss=%g tx=%lld",
                                network.size(), static_cast<unsigned long long>(seed), cfg.lossRate,
                                static_cast<long long>(cfg.maxTransmissions));

        sched.run_until_idle();

        ExperimentOutcome out;
        out.results = collect_results(cfg, seed, network);
        for (const auto &node : network.nodes())
        {
            determinism.on_final_node(*node);
        }
        out.digest = determinism.digest();
        out.medium = medium.stats();
        out.scheduler = sched.stats();

        Logger::instance().logf(LogLevel::Info, sched.now(), "Sim", 0, "done: events=%llu coverage=%g success=%d",
                                static_cast<unsigned long long>(out.scheduler.fired), out.results.floodCoverage,
                                out.results.floodSuccess ? 1 : 0);
        return out;
    }
}
