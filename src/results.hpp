#pragma once

#include "config.hpp"
#include "network.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>

namespace wsnsim
{
    struct SimulationResults
    {
        std::int64_t maxTransmissions = 0;
        double lossRate = 0.0;
        double guardTime = 0.0;
        std::uint64_t seed = 0;
        std::int64_t maxHops = 0;
        std::size_t deviceCount = 0;
        bool floodSuccess = false;
        double floodCoverage = 0.0;
        double completionTime = 0.0;
        std::uint64_t totalTransmissions = 0;
    };

    // Read final node bookkeeping. Purely observational.
    inline SimulationResults collect_results(const ExperimentConfig &cfg, std::uint64_t seed, const Network &network)
    {
        SimulationResults r;
        r.maxTransmissions = cfg.maxTransmissions;
        r.lossRate = cfg.lossRate;
        r.seed = seed;
        r.maxHops = cfg.maxHops;
        r.deviceCount = network.size();
        r.guardTime = network.size() > 0 ? static_cast<double>(network.nodes().front()->config().guardTime)
                                         : static_cast<double>(cfg.guardTime);

        std::size_t reached = 0;
        for (const auto &node : network.nodes())
        {
            if (!node->flood_ids().empty())
            {
                ++reached;
            }
            r.totalTransmissions += node->tx_count();
        }

        r.floodCoverage = r.deviceCount > 0 ? static_cast<double>(reached) / static_cast<double>(r.deviceCount) : 0.0;
        r.floodSuccess = (r.deviceCount > 0 && reached == r.deviceCount);

        // Completion time: the latest first-reception over every node and flood.
        if (r.floodSuccess)
        {
            SimTime latest = 0;
            for (const auto &node : network.nodes())
            {
                for (const auto &[floodId, times] : node->flood_times())
                {
                    (void)floodId;
                    if (!times.empty())
                    {
                        latest = std::max(latest, *times.begin());
                    }
                }
            }
            r.completionTime = static_cast<double>(latest);
        }
        return r;
    }

    inline std::string to_text(const SimulationResults &r)
    {
        char buf[512];
        std::snprintf(buf, sizeof(buf),
                      "max_transmissions: %lld\n"
                      "loss_rate: %g\n"
                      "guard_time: %g\n"
                      "seed: %llu\n"
                      "max_hops: %lld\n"
                      "device_count: %zu\n"
                      "flood_coverage: %g\n"
                      "flood_success: %s\n"
                      "completion_time: %g\n"
                      "total_transmissions: %llu\n",
                      static_cast<long long>(r.maxTransmissions),
                      r.lossRate,
                      r.guardTime,
                      static_cast<unsigned long long>(r.seed),
                      static_cast<long long>(r.maxHops),
                      r.deviceCount,
                      r.floodCoverage,
                      r.floodSuccess ? "true" : "false",
                      r.completionTime,
                      static_cast<unsigned long long>(r.totalTransmissions));
        return std::string(buf);
    }

    inline const char *csv_header() noexcept
    {
        return "max_transmissions,loss_rate,guard_time,seed,max_hops,device_count,"
               "flood_success,flood_coverage,completion_time,total_transmissions";
    }

    inline std::string to_csv(const SimulationResults &r)
    {
        char buf[256];
        std::snprintf(buf, sizeof(buf), "%lld,%g,%g,%llu,%lld,%zu,%d,%g,%g,%llu",
                      static_cast<long long>(r.maxTransmissions),
                      r.lossRate,
                      r.guardTime,
                      static_cast<unsigned long long>(r.seed),
                      static_cast<long long>(r.maxHops),
                      r.deviceCount,
                      r.floodSuccess ? 1 : 0,
                      r.floodCoverage,
                      r.completionTime,
                      static_cast<unsigned long long>(r.totalTransmissions));
        return std::string(buf);
    }
}
