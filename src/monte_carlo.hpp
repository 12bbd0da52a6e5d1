#pragma once

#include "config.hpp"
#include "experiment.hpp"
#include "log.hpp"

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <vector>

namespace wsnsim
{
    struct MonteCarloConfig
    {
        std::vector<double> lossRates{0.5, 0.6, 0.7};
        std::vector<std::int64_t> maxTransmissions{1, 2, 4};

        // Trial j of every cell runs with seed j.
        std::uint64_t trials = 500;

        std::int64_t maxHops = 4;
        std::int64_t guardTime = 100;
        bool enableInterference = true;

        // Level applied to every trial (and to the per-cell summary lines).
        LogLevel logLevel = LogLevel::Off;

        // Partitioning: this process runs trials with (j % size) == rank.
        std::uint32_t rank = 0;
        std::uint32_t size = 1;

        // Optional global reduction for per-cell success counts
        // (e.g., MPI_Allreduce with MPI_SUM). If unset, counts are local.
        std::function<std::int64_t(std::int64_t)> reduceSum;
    };

    struct MonteCarloCell
    {
        std::int64_t maxTransmissions = 0;
        double lossRate = 0.0;
        std::uint64_t successes = 0;
        std::uint64_t trials = 0;

        double probability() const noexcept
        {
            return trials > 0 ? static_cast<double>(successes) / static_cast<double>(trials) : 0.0;
        }
    };

    // Trials assigned to this rank when counts are not reduced globally.
    inline std::uint64_t local_trial_count(const MonteCarloConfig &mc) noexcept
    {
        if (mc.rank >= mc.trials)
        {
            return 0;
        }
        return (mc.trials - mc.rank + mc.size - 1) / mc.size;
    }

    // Estimate the flood success probability for every (maxTransmissions, lossRate) pair.
    // Cells are returned in (maxTransmissions, lossRate) order of the configuration.
    inline std::vector<MonteCarloCell> run_monte_carlo(const MonteCarloConfig &mc)
    {
        if (mc.size == 0 || mc.rank >= mc.size)
        {
            throw ConfigurationError("monte carlo: rank must be < size and size >= 1");
        }
        if (mc.trials == 0)
        {
            throw ConfigurationError("monte carlo: trial count must be >= 1");
        }

        std::vector<MonteCarloCell> cells;
        cells.reserve(mc.maxTransmissions.size() * mc.lossRates.size());

        for (const std::int64_t tx : mc.maxTransmissions)
        {
            for (const double loss : mc.lossRates)
            {
                ExperimentConfig cfg;
                cfg.maxTransmissions = tx;
                cfg.lossRate = loss;
                cfg.maxHops = mc.maxHops;
                cfg.guardTime = mc.guardTime;
                cfg.enableInterference = mc.enableInterference;
                cfg.logLevel = mc.logLevel;
                validate(cfg);

                std::int64_t local = 0;
                for (std::uint64_t j = mc.rank; j < mc.trials; j += mc.size)
                {
                    cfg.seed = j;
                    if (run_experiment(cfg).results.floodSuccess)
                    {
                        ++local;
                    }
                }

                const std::int64_t total = mc.reduceSum ? mc.reduceSum(local) : local;

                MonteCarloCell cell;
                cell.maxTransmissions = tx;
                cell.lossRate = loss;
                cell.successes = static_cast<std::uint64_t>(total);
                cell.trials = mc.reduceSum ? mc.trials : local_trial_count(mc);
                cells.push_back(cell);

                Logger::instance().logf(LogLevel::Info, 0, "MonteCarlo", 0, "tx=%lld loss=%g successes=%llu/%llu",
                                        static_cast<long long>(tx), loss,
                                        static_cast<unsigned long long>(cell.successes),
                                        static_cast<unsigned long long>(cell.trials));
            }
        }
        return cells;
    }
}
