#pragma once

#include "common.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "topology.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace wsnsim
{
    struct ExperimentConfig
    {
        // Relays each node performs after the first reception of a flood. >= 0.
        std::int64_t maxTransmissions = 1;

        // Loss probability of a single transmission. In [0, 1].
        double lossRate = 0.6;

        // Chebyshev radius of the grid around the sink. In [1, MaxGridHops].
        std::int64_t maxHops = 4;

        // Radio guard time and relay spacing, in ticks. >= 1.
        std::int64_t guardTime = 100;

        // If unset, a non-deterministic seed is drawn and reported in the results.
        std::optional<std::uint64_t> seed;

        // Forces seed 0 and turns on every debug log.
        bool debug = false;

        bool enableInterference = true;

        LogLevel logLevel = LogLevel::Off;
    };

    // Fail fast before any event is scheduled.
    inline void validate(const ExperimentConfig &cfg)
    {
        if (cfg.maxTransmissions < 0)
        {
            throw ConfigurationError("transmission count must be positive integer greater or equal to 0");
        }
        if (!(cfg.lossRate >= 0.0 && cfg.lossRate <= 1.0))
        {
            throw ConfigurationError("loss rate must be positive float smaller or equal to 1.0");
        }
        if (cfg.maxHops < 1)
        {
            throw ConfigurationError("hop count must be a positive integer greater or equal to 1");
        }
        if (cfg.maxHops > MaxGridHops)
        {
            throw ConfigurationError("hop count must be smaller or equal to " + std::to_string(MaxGridHops));
        }
        if (cfg.guardTime < 1)
        {
            throw ConfigurationError("guard time must be positive integer greater or equal to 1");
        }
    }
}
