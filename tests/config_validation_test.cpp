/*
Purpose: Experiment parameter validation.

What this tests: each out-of-range parameter is rejected with its exact message before
anything runs, boundary values are accepted, grid radii too large for a NodeId
are rejected instead of truncated, and debug mode forces seed 0.
*/

#include "config.hpp"
#include "experiment.hpp"

#include <cassert>
#include <cmath>
#include <string>

namespace
{
    std::string rejection(const wsnsim::ExperimentConfig &cfg)
    {
        try
        {
            wsnsim::validate(cfg);
        }
        catch (const wsnsim::ConfigurationError &e)
        {
            return e.what();
        }
        return {};
    }
}

int main()
{
    wsnsim::ExperimentConfig ok;
    assert(rejection(ok).empty());

    {
        auto cfg = ok;
        cfg.maxTransmissions = -1;
        assert(rejection(cfg) == "transmission count must be positive integer greater or equal to 0");
        cfg.maxTransmissions = 0;
        assert(rejection(cfg).empty());
    }
    {
        auto cfg = ok;
        cfg.lossRate = 1.01;
        assert(rejection(cfg) == "loss rate must be positive float smaller or equal to 1.0");
        cfg.lossRate = -0.5;
        assert(rejection(cfg) == "loss rate must be positive float smaller or equal to 1.0");
        cfg.lossRate = std::nan("");
        assert(!rejection(cfg).empty());
        cfg.lossRate = 1.0;
        assert(rejection(cfg).empty());
        cfg.lossRate = 0.0;
        assert(rejection(cfg).empty());
    }
    {
        auto cfg = ok;
        cfg.maxHops = 0;
        assert(rejection(cfg) == "hop count must be a positive integer greater or equal to 1");

        // Radii the grid cannot hold are rejected, not truncated.
        cfg.maxHops = 4294967297LL;
        assert(rejection(cfg) == "hop count must be smaller or equal to 32767");
        cfg.maxHops = 3000000000LL;
        assert(rejection(cfg) == "hop count must be smaller or equal to 32767");
        cfg.maxHops = wsnsim::MaxGridHops;
        assert(rejection(cfg).empty());
    }
    {
        auto cfg = ok;
        cfg.guardTime = 0;
        assert(rejection(cfg) == "guard time must be positive integer greater or equal to 1");
    }

    // run_experiment validates too.
    {
        auto cfg = ok;
        cfg.maxHops = -3;
        bool threw = false;
        try
        {
            (void)wsnsim::run_experiment(cfg);
        }
        catch (const wsnsim::Error &)
        {
            threw = true;
        }
        assert(threw);

        cfg.maxHops = 3000000000LL;
        threw = false;
        try
        {
            (void)wsnsim::run_experiment(cfg);
        }
        catch (const wsnsim::ConfigurationError &)
        {
            threw = true;
        }
        assert(threw);
    }

    // Seed resolution.
    {
        auto cfg = ok;
        cfg.seed = 77;
        assert(wsnsim::resolve_seed(cfg) == 77);
        cfg.debug = true;
        assert(wsnsim::resolve_seed(cfg) == 0);
    }

    return 0;
}
