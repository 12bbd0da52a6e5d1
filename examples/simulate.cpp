#include "config.hpp"
#include "experiment.hpp"
#include "results.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <string_view>

namespace
{
    struct Params
    {
        wsnsim::ExperimentConfig cfg;
        bool csv = false;
        bool digest = false;
    };

    bool parse_i64(std::string_view s, std::int64_t &out)
    {
        long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::int64_t>(v);
        return true;
    }

    bool parse_u64(std::string_view s, std::uint64_t &out)
    {
        unsigned long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }

    bool parse_double(std::string_view s, double &out)
    {
        auto r = std::from_chars(s.data(), s.data() + s.size(), out);
        return r.ec == std::errc() && r.ptr == s.data() + s.size();
    }

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "wsnsim_simulate: flooding over a slotted half-duplex broadcast medium\n"
                  << "  -d, --debug-mode            seed 0 and all debug logs\n"
                  << "  -t, --max-transmissions N   relays per node after first reception (>= 0, default 1)\n"
                  << "  -l, --loss-rate P           single transmission loss rate (0..1, default 0.6)\n"
                  << "  -m, --max-hops N            grid radius around the sink (>= 1, default 4)\n"
                  << "  -g, --guard-time N          guard time in ticks (>= 1, default 100)\n"
                  << "  -s, --seed S                random seed (default: non-deterministic)\n"
                  << "      --no-interference       concurrent identical frames collide\n"
                  << "      --csv                   print results as CSV\n"
                  << "      --digest                print the run digest\n";
        std::exit(2);
    }

    Params parse_args(int argc, char **argv)
    {
        Params p;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit();
                }
                return std::string_view(argv[++i]);
            };

            if (a == "-d" || a == "--debug-mode")
            {
                p.cfg.debug = true;
            }
            else if (a == "-t" || a == "--max-transmissions")
            {
                if (!parse_i64(need(), p.cfg.maxTransmissions))
                    usage_and_exit();
            }
            else if (a == "-l" || a == "--loss-rate")
            {
                if (!parse_double(need(), p.cfg.lossRate))
                    usage_and_exit();
            }
            else if (a == "-m" || a == "--max-hops")
            {
                if (!parse_i64(need(), p.cfg.maxHops))
                    usage_and_exit();
            }
            else if (a == "-g" || a == "--guard-time")
            {
                if (!parse_i64(need(), p.cfg.guardTime))
                    usage_and_exit();
            }
            else if (a == "-s" || a == "--seed")
            {
                std::uint64_t seed = 0;
                if (!parse_u64(need(), seed))
                    usage_and_exit();
                p.cfg.seed = seed;
            }
            else if (a == "--no-interference")
            {
                p.cfg.enableInterference = false;
            }
            else if (a == "--csv")
            {
                p.csv = true;
            }
            else if (a == "--digest")
            {
                p.digest = true;
            }
            else
            {
                usage_and_exit();
            }
        }
        return p;
    }
}

int main(int argc, char **argv)
{
    const Params p = parse_args(argc, argv);

    try
    {
        wsnsim::validate(p.cfg);
    }
    catch (const wsnsim::ConfigurationError &e)
    {
        std::cerr << "wsnsim_simulate: " << e.what() << "\n";
        return 2;
    }

    std::optional<wsnsim::ExperimentOutcome> run;
    try
    {
        run.emplace(wsnsim::run_experiment(p.cfg));
    }
    catch (const wsnsim::Error &e)
    {
        std::cerr << "wsnsim_simulate: " << e.what() << "\n";
        return 1;
    }
    const wsnsim::ExperimentOutcome &out = *run;

    if (p.cfg.debug)
    {
        std::cout << "*** DEBUG MODE ACTIVE ***\n"
                  << "Run results:\n";
    }

    if (p.csv)
    {
        std::cout << wsnsim::csv_header() << "\n"
                  << wsnsim::to_csv(out.results) << "\n";
    }
    else
    {
        std::cout << wsnsim::to_text(out.results);
    }

    if (p.digest)
    {
        std::cout << "digest: " << out.digest.combined() << "\n";
    }
    return 0;
}
