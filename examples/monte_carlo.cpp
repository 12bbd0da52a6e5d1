#include "monte_carlo.hpp"

#if defined(WSNSIM_HAS_MPI)
#include "mpi_collectives.hpp"
#include <mpi.h>
#endif

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <vector>

namespace
{
    struct Params
    {
        wsnsim::MonteCarloConfig mc;
        bool verbose = false;
    };

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

    bool parse_double(std::string_view s, double &out)
    {
        auto r = std::from_chars(s.data(), s.data() + s.size(), out);
        return r.ec == std::errc() && r.ptr == s.data() + s.size();
    }

    // Comma-separated list; every element must parse.
    template <class T, class Parse>
    bool parse_list(std::string_view s, std::vector<T> &out, Parse parse)
    {
        out.clear();
        while (!s.empty())
        {
            const std::size_t comma = s.find(',');
            const std::string_view item = s.substr(0, comma);
            T v{};
            if (!parse(item, v))
            {
                return false;
            }
            out.push_back(v);
            if (comma == std::string_view::npos)
            {
                break;
            }
            s.remove_prefix(comma + 1);
        }
        return !out.empty();
    }

    [[noreturn]] void usage_and_exit(int rank)
    {
        if (rank == 0)
        {
            std::cerr << "Monte Carlo flood success sweep\n"
                      << "  --trials N          trials per cell (default 500)\n"
                      << "  --loss L1,L2,...    loss rates (default 0.5,0.6,0.7)\n"
                      << "  --tx T1,T2,...      max transmissions (default 1,2,4)\n"
                      << "  --max-hops N        grid radius (default 4)\n"
                      << "  --guard-time N      guard time in ticks (default 100)\n"
                      << "  --no-interference\n"
                      << "  --verbose\n";
        }

#if defined(WSNSIM_HAS_MPI)
        MPI_Abort(MPI_COMM_WORLD, 2);
#endif
        std::exit(2);
    }

    Params parse_args(int argc, char **argv, int rank)
    {
        Params p;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit(rank);
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--trials")
            {
                if (!parse_u64(need(), p.mc.trials))
                    usage_and_exit(rank);
            }
            else if (a == "--loss")
            {
                if (!parse_list<double>(need(), p.mc.lossRates, parse_double))
                    usage_and_exit(rank);
            }
            else if (a == "--tx")
            {
                if (!parse_list<std::int64_t>(need(), p.mc.maxTransmissions, parse_i64))
                    usage_and_exit(rank);
            }
            else if (a == "--max-hops")
            {
                if (!parse_i64(need(), p.mc.maxHops))
                    usage_and_exit(rank);
            }
            else if (a == "--guard-time")
            {
                if (!parse_i64(need(), p.mc.guardTime))
                    usage_and_exit(rank);
            }
            else if (a == "--no-interference")
            {
                p.mc.enableInterference = false;
            }
            else if (a == "--verbose")
            {
                p.verbose = true;
            }
            else
            {
                usage_and_exit(rank);
            }
        }
        return p;
    }
}

int main(int argc, char **argv)
{
#if defined(WSNSIM_HAS_MPI)
    int provided = 0;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_SINGLE, &provided);
    int rank = 0;
    int size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);
#else
    const int rank = 0;
    const int size = 1;
#endif

    Params p = parse_args(argc, argv, rank);
    p.mc.rank = static_cast<std::uint32_t>(rank);
    p.mc.size = static_cast<std::uint32_t>(size);
    if (p.verbose)
    {
        p.mc.logLevel = wsnsim::LogLevel::Info;
    }

#if defined(WSNSIM_HAS_MPI)
    if (size > 1)
    {
        p.mc.reduceSum = [](std::int64_t local)
        { return wsnsim::mpi_allreduce_sum_i64(MPI_COMM_WORLD, local); };
    }
#endif

    int exitCode = 0;
    std::vector<wsnsim::MonteCarloCell> cells;
    try
    {
        cells = wsnsim::run_monte_carlo(p.mc);
    }
    catch (const wsnsim::ConfigurationError &e)
    {
        if (rank == 0)
        {
            std::cerr << "wsnsim_monte_carlo: " << e.what() << "\n";
        }
        exitCode = 2;
    }

    if (exitCode == 0 && rank == 0)
    {
        std::printf("%-6s %-6s %-10s %-8s %s\n", "tx", "loss", "successes", "trials", "p_success");
        for (const auto &c : cells)
        {
            std::printf("%-6lld %-6.2f %-10llu %-8llu %.4f\n",
                        static_cast<long long>(c.maxTransmissions),
                        c.lossRate,
                        static_cast<unsigned long long>(c.successes),
                        static_cast<unsigned long long>(c.trials),
                        c.probability());
        }
    }

#if defined(WSNSIM_HAS_MPI)
    MPI_Finalize();
#endif
    return exitCode;
}
