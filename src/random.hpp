#pragma once

#include "common.hpp"

#include <cmath>
#include <cstdint>

namespace wsnsim
{
    // Deterministic RNG for reproducible runs.
    //
    // Design goals:
    // - A run is a pure function of its seed: the same seed yields the same draws.
    // - No process-wide state; each run owns its stream and passes it explicitly.

    inline std::uint64_t splitmix64(std::uint64_t x) noexcept
    {
        x += 0x9e3779b97f4a7c15ULL;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
        return x ^ (x >> 31);
    }

    // Map the top 53 bits of `r` to a double in [0,1).
    inline double unit_double_from_u64(std::uint64_t r) noexcept
    {
        const std::uint64_t mantissa = r >> 11;                            // 53 bits
        return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0); // 2^53
    }

    // Sequential pseudo-random stream (splitmix64 sequence).
    //
    // A run creates exactly one stream from its seed and threads it through every
    // component that draws. Draw order therefore follows event order, which the
    // scheduler makes deterministic.
    class RandomStream
    {
    public:
        explicit RandomStream(std::uint64_t seed = 0) noexcept : m_seed(seed), m_state(seed) {}

        std::uint64_t seed() const noexcept { return m_seed; }
        std::uint64_t draws() const noexcept { return m_draws; }

        std::uint64_t next_u64() noexcept
        {
            ++m_draws;
            const std::uint64_t x = m_state;
            m_state += 0x9e3779b97f4a7c15ULL;
            return splitmix64(x);
        }

        // Uniform in [0,1).
        double next_unit_double() noexcept
        {
            return unit_double_from_u64(next_u64());
        }

        // True with probability `p` (p <= 0 never, p >= 1 always). Always consumes one draw.
        bool bernoulli(double p) noexcept
        {
            return next_unit_double() < p;
        }

    private:
        std::uint64_t m_seed = 0;
        std::uint64_t m_state = 0;
        std::uint64_t m_draws = 0;
    };
}
