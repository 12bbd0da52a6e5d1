/*
Purpose: Loss and interference law.

What this tests: the closed-form effective loss rate, the empirical delivery rate of two
constructively combined copies, and that a collision is decided without consuming a
random draw.
*/

#include "medium.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <vector>

namespace
{
    bool near(double a, double b, double eps)
    {
        return std::abs(a - b) <= eps;
    }
}

int main()
{
    assert(wsnsim::effective_loss_rate(0.6, 0) == 1.0);
    assert(near(wsnsim::effective_loss_rate(0.6, 1), 0.6, 1e-12));
    assert(near(wsnsim::effective_loss_rate(0.6, 2), 0.4450, 1e-3));
    assert(near(wsnsim::effective_loss_rate(0.6, 3), 0.36, 1e-12));
    assert(wsnsim::effective_loss_rate(0.0, 4) == 0.0);
    assert(wsnsim::effective_loss_rate(1.0, 4) == 1.0);

    // Strictly decreasing in k for 0 < base < 1.
    for (std::size_t k = 1; k < 16; ++k)
    {
        assert(wsnsim::effective_loss_rate(0.7, k + 1) < wsnsim::effective_loss_rate(0.7, k));
    }

    const auto a = wsnsim::make_flood_beacon(1, 0, 0x1234);
    const auto b = wsnsim::make_flood_beacon(1, 0, 0x1234);
    const auto other = wsnsim::make_flood_beacon(1, 0, 0x5678);

    const wsnsim::Transmission ta{a, 2};
    const wsnsim::Transmission tb{b, 3};
    const wsnsim::Transmission tc{other, 4};

    // Two identical copies: loss 0.6^log2(3).
    {
        wsnsim::RandomStream rng(2024);
        const std::vector<const wsnsim::Transmission *> candidates{&ta, &tb};
        const int n = 20000;
        int delivered = 0;
        for (int i = 0; i < n; ++i)
        {
            const auto r = wsnsim::resolve_reception(candidates, 0.6, true, rng);
            assert(r.constructive);
            assert(r.distinctFrames == 1);
            if (r.outcome == wsnsim::Reception::Delivered)
            {
                assert(r.frame);
                ++delivered;
            }
            else
            {
                assert(r.outcome == wsnsim::Reception::Faded);
                assert(!r.frame);
            }
        }
        assert(rng.draws() == static_cast<std::uint64_t>(n));
        const double rate = static_cast<double>(delivered) / n;
        assert(near(rate, 1.0 - 0.44502, 0.02));
    }

    // Distinct frames collide with or without interference modelling; no draw.
    {
        wsnsim::RandomStream rng(5);
        const std::vector<const wsnsim::Transmission *> candidates{&ta, &tc};
        auto r = wsnsim::resolve_reception(candidates, 0.0, true, rng);
        assert(r.outcome == wsnsim::Reception::Collided);
        assert(r.distinctFrames == 2);
        r = wsnsim::resolve_reception(candidates, 0.0, false, rng);
        assert(r.outcome == wsnsim::Reception::Collided);
        assert(rng.draws() == 0);
    }

    // Identical frames still collide when interference is disabled.
    {
        wsnsim::RandomStream rng(5);
        const std::vector<const wsnsim::Transmission *> candidates{&ta, &tb};
        const auto r = wsnsim::resolve_reception(candidates, 0.0, false, rng);
        assert(r.outcome == wsnsim::Reception::Collided);
        assert(!r.constructive);
        assert(rng.draws() == 0);
    }

    // No candidates: silent, no draw. One candidate: base loss, one draw.
    {
        wsnsim::RandomStream rng(5);
        const std::vector<const wsnsim::Transmission *> none;
        assert(wsnsim::resolve_reception(none, 0.6, true, rng).outcome == wsnsim::Reception::Silent);
        assert(rng.draws() == 0);

        const std::vector<const wsnsim::Transmission *> one{&tc};
        const auto r = wsnsim::resolve_reception(one, 0.6, true, rng);
        assert(r.lossProbability == 0.6);
        assert(!r.constructive);
        assert(rng.draws() == 1);
    }

    return 0;
}
