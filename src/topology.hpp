#pragma once

#include "common.hpp"
#include "radio.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

namespace wsnsim
{
    struct GridSlot
    {
        NodeId id = 0;
        std::int32_t x = 0;
        std::int32_t y = 0;
        std::uint32_t hop = 0;

        bool is_sink() const noexcept { return x == 0 && y == 0; }

        Position position() const noexcept { return Position{static_cast<double>(x), static_cast<double>(y)}; }
    };

    // Largest radius whose (2h+1)^2 node count still fits a NodeId.
    inline constexpr std::int32_t MaxGridHops = 32767;

    // Square grid of Chebyshev radius `maxHops` around the sink at (0,0).
    //
    // Ids are assigned from 1 in ring order (hop 0 first), points within a ring sorted
    // by (x, y). The sink is always id 1.
    inline std::vector<GridSlot> chebyshev_grid(std::int32_t maxHops)
    {
        if (maxHops < 0)
        {
            throw std::invalid_argument("chebyshev_grid: negative radius");
        }
        if (maxHops > MaxGridHops)
        {
            throw std::invalid_argument("chebyshev_grid: radius too large");
        }

        std::map<std::uint32_t, std::vector<std::pair<std::int32_t, std::int32_t>>> rings;
        for (std::int32_t y = -maxHops; y <= maxHops; ++y)
        {
            for (std::int32_t x = -maxHops; x <= maxHops; ++x)
            {
                const auto hop = static_cast<std::uint32_t>(std::max(std::abs(x), std::abs(y)));
                rings[hop].emplace_back(x, y);
            }
        }

        std::vector<GridSlot> out;
        const std::size_t side = static_cast<std::size_t>(2 * maxHops + 1);
        out.reserve(side * side);

        NodeId next = 1;
        for (auto &[hop, points] : rings)
        {
            std::sort(points.begin(), points.end());
            for (const auto &[x, y] : points)
            {
                out.push_back(GridSlot{next++, x, y, hop});
            }
        }
        return out;
    }
}
