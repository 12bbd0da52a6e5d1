#pragma once

#include "common.hpp"

#include <cmath>

namespace wsnsim
{
    struct Position
    {
        double x = 0.0;
        double y = 0.0;
    };

    inline double distance(Position a, Position b) noexcept
    {
        return std::hypot(a.x - b.x, a.y - b.y);
    }

    // What the medium needs to know about a node's radio.
    struct RadioProfile
    {
        Position position{};
        double txRange = 1.5;
        ChannelId channel = 7;
    };

    // Range is the sender's: a strong transmitter reaches further.
    inline bool in_range(const RadioProfile &sender, const RadioProfile &receiver) noexcept
    {
        return distance(sender.position, receiver.position) <= sender.txRange;
    }

    inline bool on_channel(const RadioProfile &sender, const RadioProfile &receiver) noexcept
    {
        return sender.channel == receiver.channel;
    }

    // Lookup of radio profiles by node id. Throws NotFoundError for unknown ids.
    class IRadioDirectory
    {
    public:
        virtual ~IRadioDirectory() = default;
        virtual const RadioProfile &radio_of(NodeId id) const = 0;
    };
}
