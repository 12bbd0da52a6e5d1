#pragma once

#include "common.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace wsnsim
{
    enum class FrameType : std::uint8_t
    {
        FloodBeacon = 1,
        Data = 2,
    };

    inline const char *frame_type_name(FrameType type) noexcept
    {
        switch (type)
        {
        case FrameType::FloodBeacon:
            return "FLOOD_BEACON";
        case FrameType::Data:
            return "DATA";
        }
        return "UNKNOWN";
    }

    enum : std::uint32_t
    {
        PayloadFloodBeacon = 1,
    };

    // Body of a FLOOD_BEACON frame. The flood id is part of the payload bytes and
    // therefore part of frame identity.
    struct FloodBeacon
    {
        std::uint64_t floodId = 0;
    };

    template <class T>
    inline Payload pack(std::uint32_t kind, const T &value)
    {
        static_assert(std::is_trivially_copyable_v<T>, "pack requires trivially copyable T");
        Payload p;
        p.kind = kind;
        p.bytes = bytes_from_trivially_copyable(value);
        return p;
    }

    template <class T>
    inline T unpack(const Payload &p, std::uint32_t expectedKind, const char *what = "payload")
    {
        static_assert(std::is_trivially_copyable_v<T>, "unpack requires trivially copyable T");
        if (p.kind != expectedKind)
        {
            throw std::runtime_error(std::string("unpack: wrong kind for ") + what +
                                     " (expected=" + std::to_string(expectedKind) +
                                     " got=" + std::to_string(p.kind) + ")");
        }
        if (p.bytes.size() != sizeof(T))
        {
            throw std::runtime_error(std::string("unpack: wrong size for ") + what +
                                     " (expected=" + std::to_string(sizeof(T)) +
                                     " got=" + std::to_string(p.bytes.size()) + ")");
        }
        T out{};
        std::memcpy(&out, p.bytes.data(), sizeof(T));
        return out;
    }

    // Immutable on-air packet. Shared by all receivers of one transmission.
    struct Frame
    {
        FrameType type = FrameType::Data;
        NodeId src = 0;
        NodeId dst = BroadcastId;
        std::int64_t seq = 0;
        Payload payload{};

        // Identity used by interference resolution: by value over every field.
        friend bool operator==(const Frame &lhs, const Frame &rhs)
        {
            return lhs.type == rhs.type && lhs.src == rhs.src && lhs.dst == rhs.dst && lhs.seq == rhs.seq &&
                   lhs.payload == rhs.payload;
        }
    };

    using FramePtr = std::shared_ptr<const Frame>;

    inline FramePtr make_frame(FrameType type, NodeId src, NodeId dst, std::int64_t seq, Payload payload)
    {
        auto f = std::make_shared<Frame>();
        f->type = type;
        f->src = src;
        f->dst = dst;
        f->seq = seq;
        f->payload = std::move(payload);
        return f;
    }

    inline FramePtr make_flood_beacon(NodeId src, std::int64_t seq, std::uint64_t floodId)
    {
        return make_frame(FrameType::FloodBeacon, src, BroadcastId, seq, pack(PayloadFloodBeacon, FloodBeacon{floodId}));
    }

    // Flood beacon body, or nullopt if the frame does not carry one.
    inline std::optional<FloodBeacon> flood_beacon_of(const Frame &f)
    {
        if (f.type != FrameType::FloodBeacon || f.payload.kind != PayloadFloodBeacon ||
            f.payload.bytes.size() != sizeof(FloodBeacon))
        {
            return std::nullopt;
        }
        return unpack<FloodBeacon>(f.payload, PayloadFloodBeacon, "flood beacon");
    }

    // Couples an on-air frame to its transmitter. The transmitter is never part of the frame.
    struct Transmission
    {
        FramePtr frame;
        NodeId senderId = 0;
    };

    // Stable, human-readable form for logs.
    inline std::string describe(const Frame &f)
    {
        std::string out = "{\"TYPE\": \"";
        out += frame_type_name(f.type);
        out += "\", \"SRC\": " + std::to_string(f.src);
        out += ", \"DST\": " + std::to_string(f.dst);
        out += ", \"SEQ\": " + std::to_string(f.seq);
        if (auto beacon = flood_beacon_of(f))
        {
            char hex[17];
            std::snprintf(hex, sizeof(hex), "%016llx", static_cast<unsigned long long>(beacon->floodId));
            out += ", \"PAYLOAD\": {\"FLOOD_ID\": \"";
            out += hex;
            out += "\"}}";
        }
        else
        {
            out += ", \"PAYLOAD\": {\"kind\": " + std::to_string(f.payload.kind) +
                   ", \"bytes\": " + std::to_string(f.payload.bytes.size()) + "}}";
        }
        return out;
    }
}
