#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <type_traits>
#include <vector>

namespace wsnsim
{
    // Simulated ticks (interpreted as milliseconds).
    using SimTime = std::uint64_t;

    // Signed so that a negative delay is representable (and rejected).
    using SimDuration = std::int64_t;

    // 0 is reserved for broadcast.
    using NodeId = std::uint32_t;
    inline constexpr NodeId BroadcastId = 0;

    using ChannelId = std::uint32_t;

    using ByteBuffer = std::vector<std::byte>;

    struct Payload
    {
        std::uint32_t kind = 0;
        ByteBuffer bytes;

        friend bool operator==(const Payload &lhs, const Payload &rhs)
        {
            return lhs.kind == rhs.kind && lhs.bytes == rhs.bytes;
        }
    };

    template <class T>
    inline ByteBuffer bytes_from_trivially_copyable(const T &value)
    {
        static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
        ByteBuffer out(sizeof(T));
        std::memcpy(out.data(), &value, sizeof(T));
        return out;
    }
}
