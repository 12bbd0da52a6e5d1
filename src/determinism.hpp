#pragma once

#include "event.hpp"
#include "node.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace wsnsim
{
    // A commutative, multiplicity-sensitive digest for determinism checks.
    //
    // Each item contributes a per-item 64-bit hash combined via both SUM and XOR. SUM
    // preserves multiplicity; XOR is an additional independent check. Fired events are
    // hashed with their stamp, so any change in event order changes the digest.
    struct RunDigest
    {
        std::uint64_t firedEventSum = 0;
        std::uint64_t firedEventXor = 0;
        std::uint64_t nodeStateSum = 0;
        std::uint64_t nodeStateXor = 0;

        bool operator==(const RunDigest &o) const noexcept
        {
            return firedEventSum == o.firedEventSum && firedEventXor == o.firedEventXor &&
                   nodeStateSum == o.nodeStateSum && nodeStateXor == o.nodeStateXor;
        }

        // Single value for printing.
        std::uint64_t combined() const noexcept
        {
            return firedEventSum ^ (firedEventXor * 0x9e3779b97f4a7c15ULL) ^ (nodeStateSum << 1) ^ nodeStateXor;
        }
    };

    namespace detail
    {
        inline std::uint64_t fnv1a64(std::span<const std::byte> bytes) noexcept
        {
            std::uint64_t h = 1469598103934665603ULL;
            for (const std::byte b : bytes)
            {
                h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(b));
                h *= 1099511628211ULL;
            }
            return h;
        }

        template <class T>
        inline void append_trivial(std::vector<std::byte> &out, const T &v)
        {
            static_assert(std::is_trivially_copyable_v<T>);
            const std::size_t off = out.size();
            out.resize(off + sizeof(T));
            std::memcpy(out.data() + off, &v, sizeof(T));
        }

        // Ordinal makes the per-event hash order-sensitive inside a commutative digest.
        inline std::uint64_t hash_fired_event(std::uint64_t ordinal, TimeStamp ts)
        {
            std::vector<std::byte> buf;
            buf.reserve(24);
            append_trivial(buf, ordinal);
            append_trivial(buf, ts.time);
            append_trivial(buf, ts.sequence);
            return fnv1a64(std::span<const std::byte>(buf.data(), buf.size()));
        }

        inline std::uint64_t hash_node_state(const Node &node)
        {
            std::vector<std::byte> buf;
            buf.reserve(64);
            append_trivial(buf, node.id());
            append_trivial(buf, node.tx_count());
            for (const auto &[floodId, times] : node.flood_times())
            {
                append_trivial(buf, floodId);
                const std::uint64_t n = static_cast<std::uint64_t>(times.size());
                append_trivial(buf, n);
                for (const SimTime t : times)
                {
                    append_trivial(buf, t);
                }
            }
            return fnv1a64(std::span<const std::byte>(buf.data(), buf.size()));
        }
    }

    class DeterminismAccumulator
    {
    public:
        void on_fired_event(TimeStamp ts)
        {
            const std::uint64_t h = detail::hash_fired_event(m_ordinal++, ts);
            m_digest.firedEventSum += h;
            m_digest.firedEventXor ^= h;
        }

        void on_final_node(const Node &node)
        {
            const std::uint64_t h = detail::hash_node_state(node);
            m_digest.nodeStateSum += h;
            m_digest.nodeStateXor ^= h;
        }

        const RunDigest &digest() const noexcept { return m_digest; }

    private:
        RunDigest m_digest{};
        std::uint64_t m_ordinal = 0;
    };
}
