#pragma once

#include "common.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace wsnsim
{
    enum class LogLevel : std::uint8_t
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
        Off = 255,
    };

    inline const char *log_level_name(LogLevel lvl) noexcept
    {
        switch (lvl)
        {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    class Logger
    {
    public:
        static Logger &instance()
        {
            static Logger g;
            return g;
        }

        void set_level(LogLevel lvl)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_level = lvl;
        }

        LogLevel level() const noexcept { return m_level; }

        bool enabled(LogLevel lvl) const noexcept { return log_enabled(m_level, lvl); }

        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        // `node` == 0 omits the node column (used by the medium and the drivers).
        void logf(LogLevel lvl, SimTime now, const char *component, NodeId node, const char *fmt, ...)
        {
            if (!log_enabled(m_level, lvl))
            {
                return;
            }

            char origin[64];
            if (node != 0)
            {
                std::snprintf(origin, sizeof(origin), "%-6s %u", component, static_cast<unsigned>(node));
            }
            else
            {
                std::snprintf(origin, sizeof(origin), "%s", component);
            }

            va_list args;
            va_start(args, fmt);
            vwrite_(lvl, now, origin, fmt, args);
            va_end(args);
        }

        // Node lines also carry the node's hop distance to the sink.
        void logf_hop(LogLevel lvl, SimTime now, const char *component, NodeId node, std::uint32_t hop, const char *fmt, ...)
        {
            if (!log_enabled(m_level, lvl))
            {
                return;
            }

            char origin[64];
            std::snprintf(origin, sizeof(origin), "%-6s %u (hop %u)", component, static_cast<unsigned>(node),
                          static_cast<unsigned>(hop));

            va_list args;
            va_start(args, fmt);
            vwrite_(lvl, now, origin, fmt, args);
            va_end(args);
        }

    private:
        Logger() = default;

        void vwrite_(LogLevel lvl, SimTime now, const char *origin, const char *fmt, va_list args)
        {
            char buf[1024];
            std::vsnprintf(buf, sizeof(buf), fmt, args);

            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_sink)
            {
                return;
            }
            // Ticks are milliseconds; print seconds.
            const double seconds = static_cast<double>(now) / 1000.0;
            std::fprintf(m_sink, "[%s][t=%9.3f][%s] %s\n", log_level_name(lvl), seconds, origin, buf);
            std::fflush(m_sink);
        }

        mutable std::mutex m_mu;
        LogLevel m_level = LogLevel::Off;
        FILE *m_sink = stderr;
    };
}
