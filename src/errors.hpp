#pragma once

#include <stdexcept>
#include <string>

namespace wsnsim
{
    // All structural failures are fatal to a run. Frame losses on the medium are
    // normal outcomes and are never reported through these types.
    class Error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // A parameter is outside its valid range.
    class ConfigurationError final : public Error
    {
    public:
        using Error::Error;
    };

    class DuplicateNodeError final : public Error
    {
    public:
        using Error::Error;
    };

    class NotFoundError final : public Error
    {
    public:
        using Error::Error;
    };

    // The medium was used before any endpoint was attached.
    class ChannelUnavailable final : public Error
    {
    public:
        using Error::Error;
    };

    // Negative delay, or an absolute time in the past.
    class InvalidDelay final : public Error
    {
    public:
        using Error::Error;
    };
}
