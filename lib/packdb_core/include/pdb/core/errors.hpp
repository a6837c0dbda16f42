/*
Module Name:
- errors.hpp

Abstract:
- Exception taxonomy shared by the validators, the storage backends and both
  controllers. Callers can catch packdb::Error for everything or a concrete
  type when the recovery differs.

Kinds:
- ValidationError   malformed or missing input, raised before any mutation
- PreconditionError missing parent, duplicate key, no-op move
- NotFoundError     relation lookup through a handle whose record was deleted
- ClosedError       any use of a controller (or its entities) after close
- InterruptedError  stop requested while draining the async queue
- CancelledError    result requested from a cancelled deferred handle
- StorageError      backend load or commit failure
- ConfigError       configuration file missing or invalid
*/
#pragma once

// C++ Standard Library
#include <stdexcept>
#include <string>

namespace packdb
{

    class Error : public std::runtime_error
    {
    public:
        explicit Error(const std::string& msg) :
            std::runtime_error{ msg }
        {
        }
    };

    class ValidationError final : public Error
    {
    public:
        using Error::Error;
    };

    class PreconditionError final : public Error
    {
    public:
        using Error::Error;
    };

    class NotFoundError final : public Error
    {
    public:
        using Error::Error;
    };

    class ClosedError final : public Error
    {
    public:
        using Error::Error;
    };

    class InterruptedError final : public Error
    {
    public:
        using Error::Error;
    };

    class CancelledError final : public Error
    {
    public:
        using Error::Error;
    };

    class StorageError final : public Error
    {
    public:
        using Error::Error;
    };

    class ConfigError final : public Error
    {
    public:
        using Error::Error;
    };

} // namespace packdb
