// C++ Standard Library
#include <atomic>
#include <iostream>
#include <mutex>

// Core
#include <pdb/utils/log.hpp>

namespace packdb::log
{

    namespace
    {
        std::atomic<int> g_level{ static_cast<int>(Level::warn) };
        std::mutex g_write_mutex;
    } // namespace

    void set_level(Level lvl) noexcept
    {
        g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
    }

    Level level() noexcept
    {
        return static_cast<Level>(g_level.load(std::memory_order_relaxed));
    }

    std::optional<Level> parse_level(std::string_view text) noexcept
    {
        if (text == "trace")
            return Level::trace;
        if (text == "debug")
            return Level::debug;
        if (text == "info")
            return Level::info;
        if (text == "warn")
            return Level::warn;
        if (text == "error")
            return Level::error;
        if (text == "off")
            return Level::off;
        return std::nullopt;
    }

    std::string_view to_string(Level lvl) noexcept
    {
        switch (lvl)
        {
        case Level::trace:
            return "trace";
        case Level::debug:
            return "debug";
        case Level::info:
            return "info";
        case Level::warn:
            return "warn";
        case Level::error:
            return "error";
        case Level::off:
            return "off";
        }
        return "unknown";
    }

    void write(Level lvl, std::string_view component, std::string_view message) noexcept
    {
        // std::cerr has no exception mask set, so stream failures only set badbit.
        std::lock_guard guard{ g_write_mutex };
        std::cerr << '[' << component << "] " << to_string(lvl) << ": " << message << '\n';
    }

} // namespace packdb::log
