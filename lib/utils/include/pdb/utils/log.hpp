/*
Module Name:
- log.hpp

Abstract:
- Process wide, level filtered diagnostics written to std::cerr as
  "[component] message" lines.
- Formatting is skipped entirely when the level is filtered out.
- The threshold is an atomic so any thread may change it at runtime.
*/
#pragma once

// C++ Standard Library
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Core
#include <pdb/utils/attributes.hpp>

namespace packdb::log
{

    enum class Level : int
    {
        trace = 0,
        debug,
        info,
        warn,
        error,
        off,
    };

    // Defaults to warn so library users are not flooded.
    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() noexcept;

    [[nodiscard]] PDB_FORCE_INLINE bool enabled(Level lvl) noexcept
    {
        return lvl != Level::off && static_cast<int>(lvl) >= static_cast<int>(level());
    }

    // Case sensitive: "trace", "debug", "info", "warn", "error", "off".
    [[nodiscard]] std::optional<Level> parse_level(std::string_view text) noexcept;
    [[nodiscard]] std::string_view to_string(Level lvl) noexcept;

    // Serialised so concurrent lines never interleave.
    void write(Level lvl, std::string_view component, std::string_view message) noexcept;

    template<class... Args>
    void trace(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::trace))
            write(Level::trace, component, std::format(fmt, std::forward<Args>(args)...));
    }

    template<class... Args>
    void debug(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::debug))
            write(Level::debug, component, std::format(fmt, std::forward<Args>(args)...));
    }

    template<class... Args>
    void info(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::info))
            write(Level::info, component, std::format(fmt, std::forward<Args>(args)...));
    }

    template<class... Args>
    void warn(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::warn))
            write(Level::warn, component, std::format(fmt, std::forward<Args>(args)...));
    }

    template<class... Args>
    void error(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(Level::error))
            write(Level::error, component, std::format(fmt, std::forward<Args>(args)...));
    }

} // namespace packdb::log
