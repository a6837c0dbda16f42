/*
Module Name:
- config.hpp

Abstract:
- Immutable packdb configuration loaded from a single TOML file.
- Surfaces typed sections (storage, async, log) and the absolute file path.
- Fails fast with ConfigError on an invalid or missing file. Only
  storage.path is mandatory, and only for the toml backend.

File layout:
    [storage]
    backend = "toml"            # or "memory"
    path = "packdb-store.toml"  # relative paths resolve against the config file

    [async]
    close_timeout_ms = 5000

    [log]
    level = "info"              # trace, debug, info, warn, error, off
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>

// Core
#include <pdb/core/storage.hpp>
#include <pdb/utils/log.hpp>

namespace packdb
{

    inline constexpr std::chrono::milliseconds kDefaultCloseTimeout{ 5000 };

    struct AsyncConfig
    {
        std::chrono::milliseconds close_timeout = kDefaultCloseTimeout;
    };

    struct LogConfig
    {
        log::Level level = log::Level::warn;
    };

    class Config
    {
    public:
        /// Load from the file at path.
        /// Pre: !path.empty()
        static Config load_file(const std::filesystem::path& path);

        /// Load from "./packdb.toml".
        static Config load();

        [[nodiscard]] const StorageConfig& storage() const noexcept
        {
            return storage_;
        }
        [[nodiscard]] const AsyncConfig& async() const noexcept
        {
            return async_;
        }
        [[nodiscard]] const LogConfig& logging() const noexcept
        {
            return log_;
        }
        /// Absolute path to the loaded config file.
        [[nodiscard]] const std::filesystem::path& path() const noexcept
        {
            return path_;
        }

        /// Push the configured level into packdb::log.
        void apply_log_level() const noexcept;

    private:
        static Config parse_config(const std::filesystem::path& path);

        Config(std::filesystem::path path, StorageConfig storage_cfg, AsyncConfig async_cfg, LogConfig log_cfg) noexcept :
            path_{ std::move(path) }, storage_{ std::move(storage_cfg) }, async_{ async_cfg }, log_{ log_cfg }
        {
        }

        std::filesystem::path path_;
        StorageConfig storage_;
        AsyncConfig async_;
        LogConfig log_;
    };

} // namespace packdb
