// C++ Standard Library
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <utility>

// Toml++
#include <toml++/toml.hpp>

// Core
#include <pdb/core/config.hpp>
#include <pdb/core/errors.hpp>

namespace packdb
{

    namespace
    {
        // Walk a dotted key path. Missing keys yield nullptr; a non-table on the way throws.
        const toml::node* lookup(const toml::table& root,
                                 std::initializer_list<std::string_view> keys,
                                 const std::string& path_str)
        {
            const toml::node* node = &root;
            for (auto key : keys)
            {
                const auto* table_ptr = node->as_table();
                if (!table_ptr)
                    throw ConfigError("Expected table while reading '" + path_str + "'");
                node = table_ptr->get(key);
                if (!node)
                    return nullptr;
            }
            return node;
        }

        // Optional non-empty string; present but empty or mistyped throws.
        std::optional<std::string> fetch_optional_string(const toml::table& root,
                                                         std::initializer_list<std::string_view> keys,
                                                         std::string_view name,
                                                         const std::string& path_str)
        {
            const auto* node = lookup(root, keys, path_str);
            if (!node)
                return std::nullopt;
            if (auto opt = node->value<std::string>(); opt && !opt->empty())
                return *opt;
            throw ConfigError("Invalid value for '" + std::string{ name } + "' in " + path_str);
        }

        std::optional<std::int64_t> fetch_optional_integer(const toml::table& root,
                                                           std::initializer_list<std::string_view> keys,
                                                           std::string_view name,
                                                           const std::string& path_str)
        {
            const auto* node = lookup(root, keys, path_str);
            if (!node)
                return std::nullopt;
            if (auto opt = node->value<std::int64_t>())
                return *opt;
            throw ConfigError("Invalid value for '" + std::string{ name } + "' in " + path_str);
        }

        StorageBackend parse_backend(std::string_view text, const std::string& path_str)
        {
            if (text == "memory")
                return StorageBackend::memory;
            if (text == "toml")
                return StorageBackend::toml;
            throw ConfigError("Unknown storage backend '" + std::string{ text } + "' in " + path_str);
        }
    } // namespace

    // Read, validate and convert the TOML file at path.
    Config Config::parse_config(const std::filesystem::path& path)
    {
        const auto path_str = path.string();
        toml::table tbl;

        try
        {
            tbl = toml::parse_file(path_str);
        }
        catch (const toml::parse_error& e)
        {
            throw ConfigError("TOML parse error in '" + path_str + "': " + std::string{ e.what() });
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw ConfigError("Cannot read config file '" + path_str + "': " + std::string{ e.what() });
        }

        StorageConfig storage_cfg{};
        if (auto backend = fetch_optional_string(tbl, { "storage", "backend" }, "storage.backend", path_str))
            storage_cfg.backend = parse_backend(*backend, path_str);
        if (auto file = fetch_optional_string(tbl, { "storage", "path" }, "storage.path", path_str))
        {
            std::filesystem::path p{ *file };
            storage_cfg.path = p.is_relative() ? path.parent_path() / p : std::move(p);
        }
        if (storage_cfg.backend == StorageBackend::toml && storage_cfg.path.empty())
            throw ConfigError("Missing key 'path' in [storage] of " + path_str);

        AsyncConfig async_cfg{};
        if (auto ms = fetch_optional_integer(tbl, { "async", "close_timeout_ms" }, "async.close_timeout_ms", path_str))
        {
            if (*ms < 0)
                throw ConfigError("async.close_timeout_ms must not be negative in " + path_str);
            async_cfg.close_timeout = std::chrono::milliseconds{ *ms };
        }

        LogConfig log_cfg{};
        if (auto level = fetch_optional_string(tbl, { "log", "level" }, "log.level", path_str))
        {
            auto parsed = log::parse_level(*level);
            if (!parsed)
                throw ConfigError("Unknown log level '" + *level + "' in " + path_str);
            log_cfg.level = *parsed;
        }

        return Config(path, std::move(storage_cfg), async_cfg, log_cfg);
    }

    Config Config::load_file(const std::filesystem::path& path)
    {
        if (path.string().empty())
            throw ConfigError("Config file path must not be empty");
        return parse_config(std::filesystem::absolute(path));
    }

    Config Config::load()
    {
        const auto default_path = std::filesystem::current_path() / "packdb.toml";
        if (!std::filesystem::exists(default_path))
            throw ConfigError("Config file not found at '" + default_path.string() + "'");
        return parse_config(default_path);
    }

    void Config::apply_log_level() const noexcept
    {
        log::set_level(log_.level);
    }

} // namespace packdb
