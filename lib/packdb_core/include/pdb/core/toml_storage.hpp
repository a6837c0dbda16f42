/*
Module Name:
- toml_storage.hpp

Abstract:
- Storage backend persisted as a single TOML document.
- load() replaces the tables with the file contents; commit writes a full
  snapshot to "<path>.tmp" and renames it over the target so readers never
  see a partial file.

File layout:
    next_id = 7

    [[server]]
    id = 1
    host = "irc.example.org"
    port = 6667
    nick = "packdb"
    user = "packdb"
    real = "packdb"
    auth = "none"            # or "nickserv"
    user_password = "..."    # optional
    password = "..."         # optional

    [[channel]]
    id = 2
    server = 1
    name = "#files"
    password = "..."         # optional

    [[bot]]
    id = 3
    channel = 2
    name = "Offer"
    list_enabled = false

    [[pack]]
    id = 4
    bot = 3
    number = 1
    file = "a.bin"
    size = "1G"
*/
#pragma once

// C++ Standard Library
#include <filesystem>
#include <string>

// Toml++
#include <toml++/toml.hpp>

// Core
#include <pdb/core/storage.hpp>

namespace packdb
{

    class TomlStorage final : public Storage
    {
    public:
        explicit TomlStorage(std::filesystem::path path) :
            path_{ std::move(path) }
        {
        }

        // Missing file means an empty store. Parse errors, dangling parent ids and
        // duplicate keys throw StorageError and leave the tables empty.
        void load();

        [[nodiscard]] const std::filesystem::path& path() const noexcept
        {
            return path_;
        }

        [[nodiscard]] std::string describe() const override
        {
            return "toml:" + path_.string();
        }

    private:
        void do_commit() override;

        [[nodiscard]] toml::table build_table() const;
        void apply_table(const toml::table& tbl);

        const std::filesystem::path path_;
    };

} // namespace packdb
