/*
Module Name:
- toml_storage.cpp

Abstract:
- TOML load and snapshot for TomlStorage.

Why:
- Commits must be durable before observers hear about them, so the write is
  synchronous, unlike a debounced save.
- Write to a temp file then rename atomically so a crash never leaves a torn file.
- Loading validates the tree (parents exist, keys unique and canonical, names
  match their grammars) so a hand edited file cannot produce records the
  controller would never reach.
*/

// C++ Standard Library
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

// Core
#include <pdb/core/errors.hpp>
#include <pdb/core/toml_storage.hpp>
#include <pdb/core/validation.hpp>
#include <pdb/utils/log.hpp>

namespace packdb
{

    namespace
    {
        // Return a string at key or throw StorageError naming the section.
        std::string require_string(const toml::table& row, std::string_view key, std::string_view section)
        {
            if (auto v = row[key].value<std::string>())
                return *v;
            throw StorageError("Missing string '" + std::string{ key } + "' in [[" + std::string{ section } + "]]");
        }

        std::int64_t require_integer(const toml::table& row, std::string_view key, std::string_view section)
        {
            if (auto v = row[key].value<std::int64_t>())
                return *v;
            throw StorageError("Missing integer '" + std::string{ key } + "' in [[" + std::string{ section } + "]]");
        }

        RecordId require_id(const toml::table& row, std::string_view key, std::string_view section)
        {
            const auto v = require_integer(row, key, section);
            if (v <= 0)
                throw StorageError("Invalid record id in [[" + std::string{ section } + "]]");
            return static_cast<RecordId>(v);
        }

        std::optional<std::string> optional_string(const toml::table& row, std::string_view key)
        {
            return row[key].value<std::string>();
        }

        // Calls fn for every table in the array of tables named section.
        template<class Fn>
        void for_each_row(const toml::table& root, std::string_view section, Fn&& fn)
        {
            const auto* arr = root.get_as<toml::array>(section);
            if (!arr)
                return;
            for (const auto& node : *arr)
            {
                const auto* row = node.as_table();
                if (!row)
                    throw StorageError("Expected a table in [[" + std::string{ section } + "]]");
                fn(*row);
            }
        }

        // Runs the same checks the controller applies to its input and reports a
        // failure as a StorageError against the offending section.
        template<class Fn>
        void require_valid(std::string_view section, Fn&& check)
        {
            try
            {
                check();
            }
            catch (const ValidationError& e)
            {
                throw StorageError("Invalid entry in [[" + std::string{ section } + "]]: " + e.what());
            }
        }

        void insert_optional(toml::table& row, std::string_view key, const std::optional<std::string>& value)
        {
            if (value)
                row.insert(key, *value);
        }
    } // namespace

    void TomlStorage::load()
    {
        clear_tables();

        std::error_code ec;
        if (!std::filesystem::exists(path_, ec))
        {
            log::debug("storage", "{} does not exist yet, starting empty", path_.string());
            return;
        }

        toml::table tbl;
        try
        {
            tbl = toml::parse_file(path_.string());
        }
        catch (const toml::parse_error& e)
        {
            throw StorageError("TOML parse error in '" + path_.string() + "': " + std::string{ e.description() });
        }

        try
        {
            apply_table(tbl);
        }
        catch (...)
        {
            clear_tables();
            throw;
        }

        log::debug("storage",
                   "loaded {} servers, {} channels, {} bots, {} packs from {}",
                   servers().size(),
                   channels().size(),
                   bots().size(),
                   packs().size(),
                   path_.string());
    }

    void TomlStorage::apply_table(const toml::table& tbl)
    {
        for_each_row(tbl, "server", [&](const toml::table& row) {
            ServerRecord rec;
            rec.id = require_id(row, "id", "server");
            rec.host = require_string(row, "host", "server");
            const auto port = require_integer(row, "port", "server");
            if (port < 0 || port > 65535)
                throw StorageError("Port out of range for server " + rec.host);
            rec.port = static_cast<std::uint16_t>(port);
            rec.identity.nick = require_string(row, "nick", "server");
            rec.identity.user = require_string(row, "user", "server");
            rec.identity.real = require_string(row, "real", "server");
            const auto auth = parse_authentication(require_string(row, "auth", "server"));
            if (!auth)
                throw StorageError("Unknown authentication for server " + rec.host);
            rec.identity.auth = *auth;
            rec.identity.user_password = optional_string(row, "user_password");
            rec.password = optional_string(row, "password");
            require_valid("server", [&] {
                if (validate::host(rec.host) != rec.host)
                    throw ValidationError("Host '" + rec.host + "' is not trimmed and lowercase");
                validate::nickname(rec.identity.nick);
                validate::authentication(rec.identity.auth, rec.identity.user_password);
            });
            servers().restore(std::move(rec));
        });

        for_each_row(tbl, "channel", [&](const toml::table& row) {
            ChannelRecord rec;
            rec.id = require_id(row, "id", "channel");
            rec.server = require_id(row, "server", "channel");
            rec.name = require_string(row, "name", "channel");
            rec.password = optional_string(row, "password");
            require_valid("channel", [&] { validate::channel_name(rec.name); });
            if (!servers().find(rec.server))
                throw StorageError("Channel " + rec.name + " refers to a missing server");
            channels().restore(std::move(rec));
        });

        for_each_row(tbl, "bot", [&](const toml::table& row) {
            BotRecord rec;
            rec.id = require_id(row, "id", "bot");
            rec.channel = require_id(row, "channel", "bot");
            rec.name = require_string(row, "name", "bot");
            rec.list_enabled = row["list_enabled"].value_or(false);
            require_valid("bot", [&] { validate::nickname(rec.name); });
            if (!channels().find(rec.channel))
                throw StorageError("Bot " + rec.name + " refers to a missing channel");
            bots().restore(std::move(rec));
        });

        for_each_row(tbl, "pack", [&](const toml::table& row) {
            PackRecord rec;
            rec.id = require_id(row, "id", "pack");
            rec.bot = require_id(row, "bot", "pack");
            const auto number = require_integer(row, "number", "pack");
            if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max())
                throw StorageError("Pack number " + std::to_string(number) + " is out of range");
            rec.number = static_cast<int>(number);
            rec.file = require_string(row, "file", "pack");
            rec.size = require_string(row, "size", "pack");
            require_valid("pack", [&] { validate::file_name(rec.file); });
            if (!bots().find(rec.bot))
                throw StorageError("Pack #" + std::to_string(rec.number) + " refers to a missing bot");
            packs().restore(std::move(rec));
        });

        // restore() already moved the counter past every id; a larger stored value wins
        // so ids freed by deletions before the last save are not handed out again.
        if (auto stored = tbl["next_id"].value<std::int64_t>(); stored && *stored > 0)
            set_next_id(std::max(next_id(), static_cast<RecordId>(*stored)));
    }

    toml::table TomlStorage::build_table() const
    {
        toml::table tbl;
        tbl.insert("next_id", static_cast<std::int64_t>(next_id()));

        toml::array servers_arr;
        for (const auto& [id, s] : servers())
        {
            toml::table row;
            row.insert("id", static_cast<std::int64_t>(id));
            row.insert("host", s.host);
            row.insert("port", static_cast<std::int64_t>(s.port));
            row.insert("nick", s.identity.nick);
            row.insert("user", s.identity.user);
            row.insert("real", s.identity.real);
            row.insert("auth", std::string{ to_string(s.identity.auth) });
            insert_optional(row, "user_password", s.identity.user_password);
            insert_optional(row, "password", s.password);
            servers_arr.push_back(std::move(row));
        }
        tbl.insert("server", std::move(servers_arr));

        toml::array channels_arr;
        for (const auto& [id, c] : channels())
        {
            toml::table row;
            row.insert("id", static_cast<std::int64_t>(id));
            row.insert("server", static_cast<std::int64_t>(c.server));
            row.insert("name", c.name);
            insert_optional(row, "password", c.password);
            channels_arr.push_back(std::move(row));
        }
        tbl.insert("channel", std::move(channels_arr));

        toml::array bots_arr;
        for (const auto& [id, b] : bots())
        {
            toml::table row;
            row.insert("id", static_cast<std::int64_t>(id));
            row.insert("channel", static_cast<std::int64_t>(b.channel));
            row.insert("name", b.name);
            row.insert("list_enabled", b.list_enabled);
            bots_arr.push_back(std::move(row));
        }
        tbl.insert("bot", std::move(bots_arr));

        toml::array packs_arr;
        for (const auto& [id, p] : packs())
        {
            toml::table row;
            row.insert("id", static_cast<std::int64_t>(id));
            row.insert("bot", static_cast<std::int64_t>(p.bot));
            row.insert("number", static_cast<std::int64_t>(p.number));
            row.insert("file", p.file);
            row.insert("size", p.size);
            packs_arr.push_back(std::move(row));
        }
        tbl.insert("pack", std::move(packs_arr));

        return tbl;
    }

    void TomlStorage::do_commit()
    {
        const toml::table tbl = build_table();

        std::error_code ec;
        if (!path_.parent_path().empty())
            std::filesystem::create_directories(path_.parent_path(), ec);

        const auto tmp = path_.string() + ".tmp";
        {
            std::ofstream out{ tmp, std::ios::trunc | std::ios::binary };
            if (!out)
                throw StorageError("Cannot open " + tmp + " for writing");

            std::ostringstream oss;
            oss << tbl;
            const auto data = oss.str();
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
            out.flush();
            if (!out)
                throw StorageError("Write failed: " + tmp);
        }

        std::filesystem::rename(tmp, path_, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw StorageError("Rename of " + tmp + " failed: " + ec.message());
        }
    }

} // namespace packdb
