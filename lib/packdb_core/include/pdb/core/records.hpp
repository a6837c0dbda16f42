/*
Module Name:
- records.hpp

Abstract:
- Plain stored shapes of the four tracked entity kinds.
- Every record carries an opaque id assigned by its table; child records name
  their parent by id only, so the hierarchy is a set of index lookups rather
  than a web of object references.
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace packdb
{

    // Opaque, never reused within one storage. 0 is never assigned.
    using RecordId = std::uint64_t;
    inline constexpr RecordId kNoRecord = 0;

    // How the client identifies itself to network services.
    enum class Authentication : std::uint8_t
    {
        none,
        nickserv,
    };

    [[nodiscard]] constexpr bool requires_password(Authentication auth) noexcept
    {
        return auth == Authentication::nickserv;
    }

    [[nodiscard]] constexpr std::string_view to_string(Authentication auth) noexcept
    {
        return auth == Authentication::nickserv ? "nickserv" : "none";
    }

    [[nodiscard]] constexpr std::optional<Authentication> parse_authentication(std::string_view text) noexcept
    {
        if (text == "none")
            return Authentication::none;
        if (text == "nickserv")
            return Authentication::nickserv;
        return std::nullopt;
    }

    // Who the client connects as. Replaced as a unit by set_server_identity.
    struct ServerIdentity
    {
        std::string nick;
        std::string user;
        std::string real;
        Authentication auth = Authentication::none;
        std::optional<std::string> user_password;

        friend bool operator==(const ServerIdentity&, const ServerIdentity&) = default;
    };

    struct ServerRecord
    {
        RecordId id = kNoRecord;
        std::string host; // trimmed, lowercase
        std::uint16_t port = 0;
        ServerIdentity identity;
        std::optional<std::string> password; // connection password
    };

    struct ChannelRecord
    {
        RecordId id = kNoRecord;
        RecordId server = kNoRecord;
        std::string name;
        std::optional<std::string> password;
    };

    struct BotRecord
    {
        RecordId id = kNoRecord;
        RecordId channel = kNoRecord;
        std::string name;
        bool list_enabled = false;
    };

    struct PackRecord
    {
        RecordId id = kNoRecord;
        RecordId bot = kNoRecord;
        int number = 0;
        std::string file;
        std::string size; // descriptive, e.g. "1.4G"
    };

    // Composite unique keys. '/' is outside both name grammars, so keys never collide.
    namespace keys
    {
        [[nodiscard]] inline std::string server(std::string_view host)
        {
            return std::string{ host };
        }

        [[nodiscard]] inline std::string channel(RecordId server, std::string_view name)
        {
            return std::to_string(server) + '/' + std::string{ name };
        }

        [[nodiscard]] inline std::string bot(RecordId channel, std::string_view name)
        {
            return std::to_string(channel) + '/' + std::string{ name };
        }

        [[nodiscard]] inline std::string pack(RecordId bot, int number)
        {
            return std::to_string(bot) + '/' + std::to_string(number);
        }
    } // namespace keys

    [[nodiscard]] inline std::string unique_key(const ServerRecord& r)
    {
        return keys::server(r.host);
    }

    [[nodiscard]] inline std::string unique_key(const ChannelRecord& r)
    {
        return keys::channel(r.server, r.name);
    }

    [[nodiscard]] inline std::string unique_key(const BotRecord& r)
    {
        return keys::bot(r.channel, r.name);
    }

    [[nodiscard]] inline std::string unique_key(const PackRecord& r)
    {
        return keys::pack(r.bot, r.number);
    }

} // namespace packdb
