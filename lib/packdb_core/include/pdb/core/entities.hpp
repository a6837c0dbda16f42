/*
Module Name:
- entities.hpp

Abstract:
- Read handles for the four entity kinds returned by Controller.
- A handle is a snapshot of its record taken at read time plus a link to the
  controller session it came from. Attribute getters read the snapshot and
  never block.
- Relation getters (children, parent) lock the controller's exclusion domain,
  throw ClosedError once the controller is closed and NotFoundError when the
  record was deleted since the handle was taken. Each call returns fresh
  handles.

Notes:
- Handles are cheap to copy. They compare equal when they name the same
  record of the same controller, regardless of snapshot age.
- Do not resolve relations from inside an Observer callback (deadlock).
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Core
#include <pdb/core/records.hpp>

namespace packdb
{

    namespace detail
    {
        class Session;
        struct EntityFactory;
    } // namespace detail

    class Channel;
    class Bot;
    class Pack;

    class Server
    {
    public:
        [[nodiscard]] RecordId id() const noexcept
        {
            return record_.id;
        }
        [[nodiscard]] const std::string& host() const noexcept
        {
            return record_.host;
        }
        [[nodiscard]] std::uint16_t port() const noexcept
        {
            return record_.port;
        }
        [[nodiscard]] const ServerIdentity& identity() const noexcept
        {
            return record_.identity;
        }
        [[nodiscard]] const std::string& nick_name() const noexcept
        {
            return record_.identity.nick;
        }
        [[nodiscard]] const std::string& user_name() const noexcept
        {
            return record_.identity.user;
        }
        [[nodiscard]] const std::string& real_name() const noexcept
        {
            return record_.identity.real;
        }
        [[nodiscard]] Authentication authentication() const noexcept
        {
            return record_.identity.auth;
        }
        [[nodiscard]] const std::optional<std::string>& user_password() const noexcept
        {
            return record_.identity.user_password;
        }
        [[nodiscard]] const std::optional<std::string>& password() const noexcept
        {
            return record_.password;
        }

        // Current channels of this server.
        [[nodiscard]] std::vector<Channel> channels() const;

        friend bool operator==(const Server& a, const Server& b) noexcept
        {
            return a.session_ == b.session_ && a.record_.id == b.record_.id;
        }

    private:
        friend struct detail::EntityFactory;

        Server(std::shared_ptr<detail::Session> session, ServerRecord record) noexcept;

        std::shared_ptr<detail::Session> session_;
        ServerRecord record_;
    };

    class Channel
    {
    public:
        [[nodiscard]] RecordId id() const noexcept
        {
            return record_.id;
        }
        [[nodiscard]] const std::string& host() const noexcept
        {
            return host_;
        }
        [[nodiscard]] const std::string& name() const noexcept
        {
            return record_.name;
        }
        [[nodiscard]] const std::optional<std::string>& password() const noexcept
        {
            return record_.password;
        }

        [[nodiscard]] Server server() const;
        [[nodiscard]] std::vector<Bot> bots() const;

        friend bool operator==(const Channel& a, const Channel& b) noexcept
        {
            return a.session_ == b.session_ && a.record_.id == b.record_.id;
        }

    private:
        friend struct detail::EntityFactory;

        Channel(std::shared_ptr<detail::Session> session, ChannelRecord record, std::string host) noexcept;

        std::shared_ptr<detail::Session> session_;
        ChannelRecord record_;
        std::string host_;
    };

    class Bot
    {
    public:
        [[nodiscard]] RecordId id() const noexcept
        {
            return record_.id;
        }
        [[nodiscard]] const std::string& host() const noexcept
        {
            return host_;
        }
        // Channel at snapshot time. channel() follows later moves.
        [[nodiscard]] const std::string& channel_name() const noexcept
        {
            return channel_;
        }
        [[nodiscard]] const std::string& name() const noexcept
        {
            return record_.name;
        }
        [[nodiscard]] bool list_enabled() const noexcept
        {
            return record_.list_enabled;
        }

        [[nodiscard]] Channel channel() const;

        // Packs in the order they were added.
        [[nodiscard]] std::vector<Pack> packs() const;

        friend bool operator==(const Bot& a, const Bot& b) noexcept
        {
            return a.session_ == b.session_ && a.record_.id == b.record_.id;
        }

    private:
        friend struct detail::EntityFactory;

        Bot(std::shared_ptr<detail::Session> session, BotRecord record, std::string host, std::string channel) noexcept;

        std::shared_ptr<detail::Session> session_;
        BotRecord record_;
        std::string host_;
        std::string channel_;
    };

    class Pack
    {
    public:
        [[nodiscard]] RecordId id() const noexcept
        {
            return record_.id;
        }
        [[nodiscard]] const std::string& host() const noexcept
        {
            return host_;
        }
        [[nodiscard]] const std::string& channel_name() const noexcept
        {
            return channel_;
        }
        [[nodiscard]] const std::string& bot_name() const noexcept
        {
            return bot_;
        }
        [[nodiscard]] int number() const noexcept
        {
            return record_.number;
        }
        [[nodiscard]] const std::string& file_name() const noexcept
        {
            return record_.file;
        }
        [[nodiscard]] const std::string& file_size() const noexcept
        {
            return record_.size;
        }

        [[nodiscard]] Bot bot() const;

        friend bool operator==(const Pack& a, const Pack& b) noexcept
        {
            return a.session_ == b.session_ && a.record_.id == b.record_.id;
        }

    private:
        friend struct detail::EntityFactory;

        Pack(std::shared_ptr<detail::Session> session,
             PackRecord record,
             std::string host,
             std::string channel,
             std::string bot) noexcept;

        std::shared_ptr<detail::Session> session_;
        PackRecord record_;
        std::string host_;
        std::string channel_;
        std::string bot_;
    };

} // namespace packdb
