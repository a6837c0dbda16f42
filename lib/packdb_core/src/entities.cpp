/*
Module Name:
- entities.cpp

Abstract:
- Relation lookups for entity handles. Each one enters the owning controller's
  exclusion domain, re-reads the current records by id and builds fresh handles.
*/

// C++ Standard Library
#include <string>
#include <utility>

// Core
#include "session.hpp"

namespace packdb
{

    namespace
    {
        [[noreturn]] void throw_gone(std::string_view kind, std::string_view name)
        {
            throw NotFoundError("The " + std::string{ kind } + " " + std::string{ name } + " no longer exists");
        }
    } // namespace

    Server::Server(std::shared_ptr<detail::Session> session, ServerRecord record) noexcept :
        session_{ std::move(session) }, record_{ std::move(record) }
    {
    }

    std::vector<Channel> Server::channels() const
    {
        Expects(session_ != nullptr);
        auto lock = session_->acquire("retrieve relations");
        const auto& st = session_->storage();
        if (!st.servers().find(record_.id))
            throw_gone("server", record_.host);

        std::vector<Channel> out;
        for (const auto& rec : st.channels().select([&](const ChannelRecord& c) { return c.server == record_.id; }))
            out.push_back(detail::EntityFactory::channel(session_, rec));
        return out;
    }

    Channel::Channel(std::shared_ptr<detail::Session> session, ChannelRecord record, std::string host) noexcept :
        session_{ std::move(session) }, record_{ std::move(record) }, host_{ std::move(host) }
    {
    }

    Server Channel::server() const
    {
        Expects(session_ != nullptr);
        auto lock = session_->acquire("retrieve relations");
        const auto& st = session_->storage();
        const auto* self = st.channels().find(record_.id);
        if (!self)
            throw_gone("channel", record_.name);
        const auto* parent = st.servers().find(self->server);
        Expects(parent != nullptr);
        return detail::EntityFactory::server(session_, *parent);
    }

    std::vector<Bot> Channel::bots() const
    {
        Expects(session_ != nullptr);
        auto lock = session_->acquire("retrieve relations");
        const auto& st = session_->storage();
        if (!st.channels().find(record_.id))
            throw_gone("channel", record_.name);

        std::vector<Bot> out;
        for (const auto& rec : st.bots().select([&](const BotRecord& b) { return b.channel == record_.id; }))
            out.push_back(detail::EntityFactory::bot(session_, rec));
        return out;
    }

    Bot::Bot(std::shared_ptr<detail::Session> session, BotRecord record, std::string host, std::string channel) noexcept :
        session_{ std::move(session) }, record_{ std::move(record) }, host_{ std::move(host) }, channel_{ std::move(channel) }
    {
    }

    Channel Bot::channel() const
    {
        Expects(session_ != nullptr);
        auto lock = session_->acquire("retrieve relations");
        const auto& st = session_->storage();
        const auto* self = st.bots().find(record_.id);
        if (!self)
            throw_gone("bot", record_.name);
        const auto* parent = st.channels().find(self->channel);
        Expects(parent != nullptr);
        return detail::EntityFactory::channel(session_, *parent);
    }

    std::vector<Pack> Bot::packs() const
    {
        Expects(session_ != nullptr);
        auto lock = session_->acquire("retrieve relations");
        const auto& st = session_->storage();
        if (!st.bots().find(record_.id))
            throw_gone("bot", record_.name);

        std::vector<Pack> out;
        for (const auto& rec : st.packs().select([&](const PackRecord& p) { return p.bot == record_.id; }))
            out.push_back(detail::EntityFactory::pack(session_, rec));
        return out;
    }

    Pack::Pack(std::shared_ptr<detail::Session> session,
               PackRecord record,
               std::string host,
               std::string channel,
               std::string bot) noexcept :
        session_{ std::move(session) },
        record_{ std::move(record) },
        host_{ std::move(host) },
        channel_{ std::move(channel) },
        bot_{ std::move(bot) }
    {
    }

    Bot Pack::bot() const
    {
        Expects(session_ != nullptr);
        auto lock = session_->acquire("retrieve relations");
        const auto& st = session_->storage();
        const auto* self = st.packs().find(record_.id);
        if (!self)
            throw_gone("pack", std::to_string(record_.number));
        const auto* parent = st.bots().find(self->bot);
        Expects(parent != nullptr);
        return detail::EntityFactory::bot(session_, *parent);
    }

} // namespace packdb
