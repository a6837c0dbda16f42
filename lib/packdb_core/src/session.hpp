/*
Module Name:
- session.hpp

Abstract:
- State shared by a Controller and every entity handle it returned: the
  exclusion domain (one mutex) and the storage it guards.
- Closing releases the storage; from then on acquire() throws ClosedError, which
  is how stale handles fail instead of reading released state.
- EntityFactory turns records into handles, filling in parent keys by id lookup.
*/
#pragma once

// C++ Standard Library
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

// GSL
#include <gsl/gsl>

// Core
#include <pdb/core/entities.hpp>
#include <pdb/core/errors.hpp>
#include <pdb/core/storage.hpp>

namespace packdb::detail
{

    class Session
    {
    public:
        explicit Session(std::unique_ptr<Storage> storage) noexcept :
            storage_{ std::move(storage) }
        {
        }

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        // Enter the exclusion domain. Throws ClosedError (without holding the lock)
        // once the session is closed. what names the attempted operation.
        [[nodiscard]] std::unique_lock<std::mutex> acquire(std::string_view what)
        {
            std::unique_lock lock{ mutex_ };
            if (!storage_)
                throw ClosedError("Can't " + std::string{ what } + " on a closed database controller");
            return lock;
        }

        // Enter without the open check, for close() and is_closed().
        [[nodiscard]] std::unique_lock<std::mutex> lock()
        {
            return std::unique_lock{ mutex_ };
        }

        // Pre: lock held, session open.
        [[nodiscard]] Storage& storage() noexcept
        {
            Expects(storage_ != nullptr);
            return *storage_;
        }

        // Pre: lock held.
        [[nodiscard]] bool closed() const noexcept
        {
            return storage_ == nullptr;
        }

        // Pre: lock held. Hands the storage to the caller and marks the session closed.
        [[nodiscard]] std::unique_ptr<Storage> release() noexcept
        {
            return std::move(storage_);
        }

    private:
        std::mutex mutex_;
        std::unique_ptr<Storage> storage_;
    };

    // Pre for all members: session lock held and session open.
    struct EntityFactory
    {
        static Server server(const std::shared_ptr<Session>& session, const ServerRecord& rec)
        {
            return Server{ session, rec };
        }

        static Channel channel(const std::shared_ptr<Session>& session, const ChannelRecord& rec)
        {
            const auto* server = session->storage().servers().find(rec.server);
            Expects(server != nullptr);
            return Channel{ session, rec, server->host };
        }

        static Bot bot(const std::shared_ptr<Session>& session, const BotRecord& rec)
        {
            auto& st = session->storage();
            const auto* channel = st.channels().find(rec.channel);
            Expects(channel != nullptr);
            const auto* server = st.servers().find(channel->server);
            Expects(server != nullptr);
            return Bot{ session, rec, server->host, channel->name };
        }

        static Pack pack(const std::shared_ptr<Session>& session, const PackRecord& rec)
        {
            auto& st = session->storage();
            const auto* bot = st.bots().find(rec.bot);
            Expects(bot != nullptr);
            const auto* channel = st.channels().find(bot->channel);
            Expects(channel != nullptr);
            const auto* server = st.servers().find(channel->server);
            Expects(server != nullptr);
            return Pack{ session, rec, server->host, channel->name, bot->name };
        }
    };

} // namespace packdb::detail
