/*
Module Name:
- controller.hpp

Abstract:
- Synchronous, thread safe front end to a Storage holding the
  server > channel > bot > pack tree.
- Every public operation runs inside one exclusion domain per controller, so
  one operation (commit and notifications included) completes before the next
  one starts.
- Structural rules (unique keys, parents before children) are checked here by
  hand before storage is touched.

Errors:
- ValidationError for malformed input, PreconditionError for missing parents,
  duplicates and no-op moves, ClosedError after close(), StorageError when the
  backend cannot commit.
- Lookups, set_* and delete_* on missing entities are soft: empty optional or
  false.

Notifications:
- Observers hear about a change only after it was committed, from inside the
  exclusion domain. Each commit raises on_flush() first.
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Core
#include <pdb/core/entities.hpp>
#include <pdb/core/observer.hpp>
#include <pdb/core/records.hpp>
#include <pdb/core/storage.hpp>

namespace packdb
{

    namespace detail
    {
        class Session;
    } // namespace detail

    class Controller
    {
    public:
        // Pre: storage is non-null and open.
        explicit Controller(std::unique_ptr<Storage> storage);

        // Closes the controller if the owner did not.
        ~Controller();

        Controller(const Controller&) = delete;
        Controller& operator=(const Controller&) = delete;
        Controller(Controller&&) = delete;
        Controller& operator=(Controller&&) = delete;

        // --- observers ----------------------------------------------------------

        // Throws ValidationError for null, PreconditionError if already registered.
        void add_observer(std::shared_ptr<Observer> observer);

        // Throws ValidationError for null, PreconditionError if not registered.
        void remove_observer(const std::shared_ptr<Observer>& observer);

        // --- create -------------------------------------------------------------

        // user and real default to nick.
        void add_server(std::string_view host,
                        std::uint16_t port,
                        std::string_view nick,
                        std::optional<std::string> user,
                        std::optional<std::string> real,
                        Authentication auth,
                        std::optional<std::string> user_password,
                        std::optional<std::string> password);

        void add_channel(std::string_view host, std::string_view name, std::optional<std::string> password);

        void add_bot(std::string_view host, std::string_view channel, std::string_view name, bool list_enabled);

        // Replaces file and size of an existing pack, otherwise creates it. A missing
        // bot is created (list disabled) when introduce_bot is set.
        void update_or_add_pack(std::string_view host,
                                std::string_view channel,
                                std::string_view bot,
                                int number,
                                std::string_view file,
                                std::string_view size,
                                bool introduce_bot);

        // --- read ---------------------------------------------------------------

        [[nodiscard]] std::optional<Server> get_server(std::string_view host);
        [[nodiscard]] std::optional<Channel> get_channel(std::string_view host, std::string_view channel);
        [[nodiscard]] std::optional<Bot> get_bot(std::string_view host, std::string_view channel, std::string_view bot);
        [[nodiscard]] std::optional<Pack>
        get_pack(std::string_view host, std::string_view channel, std::string_view bot, int number);

        // All servers in creation order.
        [[nodiscard]] std::vector<Server> server_list();

        // Case sensitive substring match over file names.
        [[nodiscard]] std::vector<Pack> find_pack(std::string_view term);
        [[nodiscard]] std::vector<Pack> find_pack_on_server(std::string_view host, std::string_view term);
        [[nodiscard]] std::vector<Pack>
        find_pack_in_channel(std::string_view host, std::string_view channel, std::string_view term);
        [[nodiscard]] std::vector<Pack> find_pack_by_bot(std::string_view host,
                                                         std::string_view channel,
                                                         std::string_view bot,
                                                         std::string_view term);

        // --- update (false when the target does not exist) -----------------------

        // user and real default to nick.
        bool set_server_identity(std::string_view host,
                                 std::string_view nick,
                                 std::optional<std::string> user,
                                 std::optional<std::string> real,
                                 Authentication auth,
                                 std::optional<std::string> user_password);

        bool set_server_port(std::string_view host, std::uint16_t port);

        bool set_server_password(std::string_view host, std::optional<std::string> password);

        bool set_channel_password(std::string_view host, std::string_view channel, std::optional<std::string> password);

        bool set_bot_list_enabled(std::string_view host, std::string_view channel, std::string_view bot, bool list_enabled);

        // Moves bot (with its packs) to new_channel. Throws PreconditionError when
        // the channels are the same or new_channel already has a bot of that name.
        bool set_bot_channel(std::string_view host,
                             std::string_view old_channel,
                             std::string_view new_channel,
                             std::string_view bot);

        // --- delete (cascading; false when the target does not exist) -------------

        bool delete_server(std::string_view host);
        bool delete_channel(std::string_view host, std::string_view channel);
        bool delete_bot(std::string_view host, std::string_view channel, std::string_view bot);
        bool delete_pack(std::string_view host, std::string_view channel, std::string_view bot, int number);

        // --- lifecycle ----------------------------------------------------------

        // Commits, releases the storage and raises on_close(). Throws ClosedError if
        // already closed. Handles returned earlier fail with ClosedError afterwards.
        void close();

        [[nodiscard]] bool is_closed() const;

    private:
        struct BotSubtree;
        struct ChannelSubtree;
        struct ServerSubtree;

        // All helpers below expect the session lock to be held.
        void add_bot_locked(const std::string& host, std::string_view channel, std::string_view name, bool list_enabled);

        // Commits and raises on_flush(). If the backend fails, undo puts the tables
        // back to their pre-operation state before the error propagates.
        template<class Undo>
        void commit_locked(Undo&& undo);

        [[nodiscard]] const ServerRecord* find_server(std::string_view host) const;
        [[nodiscard]] const ChannelRecord* find_channel(std::string_view host, std::string_view channel) const;
        [[nodiscard]] const BotRecord* find_bot(std::string_view host, std::string_view channel, std::string_view bot) const;
        [[nodiscard]] const PackRecord*
        find_pack_record(std::string_view host, std::string_view channel, std::string_view bot, int number) const;

        template<class Pred>
        [[nodiscard]] std::vector<Pack> search_locked(std::string_view term, Pred in_scope);

        [[nodiscard]] BotSubtree collect(const BotRecord& bot) const;
        [[nodiscard]] ChannelSubtree collect(const ChannelRecord& channel) const;
        [[nodiscard]] ServerSubtree collect(const ServerRecord& server) const;

        void erase(const BotSubtree& tree);
        void erase(const ChannelSubtree& tree);
        void erase(const ServerSubtree& tree);

        void restore(const BotSubtree& tree);
        void restore(const ChannelSubtree& tree);
        void restore(const ServerSubtree& tree);

        void notify_deleted(std::string_view host, std::string_view channel, const BotSubtree& tree);
        void notify_deleted(std::string_view host, const ChannelSubtree& tree);
        void notify_deleted(const ServerSubtree& tree);

        template<class Fn>
        void notify(Fn&& fn);

        std::shared_ptr<detail::Session> session_;
        std::vector<std::shared_ptr<Observer>> observers_; // guarded by the session lock
    };

} // namespace packdb
