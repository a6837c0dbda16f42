/*
Module Name:
- controller.cpp

Abstract:
- Validation, mutation, commit and notification for every Controller operation.

Pattern:
- validate input (no lock) -> enter exclusion domain -> check parents and keys
  -> mutate tables -> commit (undo on failure) -> notify observers.
- Cascading deletes snapshot the subtree first, erase children before parents,
  and report removed descendants bottom-up after the commit, target last.
*/

// C++ Standard Library
#include <algorithm>
#include <string>
#include <utility>

// Core
#include "session.hpp"
#include <pdb/core/controller.hpp>
#include <pdb/core/errors.hpp>
#include <pdb/core/validation.hpp>
#include <pdb/utils/log.hpp>

namespace packdb
{

    namespace
    {
        constexpr std::string_view kLog = "controller";
    } // namespace

    struct Controller::BotSubtree
    {
        BotRecord bot;
        std::vector<PackRecord> packs;
    };

    struct Controller::ChannelSubtree
    {
        ChannelRecord channel;
        std::vector<BotSubtree> bots;
    };

    struct Controller::ServerSubtree
    {
        ServerRecord server;
        std::vector<ChannelSubtree> channels;
    };

    Controller::Controller(std::unique_ptr<Storage> storage)
    {
        Expects(storage != nullptr);
        if (!storage->is_open())
            throw ClosedError("Can't create a controller on a closed storage");
        log::debug(kLog, "created controller over {}", storage->describe());
        session_ = std::make_shared<detail::Session>(std::move(storage));
    }

    Controller::~Controller()
    {
        try
        {
            if (!is_closed())
                close();
        }
        catch (const std::exception& ex)
        {
            log::error(kLog, "closing on destruction failed: {}", ex.what());
        }
    }

    // ------------------ internals (session lock held) ------------------

    template<class Fn>
    void Controller::notify(Fn&& fn)
    {
        for (const auto& observer : observers_)
            fn(*observer);
    }

    template<class Undo>
    void Controller::commit_locked(Undo&& undo)
    {
        try
        {
            session_->storage().commit();
        }
        catch (const std::exception& ex)
        {
            log::error(kLog, "commit failed, rolling back: {}", ex.what());
            undo();
            throw;
        }
        log::debug(kLog, "flushed current database state");
        notify([](Observer& o) { o.on_flush(); });
    }

    const ServerRecord* Controller::find_server(std::string_view host) const
    {
        return session_->storage().servers().find_key(host);
    }

    const ChannelRecord* Controller::find_channel(std::string_view host, std::string_view channel) const
    {
        const auto* server = find_server(host);
        if (!server)
            return nullptr;
        return session_->storage().channels().find_key(keys::channel(server->id, channel));
    }

    const BotRecord* Controller::find_bot(std::string_view host, std::string_view channel, std::string_view bot) const
    {
        const auto* chan = find_channel(host, channel);
        if (!chan)
            return nullptr;
        return session_->storage().bots().find_key(keys::bot(chan->id, bot));
    }

    const PackRecord*
    Controller::find_pack_record(std::string_view host, std::string_view channel, std::string_view bot, int number) const
    {
        const auto* owner = find_bot(host, channel, bot);
        if (!owner)
            return nullptr;
        return session_->storage().packs().find_key(keys::pack(owner->id, number));
    }

    template<class Pred>
    std::vector<Pack> Controller::search_locked(std::string_view term, Pred in_scope)
    {
        const auto rows = session_->storage().packs().select([&](const PackRecord& p) {
            return p.file.find(term) != std::string::npos && in_scope(p);
        });

        std::vector<Pack> out;
        out.reserve(rows.size());
        for (const auto& rec : rows)
            out.push_back(detail::EntityFactory::pack(session_, rec));
        return out;
    }

    Controller::BotSubtree Controller::collect(const BotRecord& bot) const
    {
        return BotSubtree{
            .bot = bot,
            .packs = session_->storage().packs().select([&](const PackRecord& p) { return p.bot == bot.id; }),
        };
    }

    Controller::ChannelSubtree Controller::collect(const ChannelRecord& channel) const
    {
        ChannelSubtree tree{ .channel = channel, .bots = {} };
        for (const auto& bot : session_->storage().bots().select([&](const BotRecord& b) { return b.channel == channel.id; }))
            tree.bots.push_back(collect(bot));
        return tree;
    }

    Controller::ServerSubtree Controller::collect(const ServerRecord& server) const
    {
        ServerSubtree tree{ .server = server, .channels = {} };
        for (const auto& channel :
             session_->storage().channels().select([&](const ChannelRecord& c) { return c.server == server.id; }))
            tree.channels.push_back(collect(channel));
        return tree;
    }

    void Controller::erase(const BotSubtree& tree)
    {
        auto& st = session_->storage();
        for (const auto& pack : tree.packs)
            st.packs().erase(pack.id);
        st.bots().erase(tree.bot.id);
    }

    void Controller::erase(const ChannelSubtree& tree)
    {
        for (const auto& bot : tree.bots)
            erase(bot);
        session_->storage().channels().erase(tree.channel.id);
    }

    void Controller::erase(const ServerSubtree& tree)
    {
        for (const auto& channel : tree.channels)
            erase(channel);
        session_->storage().servers().erase(tree.server.id);
    }

    void Controller::restore(const BotSubtree& tree)
    {
        auto& st = session_->storage();
        st.bots().restore(tree.bot);
        for (const auto& pack : tree.packs)
            st.packs().restore(pack);
    }

    void Controller::restore(const ChannelSubtree& tree)
    {
        session_->storage().channels().restore(tree.channel);
        for (const auto& bot : tree.bots)
            restore(bot);
    }

    void Controller::restore(const ServerSubtree& tree)
    {
        session_->storage().servers().restore(tree.server);
        for (const auto& channel : tree.channels)
            restore(channel);
    }

    void Controller::notify_deleted(std::string_view host, std::string_view channel, const BotSubtree& tree)
    {
        const auto& bot = tree.bot;
        for (const auto& pack : tree.packs)
        {
            notify([&](Observer& o) { o.on_pack_deleted(host, channel, bot.name, pack.number, pack.file, pack.size); });
        }
        notify([&](Observer& o) { o.on_bot_deleted(host, channel, bot.name, bot.list_enabled); });
    }

    void Controller::notify_deleted(std::string_view host, const ChannelSubtree& tree)
    {
        for (const auto& bot : tree.bots)
            notify_deleted(host, tree.channel.name, bot);
        notify([&](Observer& o) { o.on_channel_deleted(host, tree.channel.name, tree.channel.password); });
    }

    void Controller::notify_deleted(const ServerSubtree& tree)
    {
        const auto& server = tree.server;
        for (const auto& channel : tree.channels)
            notify_deleted(server.host, channel);
        notify([&](Observer& o) { o.on_server_deleted(server.host, server.port, server.identity, server.password); });
    }

    void Controller::add_bot_locked(const std::string& host,
                                    std::string_view channel,
                                    std::string_view name,
                                    bool list_enabled)
    {
        auto& st = session_->storage();
        const auto* chan = find_channel(host, channel);
        if (!chan)
        {
            throw PreconditionError("The server " + host + " and the channel " + std::string{ channel } +
                                    " need to be added before the bot " + std::string{ name });
        }
        if (st.bots().find_key(keys::bot(chan->id, name)))
        {
            throw PreconditionError("The bot " + std::string{ name } + " is already contained in the channel " +
                                    std::string{ channel });
        }

        log::info(kLog, "adding bot ({}, {}, {}, {})", host, channel, name, list_enabled);
        const auto id = st.bots().insert(BotRecord{ .channel = chan->id, .name = std::string{ name }, .list_enabled = list_enabled });
        commit_locked([&] { st.bots().erase(id); });
        notify([&](Observer& o) { o.on_bot_added(host, channel, name, list_enabled); });
    }

    // ------------------ observers ------------------

    void Controller::add_observer(std::shared_ptr<Observer> observer)
    {
        if (!observer)
            throw ValidationError("Observer is not allowed to be null");

        auto lock = session_->acquire("add an observer");
        if (std::find(observers_.begin(), observers_.end(), observer) != observers_.end())
            throw PreconditionError("Can't add the same observer twice");
        observers_.push_back(std::move(observer));
        log::debug(kLog, "added observer ({} registered)", observers_.size());
    }

    void Controller::remove_observer(const std::shared_ptr<Observer>& observer)
    {
        if (!observer)
            throw ValidationError("Observer is not allowed to be null");

        auto lock = session_->acquire("remove an observer");
        auto it = std::find(observers_.begin(), observers_.end(), observer);
        if (it == observers_.end())
            throw PreconditionError("Can't remove an unregistered observer");
        observers_.erase(it);
        log::debug(kLog, "removed observer ({} registered)", observers_.size());
    }

    // ------------------ create ------------------

    void Controller::add_server(std::string_view host_in,
                                std::uint16_t port,
                                std::string_view nick,
                                std::optional<std::string> user,
                                std::optional<std::string> real,
                                Authentication auth,
                                std::optional<std::string> user_password,
                                std::optional<std::string> password)
    {
        log::trace(kLog, "attempting to add a new server");
        const auto host = validate::host(host_in);
        validate::nickname(nick);
        validate::authentication(auth, user_password);

        auto lock = session_->acquire("add a server");
        auto& st = session_->storage();
        if (find_server(host))
            throw PreconditionError("The server " + host + " is already known");

        ServerRecord rec{
            .host = host,
            .port = port,
            .identity =
                ServerIdentity{
                    .nick = std::string{ nick },
                    .user = user ? std::move(*user) : std::string{ nick },
                    .real = real ? std::move(*real) : std::string{ nick },
                    .auth = auth,
                    .user_password = std::move(user_password),
                },
            .password = std::move(password),
        };

        log::info(kLog,
                  "adding server ({}, {}, {}, {}, {}, {})",
                  rec.host,
                  rec.port,
                  rec.identity.nick,
                  rec.identity.user,
                  rec.identity.real,
                  to_string(rec.identity.auth));
        const auto id = st.servers().insert(rec);
        commit_locked([&] { st.servers().erase(id); });
        notify([&](Observer& o) { o.on_server_added(rec.host, rec.port, rec.identity, rec.password); });
    }

    void Controller::add_channel(std::string_view host_in, std::string_view name, std::optional<std::string> password)
    {
        log::trace(kLog, "attempting to add a new channel");
        const auto host = validate::host(host_in);
        validate::channel_name(name);

        auto lock = session_->acquire("add a channel");
        auto& st = session_->storage();
        const auto* server = find_server(host);
        if (!server)
        {
            throw PreconditionError("The server " + host + " must be added before the channel " + std::string{ name });
        }
        if (st.channels().find_key(keys::channel(server->id, name)))
        {
            throw PreconditionError("The channel " + std::string{ name } + " is already contained in the server " + host);
        }

        log::info(kLog, "adding channel ({}, {})", host, name);
        const ChannelRecord rec{ .server = server->id, .name = std::string{ name }, .password = std::move(password) };
        const auto id = st.channels().insert(rec);
        commit_locked([&] { st.channels().erase(id); });
        notify([&](Observer& o) { o.on_channel_added(host, rec.name, rec.password); });
    }

    void Controller::add_bot(std::string_view host_in, std::string_view channel, std::string_view name, bool list_enabled)
    {
        log::trace(kLog, "attempting to add a new bot");
        const auto host = validate::host(host_in);
        validate::channel_name(channel);
        validate::nickname(name);

        auto lock = session_->acquire("add a bot");
        add_bot_locked(host, channel, name, list_enabled);
    }

    void Controller::update_or_add_pack(std::string_view host_in,
                                        std::string_view channel,
                                        std::string_view bot,
                                        int number,
                                        std::string_view file,
                                        std::string_view size,
                                        bool introduce_bot)
    {
        log::trace(kLog, "attempting to update or add a pack");
        const auto host = validate::host(host_in);
        validate::channel_name(channel);
        validate::nickname(bot);
        validate::file_name(file);

        auto lock = session_->acquire("update or add a pack");
        auto& st = session_->storage();

        if (const auto* existing = find_pack_record(host, channel, bot, number))
        {
            const PackRecord before = *existing;
            PackRecord after = before;
            after.file = std::string{ file };
            after.size = std::string{ size };

            log::info(kLog, "updating pack #{} ({} -> {}, {} -> {})", number, before.file, after.file, before.size, after.size);
            st.packs().update(after);
            commit_locked([&] { st.packs().update(before); });
            notify([&](Observer& o) {
                o.on_pack_updated(host, channel, bot, number, before.file, after.file, before.size, after.size);
            });
            return;
        }

        const auto* owner = find_bot(host, channel, bot);
        if (!owner && introduce_bot)
        {
            log::trace(kLog, "introducing bot {} for pack #{}", bot, number);
            add_bot_locked(host, channel, bot, false);
            owner = find_bot(host, channel, bot);
            Ensures(owner != nullptr);
        }
        if (!owner)
        {
            throw PreconditionError("Can't update or add a pack to a bot that doesn't exist: " + std::string{ bot });
        }

        log::info(kLog, "creating pack ({}, {}, {}, {}, {}, {})", host, channel, bot, number, file, size);
        const PackRecord rec{ .bot = owner->id, .number = number, .file = std::string{ file }, .size = std::string{ size } };
        const auto id = st.packs().insert(rec);
        commit_locked([&] { st.packs().erase(id); });
        notify([&](Observer& o) { o.on_pack_added(host, channel, bot, number, rec.file, rec.size); });
    }

    // ------------------ read ------------------

    std::optional<Server> Controller::get_server(std::string_view host_in)
    {
        const auto host = validate::host(host_in);

        auto lock = session_->acquire("get a server");
        const auto* rec = find_server(host);
        log::debug(kLog, "get_server({}) found: {}", host, rec != nullptr);
        if (!rec)
            return std::nullopt;
        return detail::EntityFactory::server(session_, *rec);
    }

    std::optional<Channel> Controller::get_channel(std::string_view host_in, std::string_view channel)
    {
        const auto host = validate::host(host_in);
        validate::channel_name(channel);

        auto lock = session_->acquire("get a channel");
        const auto* rec = find_channel(host, channel);
        log::debug(kLog, "get_channel({}, {}) found: {}", host, channel, rec != nullptr);
        if (!rec)
            return std::nullopt;
        return detail::EntityFactory::channel(session_, *rec);
    }

    std::optional<Bot> Controller::get_bot(std::string_view host_in, std::string_view channel, std::string_view bot)
    {
        const auto host = validate::host(host_in);
        validate::channel_name(channel);
        validate::nickname(bot);

        auto lock = session_->acquire("get a bot");
        const auto* rec = find_bot(host, channel, bot);
        log::debug(kLog, "get_bot({}, {}, {}) found: {}", host, channel, bot, rec != nullptr);
        if (!rec)
            return std::nullopt;
        return detail::EntityFactory::bot(session_, *rec);
    }

    std::optional<Pack>
    Controller::get_pack(std::string_view host_in, std::string_view channel, std::string_view bot, int number)
    {
        const auto host = validate::host(host_in);
        validate::channel_name(channel);
        validate::nickname(bot);

        auto lock = session_->acquire("get a pack");
        const auto* rec = find_pack_record(host, channel, bot, number);
        log::debug(kLog, "get_pack({}, {}, {}, {}) found: {}", host, channel, bot, number, rec != nullptr);
        if (!rec)
            return std::nullopt;
        return detail::EntityFactory::pack(session_, *rec);
    }

    std::vector<Server> Controller::server_list()
    {
        auto lock = session_->acquire("list servers");
        std::vector<Server> out;
        for (const auto& [id, rec] : session_->storage().servers())
            out.push_back(detail::EntityFactory::server(session_, rec));
        log::info(kLog, "found {} servers", out.size());
        return out;
    }

    std::vector<Pack> Controller::find_pack(std::string_view term)
    {
        validate::search_term(term);

        auto lock = session_->acquire("search packs");
        auto out = search_locked(term, [](const PackRecord&) { return true; });
        log::info(kLog, "found {} packs for search: {}", out.size(), term);
        return out;
    }

    std::vector<Pack> Controller::find_pack_on_server(std::string_view host_in, std::string_view term)
    {
        const auto host = validate::host(host_in);
        validate::search_term(term);

        auto lock = session_->acquire("search packs");
        const auto& st = session_->storage();
        const auto* server = find_server(host);
        if (!server)
            return {};

        const RecordId server_id = server->id;
        auto out = search_locked(term, [&](const PackRecord& p) {
            const auto* owner = st.bots().find(p.bot);
            const auto* chan = owner ? st.channels().find(owner->channel) : nullptr;
            return chan && chan->server == server_id;
        });
        log::info(kLog, "found {} packs on {} for search: {}", out.size(), host, term);
        return out;
    }

    std::vector<Pack>
    Controller::find_pack_in_channel(std::string_view host_in, std::string_view channel, std::string_view term)
    {
        const auto host = validate::host(host_in);
        validate::channel_name(channel);
        validate::search_term(term);

        auto lock = session_->acquire("search packs");
        const auto& st = session_->storage();
        const auto* chan = find_channel(host, channel);
        if (!chan)
            return {};

        const RecordId channel_id = chan->id;
        auto out = search_locked(term, [&](const PackRecord& p) {
            const auto* owner = st.bots().find(p.bot);
            return owner && owner->channel == channel_id;
        });
        log::info(kLog, "found {} packs on {} in {} for search: {}", out.size(), host, channel, term);
        return out;
    }

    std::vector<Pack> Controller::find_pack_by_bot(std::string_view host_in,
                                                   std::string_view channel,
                                                   std::string_view bot,
                                                   std::string_view term)
    {
        const auto host = validate::host(host_in);
        validate::channel_name(channel);
        validate::nickname(bot);
        validate::search_term(term);

        auto lock = session_->acquire("search packs");
        const auto* owner = find_bot(host, channel, bot);
        if (!owner)
            return {};

        const RecordId bot_id = owner->id;
        auto out = search_locked(term, [&](const PackRecord& p) { return p.bot == bot_id; });
        log::info(kLog, "found {} packs on {} in {} from {} for search: {}", out.size(), host, channel, bot, term);
        return out;
    }

    // ------------------ update ------------------

    bool Controller::set_server_identity(std::string_view host_in,
                                         std::string_view nick,
                                         std::optional<std::string> user,
                                         std::optional<std::string> real,
                                         Authentication auth,
                                         std::optional<std::string> user_password)
    {
        log::trace(kLog, "attempting to set the identity of a server");
        const auto host = validate::host(host_in);
        validate::nickname(nick);
        validate::authentication(auth, user_password);

        auto lock = session_->acquire("set a server identity");
        auto& st = session_->storage();
        const auto* server = find_server(host);
        if (!server)
        {
            log::info(kLog, "could not find server to update: {}", host);
            return false;
        }

        const ServerRecord before = *server;
        ServerRecord after = before;
        after.identity = ServerIdentity{
            .nick = std::string{ nick },
            .user = user ? std::move(*user) : std::string{ nick },
            .real = real ? std::move(*real) : std::string{ nick },
            .auth = auth,
            .user_password = std::move(user_password),
        };

        log::info(kLog,
                  "updating identity for {} ({} -> {}, {} -> {}, {} -> {}, {} -> {})",
                  host,
                  before.identity.nick,
                  after.identity.nick,
                  before.identity.user,
                  after.identity.user,
                  before.identity.real,
                  after.identity.real,
                  to_string(before.identity.auth),
                  to_string(after.identity.auth));
        st.servers().update(after);
        commit_locked([&] { st.servers().update(before); });
        notify([&](Observer& o) { o.on_server_identity_changed(host, before.identity, after.identity); });
        return true;
    }

    bool Controller::set_server_port(std::string_view host_in, std::uint16_t port)
    {
        log::trace(kLog, "attempting to set the port of a server");
        const auto host = validate::host(host_in);

        auto lock = session_->acquire("set a server port");
        auto& st = session_->storage();
        const auto* server = find_server(host);
        if (!server)
        {
            log::info(kLog, "could not find server to update: {}", host);
            return false;
        }

        const ServerRecord before = *server;
        ServerRecord after = before;
        after.port = port;

        log::info(kLog, "updating port for {} ({} -> {})", host, before.port, after.port);
        st.servers().update(after);
        commit_locked([&] { st.servers().update(before); });
        notify([&](Observer& o) { o.on_server_port_changed(host, before.port, after.port); });
        return true;
    }

    bool Controller::set_server_password(std::string_view host_in, std::optional<std::string> password)
    {
        log::trace(kLog, "attempting to set the password of a server");
        const auto host = validate::host(host_in);

        auto lock = session_->acquire("set a server password");
        auto& st = session_->storage();
        const auto* server = find_server(host);
        if (!server)
        {
            log::info(kLog, "could not find server to update: {}", host);
            return false;
        }

        const ServerRecord before = *server;
        ServerRecord after = before;
        after.password = std::move(password);

        log::info(kLog, "updating password for {}", host);
        st.servers().update(after);
        commit_locked([&] { st.servers().update(before); });
        notify([&](Observer& o) { o.on_server_password_changed(host, before.password, after.password); });
        return true;
    }

    bool Controller::set_channel_password(std::string_view host_in,
                                          std::string_view channel,
                                          std::optional<std::string> password)
    {
        log::trace(kLog, "attempting to set the password of a channel");
        const auto host = validate::host(host_in);
        validate::channel_name(channel);

        auto lock = session_->acquire("set a channel password");
        auto& st = session_->storage();
        const auto* chan = find_channel(host, channel);
        if (!chan)
        {
            log::info(kLog, "could not find channel to update: {}.{}", host, channel);
            return false;
        }

        const ChannelRecord before = *chan;
        ChannelRecord after = before;
        after.password = std::move(password);

        log::info(kLog, "updating password for channel {}.{}", host, channel);
        st.channels().update(after);
        commit_locked([&] { st.channels().update(before); });
        notify([&](Observer& o) { o.on_channel_password_changed(host, channel, before.password, after.password); });
        return true;
    }

    bool Controller::set_bot_list_enabled(std::string_view host_in,
                                          std::string_view channel,
                                          std::string_view bot,
                                          bool list_enabled)
    {
        log::trace(kLog, "attempting to set the list flag of a bot");
        const auto host = validate::host(host_in);
        validate::channel_name(channel);
        validate::nickname(bot);

        auto lock = session_->acquire("set a bot list flag");
        auto& st = session_->storage();
        const auto* rec = find_bot(host, channel, bot);
        if (!rec)
        {
            log::info(kLog, "could not find bot to update: {}.{}.{}", host, channel, bot);
            return false;
        }

        const BotRecord before = *rec;
        BotRecord after = before;
        after.list_enabled = list_enabled;

        log::info(kLog, "updating list flag for bot {}.{}.{} ({} -> {})", host, channel, bot, before.list_enabled, list_enabled);
        st.bots().update(after);
        commit_locked([&] { st.bots().update(before); });
        notify([&](Observer& o) { o.on_bot_list_flag_changed(host, channel, bot, before.list_enabled, after.list_enabled); });
        return true;
    }

    bool Controller::set_bot_channel(std::string_view host_in,
                                     std::string_view old_channel,
                                     std::string_view new_channel,
                                     std::string_view bot)
    {
        log::trace(kLog, "attempting to move a bot into another channel");
        const auto host = validate::host(host_in);
        validate::channel_name(old_channel);
        validate::channel_name(new_channel);
        validate::nickname(bot);
        if (old_channel == new_channel)
            throw PreconditionError("Can't move a bot into the same channel");

        auto lock = session_->acquire("move a bot");
        auto& st = session_->storage();
        const auto* rec = find_bot(host, old_channel, bot);
        if (!rec)
        {
            log::info(kLog, "could not find bot to move: {}.{}.{}", host, old_channel, bot);
            return false;
        }
        const auto* target = find_channel(host, new_channel);
        if (!target)
        {
            log::info(kLog, "could not find target channel {} to move {} into", new_channel, bot);
            return false;
        }
        if (st.bots().find_key(keys::bot(target->id, bot)))
        {
            throw PreconditionError("The channel " + std::string{ new_channel } + " already contains a bot named " +
                                    std::string{ bot });
        }

        const BotRecord before = *rec;
        BotRecord after = before;
        after.channel = target->id;

        log::info(kLog, "moving bot {} ({} -> {})", bot, old_channel, new_channel);
        st.bots().update(after);
        commit_locked([&] { st.bots().update(before); });
        notify([&](Observer& o) { o.on_bot_moved(host, old_channel, new_channel, bot); });
        return true;
    }

    // ------------------ delete ------------------

    bool Controller::delete_server(std::string_view host_in)
    {
        log::trace(kLog, "attempting to delete a server");
        const auto host = validate::host(host_in);

        auto lock = session_->acquire("delete a server");
        const auto* server = find_server(host);
        if (!server)
        {
            log::info(kLog, "could not find server to delete: {}", host);
            return false;
        }

        const auto tree = collect(*server);
        erase(tree);
        commit_locked([&] { restore(tree); });
        notify_deleted(tree);
        log::info(kLog, "deleted server {} with {} channels", host, tree.channels.size());
        return true;
    }

    bool Controller::delete_channel(std::string_view host_in, std::string_view channel)
    {
        log::trace(kLog, "attempting to delete a channel");
        const auto host = validate::host(host_in);
        validate::channel_name(channel);

        auto lock = session_->acquire("delete a channel");
        const auto* chan = find_channel(host, channel);
        if (!chan)
        {
            log::info(kLog, "could not find channel to delete: ({}, {})", host, channel);
            return false;
        }

        const auto tree = collect(*chan);
        erase(tree);
        commit_locked([&] { restore(tree); });
        notify_deleted(host, tree);
        log::info(kLog, "deleted channel {}.{} with {} bots", host, channel, tree.bots.size());
        return true;
    }

    bool Controller::delete_bot(std::string_view host_in, std::string_view channel, std::string_view bot)
    {
        log::trace(kLog, "attempting to delete a bot");
        const auto host = validate::host(host_in);
        validate::channel_name(channel);
        validate::nickname(bot);

        auto lock = session_->acquire("delete a bot");
        const auto* rec = find_bot(host, channel, bot);
        if (!rec)
        {
            log::info(kLog, "could not find bot to delete: ({}, {}, {})", host, channel, bot);
            return false;
        }

        const auto tree = collect(*rec);
        erase(tree);
        commit_locked([&] { restore(tree); });
        notify_deleted(host, channel, tree);
        log::info(kLog, "deleted bot {}.{}.{} with {} packs", host, channel, bot, tree.packs.size());
        return true;
    }

    bool Controller::delete_pack(std::string_view host_in, std::string_view channel, std::string_view bot, int number)
    {
        log::trace(kLog, "attempting to delete a pack");
        const auto host = validate::host(host_in);
        validate::channel_name(channel);
        validate::nickname(bot);

        auto lock = session_->acquire("delete a pack");
        auto& st = session_->storage();
        const auto* rec = find_pack_record(host, channel, bot, number);
        if (!rec)
        {
            log::info(kLog, "could not find pack to delete: ({}, {}, {}, {})", host, channel, bot, number);
            return false;
        }

        const PackRecord before = *rec;
        st.packs().erase(before.id);
        commit_locked([&] { st.packs().restore(before); });
        notify([&](Observer& o) { o.on_pack_deleted(host, channel, bot, number, before.file, before.size); });
        log::info(kLog, "deleted pack #{} of {}.{}.{}", number, host, channel, bot);
        return true;
    }

    // ------------------ lifecycle ------------------

    void Controller::close()
    {
        log::trace(kLog, "attempting to close this controller");
        auto lock = session_->lock();
        if (session_->closed())
            throw ClosedError("Already closed");

        session_->storage().commit();
        auto storage = session_->release();
        storage->close();
        notify([](Observer& o) { o.on_close(); });
        log::info(kLog, "closed the database controller");
    }

    bool Controller::is_closed() const
    {
        auto lock = session_->lock();
        return session_->closed();
    }

} // namespace packdb
