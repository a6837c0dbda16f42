/*
Module Name:
- async_controller.cpp

Abstract:
- Caller thread: validate, count the task, post it to the strand.
- Worker thread: skip cancelled tasks, run the synchronous call, resolve the
  handle, uncount the task.
*/

// C++ Standard Library
#include <utility>

// Boost.Asio
#include <boost/asio/post.hpp>

// GSL
#include <gsl/gsl>

// Core
#include <pdb/core/async_controller.hpp>
#include <pdb/core/errors.hpp>
#include <pdb/core/validation.hpp>
#include <pdb/utils/log.hpp>
#include <pdb/utils/stopwatch.hpp>

namespace packdb
{

    namespace
    {
        constexpr std::string_view kLog = "async";
    } // namespace

    AsyncController::AsyncController(std::unique_ptr<Controller> controller) :
        controller_{ std::move(controller) }
    {
        Expects(controller_ != nullptr);
        if (controller_->is_closed())
            throw ClosedError("Can't wrap a closed database controller");
    }

    AsyncController::~AsyncController()
    {
        // Run what is still queued. thread_pool's own destructor would drop it.
        pool_.join();
    }

    template<class T, class Fn>
    Deferred<T> AsyncController::submit(std::string_view what, Fn fn)
    {
        auto state = std::make_shared<detail::DeferredState<T>>();
        {
            std::lock_guard lock{ mutex_ };
            if (!accepting_)
            {
                throw ClosedError("Can't " + std::string{ what } + " on a closed asynchronous database controller");
            }
            ++pending_;
        }

        log::info(kLog, "queued: {}", what);
        boost::asio::post(strand_, [this, state, fn = std::move(fn)]() mutable {
            if (state->try_start())
                state->fulfil(fn);
            task_done();
        });
        return Deferred<T>{ std::move(state) };
    }

    void AsyncController::task_done()
    {
        {
            std::lock_guard lock{ mutex_ };
            Expects(pending_ > 0);
            --pending_;
        }
        drained_.notify_all();
    }

    // ------------------ observers ------------------

    Deferred<void> AsyncController::add_observer(std::shared_ptr<Observer> observer)
    {
        if (!observer)
            throw ValidationError("Observer is not allowed to be null");
        return submit<void>("add an observer", [this, o = std::move(observer)]() mutable {
            controller_->add_observer(std::move(o));
        });
    }

    Deferred<void> AsyncController::remove_observer(std::shared_ptr<Observer> observer)
    {
        if (!observer)
            throw ValidationError("Observer is not allowed to be null");
        return submit<void>("remove an observer", [this, o = std::move(observer)] { controller_->remove_observer(o); });
    }

    // ------------------ create ------------------

    Deferred<void> AsyncController::add_server(std::string_view host,
                                               std::uint16_t port,
                                               std::string_view nick,
                                               std::optional<std::string> user,
                                               std::optional<std::string> real,
                                               Authentication auth,
                                               std::optional<std::string> user_password,
                                               std::optional<std::string> password)
    {
        (void)validate::host(host);
        validate::nickname(nick);
        validate::authentication(auth, user_password);

        return submit<void>("add a server",
                            [this,
                             h = std::string{ host },
                             port,
                             n = std::string{ nick },
                             user = std::move(user),
                             real = std::move(real),
                             auth,
                             user_password = std::move(user_password),
                             password = std::move(password)]() mutable {
                                controller_->add_server(
                                    h, port, n, std::move(user), std::move(real), auth, std::move(user_password), std::move(password));
                            });
    }

    Deferred<void> AsyncController::add_channel(std::string_view host, std::string_view name, std::optional<std::string> password)
    {
        (void)validate::host(host);
        validate::channel_name(name);

        return submit<void>("add a channel",
                            [this, h = std::string{ host }, c = std::string{ name }, password = std::move(password)]() mutable {
                                controller_->add_channel(h, c, std::move(password));
                            });
    }

    Deferred<void>
    AsyncController::add_bot(std::string_view host, std::string_view channel, std::string_view name, bool list_enabled)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        validate::nickname(name);

        return submit<void>("add a bot",
                            [this, h = std::string{ host }, c = std::string{ channel }, b = std::string{ name }, list_enabled] {
                                controller_->add_bot(h, c, b, list_enabled);
                            });
    }

    Deferred<void> AsyncController::update_or_add_pack(std::string_view host,
                                                       std::string_view channel,
                                                       std::string_view bot,
                                                       int number,
                                                       std::string_view file,
                                                       std::string_view size,
                                                       bool introduce_bot)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        validate::nickname(bot);
        validate::file_name(file);

        return submit<void>("update or add a pack",
                            [this,
                             h = std::string{ host },
                             c = std::string{ channel },
                             b = std::string{ bot },
                             number,
                             f = std::string{ file },
                             s = std::string{ size },
                             introduce_bot] { controller_->update_or_add_pack(h, c, b, number, f, s, introduce_bot); });
    }

    // ------------------ read ------------------

    Deferred<std::optional<Server>> AsyncController::get_server(std::string_view host)
    {
        (void)validate::host(host);
        return submit<std::optional<Server>>("get a server",
                                             [this, h = std::string{ host }] { return controller_->get_server(h); });
    }

    Deferred<std::optional<Channel>> AsyncController::get_channel(std::string_view host, std::string_view channel)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        return submit<std::optional<Channel>>("get a channel", [this, h = std::string{ host }, c = std::string{ channel }] {
            return controller_->get_channel(h, c);
        });
    }

    Deferred<std::optional<Bot>>
    AsyncController::get_bot(std::string_view host, std::string_view channel, std::string_view bot)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        validate::nickname(bot);
        return submit<std::optional<Bot>>(
            "get a bot", [this, h = std::string{ host }, c = std::string{ channel }, b = std::string{ bot }] {
                return controller_->get_bot(h, c, b);
            });
    }

    Deferred<std::optional<Pack>>
    AsyncController::get_pack(std::string_view host, std::string_view channel, std::string_view bot, int number)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        validate::nickname(bot);
        return submit<std::optional<Pack>>(
            "get a pack", [this, h = std::string{ host }, c = std::string{ channel }, b = std::string{ bot }, number] {
                return controller_->get_pack(h, c, b, number);
            });
    }

    Deferred<std::vector<Server>> AsyncController::server_list()
    {
        return submit<std::vector<Server>>("list servers", [this] { return controller_->server_list(); });
    }

    Deferred<std::vector<Pack>> AsyncController::find_pack(std::string_view term)
    {
        validate::search_term(term);
        return submit<std::vector<Pack>>("search packs", [this, t = std::string{ term }] { return controller_->find_pack(t); });
    }

    Deferred<std::vector<Pack>> AsyncController::find_pack_on_server(std::string_view host, std::string_view term)
    {
        (void)validate::host(host);
        validate::search_term(term);
        return submit<std::vector<Pack>>("search packs", [this, h = std::string{ host }, t = std::string{ term }] {
            return controller_->find_pack_on_server(h, t);
        });
    }

    Deferred<std::vector<Pack>>
    AsyncController::find_pack_in_channel(std::string_view host, std::string_view channel, std::string_view term)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        validate::search_term(term);
        return submit<std::vector<Pack>>(
            "search packs", [this, h = std::string{ host }, c = std::string{ channel }, t = std::string{ term }] {
                return controller_->find_pack_in_channel(h, c, t);
            });
    }

    Deferred<std::vector<Pack>> AsyncController::find_pack_by_bot(std::string_view host,
                                                                  std::string_view channel,
                                                                  std::string_view bot,
                                                                  std::string_view term)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        validate::nickname(bot);
        validate::search_term(term);
        return submit<std::vector<Pack>>(
            "search packs",
            [this, h = std::string{ host }, c = std::string{ channel }, b = std::string{ bot }, t = std::string{ term }] {
                return controller_->find_pack_by_bot(h, c, b, t);
            });
    }

    // ------------------ update ------------------

    Deferred<bool> AsyncController::set_server_identity(std::string_view host,
                                                        std::string_view nick,
                                                        std::optional<std::string> user,
                                                        std::optional<std::string> real,
                                                        Authentication auth,
                                                        std::optional<std::string> user_password)
    {
        (void)validate::host(host);
        validate::nickname(nick);
        validate::authentication(auth, user_password);

        return submit<bool>("set a server identity",
                            [this,
                             h = std::string{ host },
                             n = std::string{ nick },
                             user = std::move(user),
                             real = std::move(real),
                             auth,
                             user_password = std::move(user_password)]() mutable {
                                return controller_->set_server_identity(
                                    h, n, std::move(user), std::move(real), auth, std::move(user_password));
                            });
    }

    Deferred<bool> AsyncController::set_server_port(std::string_view host, std::uint16_t port)
    {
        (void)validate::host(host);
        return submit<bool>("set a server port",
                            [this, h = std::string{ host }, port] { return controller_->set_server_port(h, port); });
    }

    Deferred<bool> AsyncController::set_server_password(std::string_view host, std::optional<std::string> password)
    {
        (void)validate::host(host);
        return submit<bool>("set a server password", [this, h = std::string{ host }, password = std::move(password)]() mutable {
            return controller_->set_server_password(h, std::move(password));
        });
    }

    Deferred<bool>
    AsyncController::set_channel_password(std::string_view host, std::string_view channel, std::optional<std::string> password)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        return submit<bool>("set a channel password",
                            [this, h = std::string{ host }, c = std::string{ channel }, password = std::move(password)]() mutable {
                                return controller_->set_channel_password(h, c, std::move(password));
                            });
    }

    Deferred<bool> AsyncController::set_bot_list_enabled(std::string_view host,
                                                         std::string_view channel,
                                                         std::string_view bot,
                                                         bool list_enabled)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        validate::nickname(bot);
        return submit<bool>(
            "set a bot list flag",
            [this, h = std::string{ host }, c = std::string{ channel }, b = std::string{ bot }, list_enabled] {
                return controller_->set_bot_list_enabled(h, c, b, list_enabled);
            });
    }

    Deferred<bool> AsyncController::set_bot_channel(std::string_view host,
                                                    std::string_view old_channel,
                                                    std::string_view new_channel,
                                                    std::string_view bot)
    {
        (void)validate::host(host);
        validate::channel_name(old_channel);
        validate::channel_name(new_channel);
        validate::nickname(bot);
        return submit<bool>("move a bot",
                            [this,
                             h = std::string{ host },
                             from = std::string{ old_channel },
                             to = std::string{ new_channel },
                             b = std::string{ bot }] { return controller_->set_bot_channel(h, from, to, b); });
    }

    // ------------------ delete ------------------

    Deferred<bool> AsyncController::delete_server(std::string_view host)
    {
        (void)validate::host(host);
        return submit<bool>("delete a server", [this, h = std::string{ host }] { return controller_->delete_server(h); });
    }

    Deferred<bool> AsyncController::delete_channel(std::string_view host, std::string_view channel)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        return submit<bool>("delete a channel", [this, h = std::string{ host }, c = std::string{ channel }] {
            return controller_->delete_channel(h, c);
        });
    }

    Deferred<bool> AsyncController::delete_bot(std::string_view host, std::string_view channel, std::string_view bot)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        validate::nickname(bot);
        return submit<bool>("delete a bot", [this, h = std::string{ host }, c = std::string{ channel }, b = std::string{ bot }] {
            return controller_->delete_bot(h, c, b);
        });
    }

    Deferred<bool>
    AsyncController::delete_pack(std::string_view host, std::string_view channel, std::string_view bot, int number)
    {
        (void)validate::host(host);
        validate::channel_name(channel);
        validate::nickname(bot);
        return submit<bool>(
            "delete a pack", [this, h = std::string{ host }, c = std::string{ channel }, b = std::string{ bot }, number] {
                return controller_->delete_pack(h, c, b, number);
            });
    }

    // ------------------ lifecycle ------------------

    bool AsyncController::close(std::chrono::milliseconds timeout, std::stop_token stop)
    {
        const Stopwatch watch;
        bool drained = false;
        {
            std::unique_lock lock{ mutex_ };
            if (closed_)
                throw ClosedError("Already closed");
            accepting_ = false;

            log::info(kLog, "closing, waiting up to {} ms for {} queued tasks", timeout.count(), pending_);
            drained = drained_.wait_for(lock, stop, timeout, [this] { return pending_ == 0; });
            if (!drained && stop.stop_requested())
            {
                log::warn(kLog, "close interrupted with {} tasks left", pending_);
                throw InterruptedError("Interrupted while waiting for queued operations to finish");
            }
            if (!drained)
                log::warn(kLog, "close timed out with {} tasks left", pending_);
            closed_ = true;
        }

        controller_->close();
        log::info(kLog, "closed after {} ms (drained: {})", watch.elapsed_count<std::chrono::milliseconds>(), drained);
        return drained;
    }

    bool AsyncController::is_closed() const
    {
        return controller_->is_closed();
    }

    std::size_t AsyncController::pending() const
    {
        std::lock_guard lock{ mutex_ };
        return pending_;
    }

} // namespace packdb
