/*
Module Name:
- async_controller.hpp

Abstract:
- Non blocking front end to a Controller. Every call validates its arguments on
  the caller's thread, then queues the synchronous call on a single worker and
  returns a Deferred handle.
- One worker thread drives a strand, so operations run strictly in submission
  order whatever they cost.
- Malformed input never reaches the queue: the ValidationError is thrown by
  the submitting call itself.

Lifecycle:
- close(timeout) stops intake, waits up to timeout for the queue to drain and
  then closes the wrapped controller. Tasks still queued after that fail with
  ClosedError through their handles.
- A stop request during the drain throws InterruptedError and leaves the
  wrapped controller open.
- The destructor joins the worker.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

// Boost.Asio
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

// Core
#include <pdb/core/controller.hpp>
#include <pdb/core/deferred.hpp>

namespace packdb
{

    class AsyncController
    {
    public:
        // Pre: controller is non-null and open.
        explicit AsyncController(std::unique_ptr<Controller> controller);

        ~AsyncController();

        AsyncController(const AsyncController&) = delete;
        AsyncController& operator=(const AsyncController&) = delete;
        AsyncController(AsyncController&&) = delete;
        AsyncController& operator=(AsyncController&&) = delete;

        // --- observers ----------------------------------------------------------

        Deferred<void> add_observer(std::shared_ptr<Observer> observer);
        Deferred<void> remove_observer(std::shared_ptr<Observer> observer);

        // --- create -------------------------------------------------------------

        Deferred<void> add_server(std::string_view host,
                                  std::uint16_t port,
                                  std::string_view nick,
                                  std::optional<std::string> user,
                                  std::optional<std::string> real,
                                  Authentication auth,
                                  std::optional<std::string> user_password,
                                  std::optional<std::string> password);

        Deferred<void> add_channel(std::string_view host, std::string_view name, std::optional<std::string> password);

        Deferred<void> add_bot(std::string_view host, std::string_view channel, std::string_view name, bool list_enabled);

        Deferred<void> update_or_add_pack(std::string_view host,
                                          std::string_view channel,
                                          std::string_view bot,
                                          int number,
                                          std::string_view file,
                                          std::string_view size,
                                          bool introduce_bot);

        // --- read ---------------------------------------------------------------

        Deferred<std::optional<Server>> get_server(std::string_view host);
        Deferred<std::optional<Channel>> get_channel(std::string_view host, std::string_view channel);
        Deferred<std::optional<Bot>> get_bot(std::string_view host, std::string_view channel, std::string_view bot);
        Deferred<std::optional<Pack>>
        get_pack(std::string_view host, std::string_view channel, std::string_view bot, int number);

        Deferred<std::vector<Server>> server_list();

        Deferred<std::vector<Pack>> find_pack(std::string_view term);
        Deferred<std::vector<Pack>> find_pack_on_server(std::string_view host, std::string_view term);
        Deferred<std::vector<Pack>>
        find_pack_in_channel(std::string_view host, std::string_view channel, std::string_view term);
        Deferred<std::vector<Pack>> find_pack_by_bot(std::string_view host,
                                                     std::string_view channel,
                                                     std::string_view bot,
                                                     std::string_view term);

        // --- update -------------------------------------------------------------

        Deferred<bool> set_server_identity(std::string_view host,
                                           std::string_view nick,
                                           std::optional<std::string> user,
                                           std::optional<std::string> real,
                                           Authentication auth,
                                           std::optional<std::string> user_password);

        Deferred<bool> set_server_port(std::string_view host, std::uint16_t port);
        Deferred<bool> set_server_password(std::string_view host, std::optional<std::string> password);
        Deferred<bool>
        set_channel_password(std::string_view host, std::string_view channel, std::optional<std::string> password);
        Deferred<bool>
        set_bot_list_enabled(std::string_view host, std::string_view channel, std::string_view bot, bool list_enabled);
        Deferred<bool> set_bot_channel(std::string_view host,
                                       std::string_view old_channel,
                                       std::string_view new_channel,
                                       std::string_view bot);

        // --- delete -------------------------------------------------------------

        Deferred<bool> delete_server(std::string_view host);
        Deferred<bool> delete_channel(std::string_view host, std::string_view channel);
        Deferred<bool> delete_bot(std::string_view host, std::string_view channel, std::string_view bot);
        Deferred<bool> delete_pack(std::string_view host, std::string_view channel, std::string_view bot, int number);

        // --- lifecycle ----------------------------------------------------------

        // Returns true when the queue drained within timeout. Throws ClosedError if
        // already closed and InterruptedError when stop is requested mid drain.
        bool close(std::chrono::milliseconds timeout, std::stop_token stop = {});

        // State of the wrapped controller, answered on the caller's thread.
        [[nodiscard]] bool is_closed() const;

        // Tasks submitted but not yet finished or skipped.
        [[nodiscard]] std::size_t pending() const;

    private:
        template<class T, class Fn>
        Deferred<T> submit(std::string_view what, Fn fn);

        void task_done();

        std::unique_ptr<Controller> controller_;

        mutable std::mutex mutex_;
        std::condition_variable_any drained_;
        std::size_t pending_ = 0; // guarded by mutex_
        bool accepting_ = true;   // guarded by mutex_
        bool closed_ = false;     // guarded by mutex_

        // Last, so the worker is gone before anything it touches.
        boost::asio::thread_pool pool_{ 1 };
        boost::asio::strand<boost::asio::thread_pool::executor_type> strand_{ pool_.get_executor() };
    };

} // namespace packdb
