/*
Module Name:
- deferred.hpp

Abstract:
- Result handle for one operation queued on an AsyncController.
- The shared state moves through queued -> running -> done, or queued ->
  cancelled. Only a queued task can be cancelled; once the worker picked it up
  it always runs to completion.
- get() rethrows whatever the operation threw. A cancelled handle throws
  CancelledError.
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

// GSL
#include <gsl/gsl>

// Core
#include <pdb/core/errors.hpp>

namespace packdb
{

    namespace detail
    {
        enum class TaskStage : std::uint8_t
        {
            queued,
            running,
            cancelled,
        };

        template<class T>
        struct DeferredState
        {
            std::atomic<TaskStage> stage{ TaskStage::queued };
            std::promise<T> promise;
            std::shared_future<T> future{ promise.get_future().share() };

            // Worker side. False when the task was cancelled first.
            bool try_start() noexcept
            {
                auto expected = TaskStage::queued;
                return stage.compare_exchange_strong(expected, TaskStage::running);
            }

            // Caller side. False when the worker got there first.
            bool try_cancel()
            {
                auto expected = TaskStage::queued;
                if (!stage.compare_exchange_strong(expected, TaskStage::cancelled))
                    return false;
                promise.set_exception(std::make_exception_ptr(CancelledError("The operation was cancelled")));
                return true;
            }

            // Runs fn and stores its value or its exception. Pre: try_start() succeeded.
            template<class Fn>
            void fulfil(Fn& fn)
            {
                try
                {
                    if constexpr (std::is_void_v<T>)
                    {
                        fn();
                        promise.set_value();
                    }
                    else
                    {
                        promise.set_value(fn());
                    }
                }
                catch (...)
                {
                    promise.set_exception(std::current_exception());
                }
            }
        };
    } // namespace detail

    template<class T>
    class Deferred
    {
    public:
        explicit Deferred(std::shared_ptr<detail::DeferredState<T>> state) noexcept :
            state_{ std::move(state) }
        {
        }

        // Blocks until the operation finished. Rethrows its error.
        T get() const
        {
            Expects(state_ != nullptr);
            if constexpr (std::is_void_v<T>)
                state_->future.get();
            else
                return state_->future.get();
        }

        void wait() const
        {
            Expects(state_ != nullptr);
            state_->future.wait();
        }

        // True when the result (or error) arrived within timeout.
        template<class Rep, class Period>
        [[nodiscard]] bool wait_for(std::chrono::duration<Rep, Period> timeout) const
        {
            Expects(state_ != nullptr);
            return state_->future.wait_for(timeout) == std::future_status::ready;
        }

        [[nodiscard]] bool ready() const
        {
            return wait_for(std::chrono::seconds::zero());
        }

        // Succeeds only while the task is still queued.
        bool cancel()
        {
            Expects(state_ != nullptr);
            return state_->try_cancel();
        }

        [[nodiscard]] bool cancelled() const noexcept
        {
            return state_ && state_->stage.load() == detail::TaskStage::cancelled;
        }

    private:
        std::shared_ptr<detail::DeferredState<T>> state_;
    };

} // namespace packdb
