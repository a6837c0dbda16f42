/*
Module Name:
- stopwatch.hpp

Abstract:
- Monotonic stopwatch built on std::chrono::steady_clock.
- Reports how long an async drain took.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <concepts>
#include <type_traits>

// GSL
#include <gsl/gsl>

namespace packdb
{

    // D must be a std::chrono::duration (cv/ref-qualified types are accepted)
    template<class D>
    concept ChronoDuration = requires {
        typename std::remove_cvref_t<D>::rep;
        typename std::remove_cvref_t<D>::period;
    } && std::same_as<std::remove_cvref_t<D>, std::chrono::duration<typename std::remove_cvref_t<D>::rep, typename std::remove_cvref_t<D>::period>>;

    class Stopwatch
    {
    public:
        using clock = std::chrono::steady_clock;
        static_assert(clock::is_steady, "Stopwatch requires a steady clock");

        Stopwatch() noexcept = default;

        [[nodiscard]] auto elapsed() const noexcept -> clock::duration
        {
            const auto d = clock::now() - start_;
            Ensures(d >= clock::duration::zero());
            return d;
        }

        template<ChronoDuration D>
        [[nodiscard]] auto elapsed_count() const noexcept -> typename std::remove_cvref_t<D>::rep
        {
            using DT = std::remove_cvref_t<D>;
            return std::chrono::duration_cast<DT>(elapsed()).count();
        }

    private:
        clock::time_point start_ = clock::now();
    };

} // namespace packdb
