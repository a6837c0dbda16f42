/*
Module Name:
- transparent_string_hash.hpp

Abstract:
- Transparent hash and equality for string keyed indexes.
- Lets the storage key indexes be probed with std::string_view without building
  a temporary std::string per lookup.
- Uses GSL Expects to guard against null CharT* which would be UB.
*/
#pragma once

// C++ Standard Library
#include <concepts>
#include <cstddef>
#include <functional>
#include <string_view>
#include <type_traits>

// GSL
#include <gsl/gsl>

namespace packdb::detail
{
    // Gates the null check only for CharT* inputs.
    template<class T, class CharT>
    inline constexpr bool is_char_ptr_v =
        std::is_pointer_v<std::remove_cvref_t<T>> &&
        std::same_as<
            std::remove_cv_t<std::remove_pointer_t<std::remove_cvref_t<T>>>,
            CharT>;
} // namespace packdb::detail

namespace packdb
{

    template<class CharT = char, class Traits = std::char_traits<CharT>>
    struct TransparentStringHash
    {
        using is_transparent = void; // opts in to heterogeneous lookup

        template<std::convertible_to<std::basic_string_view<CharT, Traits>> S>
        std::size_t operator()(const S& s) const noexcept
        {
            if constexpr (detail::is_char_ptr_v<S, CharT>)
            {
                Expects(s != nullptr);
            }
            using sv = std::basic_string_view<CharT, Traits>;
            return std::hash<sv>{}(sv{ s });
        }
    };

    template<class CharT = char, class Traits = std::char_traits<CharT>>
    struct TransparentStringEq
    {
        using is_transparent = void;

        template<std::convertible_to<std::basic_string_view<CharT, Traits>> A,
                 std::convertible_to<std::basic_string_view<CharT, Traits>> B>
        bool operator()(const A& a, const B& b) const noexcept
        {
            if constexpr (detail::is_char_ptr_v<A, CharT>)
            {
                Expects(a != nullptr);
            }
            if constexpr (detail::is_char_ptr_v<B, CharT>)
            {
                Expects(b != nullptr);
            }
            using sv = std::basic_string_view<CharT, Traits>;
            return sv{ a } == sv{ b };
        }
    };

} // namespace packdb
