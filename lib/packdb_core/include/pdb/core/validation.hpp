/*
Module Name:
- validation.hpp

Abstract:
- Stateless input checks run by every controller entry point before storage is
  touched, and again by the async controller on the caller's thread.
- All checks throw ValidationError; host normalisation returns the canonical key.

Grammar:
- channel  [#&][A-Za-z_-]{1,32}
- nickname [A-Za-z_|-]{1,32}
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Core
#include <pdb/core/records.hpp>

namespace packdb::validate
{

    inline constexpr std::size_t kMaxNameLength = 32;

    // Substring searches treat this as a wildcard, so raw input may not carry it.
    inline constexpr char kSearchWildcard = '%';

    // Trimmed, ASCII lowercase host. Throws on blank input.
    [[nodiscard]] std::string host(std::string_view host);

    void channel_name(std::string_view name);

    void nickname(std::string_view name);

    void file_name(std::string_view name);

    void search_term(std::string_view term);

    // Modes that require a password need a non-empty one.
    void authentication(Authentication auth, const std::optional<std::string>& user_password);

    // Grammar predicates without the throw, for callers that only want to test.
    [[nodiscard]] bool is_channel_name(std::string_view name) noexcept;
    [[nodiscard]] bool is_nickname(std::string_view name) noexcept;

} // namespace packdb::validate
