// C++ Standard Library
#include <algorithm>
#include <string>

// Core
#include <pdb/core/errors.hpp>
#include <pdb/core/validation.hpp>
#include <pdb/utils/attributes.hpp>

namespace packdb::validate
{

    namespace
    {
        // ASCII only. Host names and IRC names are ASCII, and this avoids locale surprises.
        constexpr bool is_space(unsigned char c) noexcept
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        constexpr bool is_alpha(unsigned char c) noexcept
        {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        constexpr char to_lower(unsigned char c) noexcept
        {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
        }

        std::string_view trim(std::string_view s) noexcept
        {
            while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
                s.remove_prefix(1);
            while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
                s.remove_suffix(1);
            return s;
        }

        PDB_FORCE_INLINE bool is_blank(std::string_view s) noexcept
        {
            return trim(s).empty();
        }

        // Shared body of both name grammars: 1..32 characters from the allowed set.
        template<class Pred>
        bool all_of_bounded(std::string_view s, Pred allowed) noexcept
        {
            if (s.empty() || s.size() > kMaxNameLength)
                return false;
            return std::all_of(s.begin(), s.end(), [&](char c) { return allowed(static_cast<unsigned char>(c)); });
        }
    } // namespace

    bool is_channel_name(std::string_view name) noexcept
    {
        if (name.size() < 2 || (name.front() != '#' && name.front() != '&'))
            return false;
        return all_of_bounded(name.substr(1), [](unsigned char c) { return is_alpha(c) || c == '_' || c == '-'; });
    }

    bool is_nickname(std::string_view name) noexcept
    {
        return all_of_bounded(name, [](unsigned char c) { return is_alpha(c) || c == '_' || c == '|' || c == '-'; });
    }

    std::string host(std::string_view host)
    {
        const auto trimmed = trim(host);
        if (PDB_UNLIKELY(trimmed.empty()))
            throw ValidationError("Can't have an empty host: '" + std::string{ host } + "'");

        std::string out;
        out.reserve(trimmed.size());
        for (unsigned char c : trimmed)
            out.push_back(to_lower(c));
        return out;
    }

    void channel_name(std::string_view name)
    {
        if (is_blank(name))
            throw ValidationError("Can't have an empty channel name: '" + std::string{ name } + "'");
        if (!is_channel_name(name))
            throw ValidationError("Channel name must match [#&][A-Za-z_-]{1,32} but '" + std::string{ name } + "' was given");
    }

    void nickname(std::string_view name)
    {
        if (is_blank(name))
            throw ValidationError("Can't have an empty nickname: '" + std::string{ name } + "'");
        if (!is_nickname(name))
            throw ValidationError("Nickname must match [A-Za-z_|-]{1,32} but '" + std::string{ name } + "' was given");
    }

    void file_name(std::string_view name)
    {
        if (is_blank(name))
            throw ValidationError("Can't have an empty file name: '" + std::string{ name } + "'");
    }

    void search_term(std::string_view term)
    {
        if (is_blank(term))
            throw ValidationError("Can't search for an empty file name: '" + std::string{ term } + "'");
        if (term.find(kSearchWildcard) != std::string_view::npos)
            throw ValidationError("Pack search must not contain '%': '" + std::string{ term } + "'");
    }

    void authentication(Authentication auth, const std::optional<std::string>& user_password)
    {
        if (requires_password(auth) && (!user_password || user_password->empty()))
        {
            throw ValidationError("Authentication '" + std::string{ to_string(auth) } + "' requires a user password");
        }
    }

} // namespace packdb::validate
