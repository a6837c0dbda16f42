/*
Module Name:
- observer.hpp

Abstract:
- Change notifications raised by Controller, one virtual per event kind.
- Every callback runs after the change is committed, on the thread that made
  the change, while the controller's exclusion domain is held.
- Bodies default to no-ops so listeners override only what they need.

Notes:
- Do not call back into the controller (or resolve entity relations) from a
  callback. The exclusion domain is not re-entrant and the call deadlocks.
- Deletions report every removed descendant bottom-up, then the target.
- Each commit raises on_flush() before the event describing the change.
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Core
#include <pdb/core/records.hpp>

namespace packdb
{

    class Observer
    {
    public:
        virtual ~Observer() = default;

        virtual void on_server_added(std::string_view /*host*/,
                                     std::uint16_t /*port*/,
                                     const ServerIdentity& /*identity*/,
                                     const std::optional<std::string>& /*password*/)
        {
        }

        virtual void on_channel_added(std::string_view /*host*/,
                                      std::string_view /*channel*/,
                                      const std::optional<std::string>& /*password*/)
        {
        }

        virtual void on_bot_added(std::string_view /*host*/,
                                  std::string_view /*channel*/,
                                  std::string_view /*bot*/,
                                  bool /*list_enabled*/)
        {
        }

        virtual void on_pack_added(std::string_view /*host*/,
                                   std::string_view /*channel*/,
                                   std::string_view /*bot*/,
                                   int /*number*/,
                                   std::string_view /*file*/,
                                   std::string_view /*size*/)
        {
        }

        virtual void on_pack_updated(std::string_view /*host*/,
                                     std::string_view /*channel*/,
                                     std::string_view /*bot*/,
                                     int /*number*/,
                                     std::string_view /*old_file*/,
                                     std::string_view /*new_file*/,
                                     std::string_view /*old_size*/,
                                     std::string_view /*new_size*/)
        {
        }

        virtual void on_server_identity_changed(std::string_view /*host*/,
                                                const ServerIdentity& /*old_identity*/,
                                                const ServerIdentity& /*new_identity*/)
        {
        }

        virtual void on_server_port_changed(std::string_view /*host*/,
                                            std::uint16_t /*old_port*/,
                                            std::uint16_t /*new_port*/)
        {
        }

        virtual void on_server_password_changed(std::string_view /*host*/,
                                                const std::optional<std::string>& /*old_password*/,
                                                const std::optional<std::string>& /*new_password*/)
        {
        }

        virtual void on_channel_password_changed(std::string_view /*host*/,
                                                 std::string_view /*channel*/,
                                                 const std::optional<std::string>& /*old_password*/,
                                                 const std::optional<std::string>& /*new_password*/)
        {
        }

        virtual void on_bot_list_flag_changed(std::string_view /*host*/,
                                              std::string_view /*channel*/,
                                              std::string_view /*bot*/,
                                              bool /*old_flag*/,
                                              bool /*new_flag*/)
        {
        }

        virtual void on_bot_moved(std::string_view /*host*/,
                                  std::string_view /*old_channel*/,
                                  std::string_view /*new_channel*/,
                                  std::string_view /*bot*/)
        {
        }

        virtual void on_server_deleted(std::string_view /*host*/,
                                       std::uint16_t /*port*/,
                                       const ServerIdentity& /*identity*/,
                                       const std::optional<std::string>& /*password*/)
        {
        }

        virtual void on_channel_deleted(std::string_view /*host*/,
                                        std::string_view /*channel*/,
                                        const std::optional<std::string>& /*password*/)
        {
        }

        virtual void on_bot_deleted(std::string_view /*host*/,
                                    std::string_view /*channel*/,
                                    std::string_view /*bot*/,
                                    bool /*list_enabled*/)
        {
        }

        virtual void on_pack_deleted(std::string_view /*host*/,
                                     std::string_view /*channel*/,
                                     std::string_view /*bot*/,
                                     int /*number*/,
                                     std::string_view /*file*/,
                                     std::string_view /*size*/)
        {
        }

        // Storage committed.
        virtual void on_flush()
        {
        }

        // Controller closed; no further events follow.
        virtual void on_close()
        {
        }
    };

} // namespace packdb
