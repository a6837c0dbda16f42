/*
Module: main.cpp

Purpose:
- packdb_dump: loads configuration, opens the configured storage behind an
  AsyncController and prints the server > channel > bot > pack tree to stdout.

Notes:
- Config is read from argv[1] when given, else from ./packdb.toml (see
  packdb::Config). Fails fast with ConfigError.
- Read only: the controller is closed without any mutation, so the store is
  committed back unchanged. The close waits at most [async] close_timeout_ms.
*/

// C++ Standard Library
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string_view>
#include <vector>

// Core
#include <pdb/core/async_controller.hpp>
#include <pdb/core/config.hpp>
#include <pdb/core/controller.hpp>
#include <pdb/core/errors.hpp>
#include <pdb/core/storage.hpp>
#include <pdb/utils/log.hpp>

namespace
{

    void print_tree(const std::vector<packdb::Server>& servers, std::ostream& out)
    {
        if (servers.empty())
        {
            out << "(empty)\n";
            return;
        }

        for (const auto& server : servers)
        {
            out << server.host() << ':' << server.port() << "  nick=" << server.nick_name()
                << " user=" << server.user_name() << " auth=" << packdb::to_string(server.authentication()) << '\n';

            for (const auto& channel : server.channels())
            {
                out << "  " << channel.name() << (channel.password() ? "  (password)" : "") << '\n';

                for (const auto& bot : channel.bots())
                {
                    out << "    " << bot.name() << (bot.list_enabled() ? "  [list]" : "") << '\n';

                    for (const auto& pack : bot.packs())
                        out << "      #" << pack.number() << "  " << pack.file_name() << "  " << pack.file_size() << '\n';
                }
            }
        }
    }

} // namespace

int main(int argc, char** argv)
{
    try
    {
        // 1) Load immutable configuration and apply the log threshold.
        const auto cfg = argc > 1 ? packdb::Config::load_file(argv[1]) : packdb::Config::load();
        cfg.apply_log_level();

        // 2) Open the configured backend and put the worker in front of it.
        packdb::AsyncController controller{ std::make_unique<packdb::Controller>(packdb::open_storage(cfg.storage())) };

        // 3) Walk the tree. The relation getters read through the same session.
        print_tree(controller.server_list().get(), std::cout);

        // 4) Drain and commit.
        if (!controller.close(cfg.async().close_timeout))
            packdb::log::warn("dump", "queue did not drain within {} ms", cfg.async().close_timeout.count());
    }
    catch (const packdb::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const packdb::StorageError& e)
    {
        std::cerr << "Storage error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
