/*
Module Name:
- storage.hpp

Abstract:
- Pluggable record store under the controllers: four typed tables, a commit
  boundary and a close.
- Backends decide what "durable" means in do_commit(). MemoryStorage keeps
  everything in the arenas; TomlStorage snapshots to a TOML file.
- Not synchronised. Callers hold the controller's exclusion domain.
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// Core
#include <pdb/core/records.hpp>
#include <pdb/core/table.hpp>

namespace packdb
{

    enum class StorageBackend : std::uint8_t
    {
        memory,
        toml,
    };

    struct StorageConfig
    {
        StorageBackend backend = StorageBackend::memory;
        std::filesystem::path path; // required for the toml backend
    };

    class Storage
    {
    public:
        virtual ~Storage() = default;

        Storage(const Storage&) = delete;
        Storage& operator=(const Storage&) = delete;
        Storage(Storage&&) = delete;
        Storage& operator=(Storage&&) = delete;

        [[nodiscard]] Table<ServerRecord>& servers() noexcept
        {
            return servers_;
        }
        [[nodiscard]] const Table<ServerRecord>& servers() const noexcept
        {
            return servers_;
        }
        [[nodiscard]] Table<ChannelRecord>& channels() noexcept
        {
            return channels_;
        }
        [[nodiscard]] const Table<ChannelRecord>& channels() const noexcept
        {
            return channels_;
        }
        [[nodiscard]] Table<BotRecord>& bots() noexcept
        {
            return bots_;
        }
        [[nodiscard]] const Table<BotRecord>& bots() const noexcept
        {
            return bots_;
        }
        [[nodiscard]] Table<PackRecord>& packs() noexcept
        {
            return packs_;
        }
        [[nodiscard]] const Table<PackRecord>& packs() const noexcept
        {
            return packs_;
        }

        // Make the current table state durable. Throws StorageError on failure
        // and ClosedError once closed.
        void commit();

        // Final commit is the caller's job. Throws ClosedError if already closed.
        void close();

        [[nodiscard]] bool is_open() const noexcept
        {
            return open_;
        }

        // Number of successful commits, mostly for diagnostics and tests.
        [[nodiscard]] std::uint64_t commit_count() const noexcept
        {
            return commits_;
        }

        [[nodiscard]] virtual std::string describe() const = 0;

    protected:
        Storage() = default;

        virtual void do_commit() = 0;
        virtual void do_close() noexcept
        {
        }

        [[nodiscard]] RecordId next_id() const noexcept
        {
            return next_id_;
        }
        void set_next_id(RecordId id) noexcept
        {
            next_id_ = id;
        }

        void clear_tables() noexcept;

    private:
        // Declared before the tables, which keep a reference to it.
        RecordId next_id_ = 1;

        Table<ServerRecord> servers_{ next_id_ };
        Table<ChannelRecord> channels_{ next_id_ };
        Table<BotRecord> bots_{ next_id_ };
        Table<PackRecord> packs_{ next_id_ };

        bool open_ = true;
        std::uint64_t commits_ = 0;
    };

    // Volatile backend: state lives as long as the object.
    class MemoryStorage final : public Storage
    {
    public:
        MemoryStorage() = default;

        [[nodiscard]] std::string describe() const override
        {
            return "memory";
        }

    private:
        void do_commit() override
        {
        }
    };

    // Build the backend named by config. TomlStorage loads its file here.
    [[nodiscard]] std::unique_ptr<Storage> open_storage(const StorageConfig& config);

    [[nodiscard]] constexpr std::string_view to_string(StorageBackend backend) noexcept
    {
        return backend == StorageBackend::toml ? "toml" : "memory";
    }

} // namespace packdb
