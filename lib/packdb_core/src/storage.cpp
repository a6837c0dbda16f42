// C++ Standard Library
#include <memory>

// Core
#include <pdb/core/errors.hpp>
#include <pdb/core/storage.hpp>
#include <pdb/core/toml_storage.hpp>
#include <pdb/utils/log.hpp>

namespace packdb
{

    void Storage::commit()
    {
        if (!open_)
            throw ClosedError("Can't commit a closed storage");
        do_commit();
        ++commits_;
    }

    void Storage::close()
    {
        if (!open_)
            throw ClosedError("Storage already closed");
        open_ = false;
        do_close();
    }

    void Storage::clear_tables() noexcept
    {
        servers_.clear();
        channels_.clear();
        bots_.clear();
        packs_.clear();
        next_id_ = 1;
    }

    std::unique_ptr<Storage> open_storage(const StorageConfig& config)
    {
        switch (config.backend)
        {
        case StorageBackend::memory:
            log::debug("storage", "opening in-memory storage");
            return std::make_unique<MemoryStorage>();
        case StorageBackend::toml:
        {
            if (config.path.empty())
                throw StorageError("The toml storage backend needs a file path");
            auto storage = std::make_unique<TomlStorage>(config.path);
            storage->load();
            log::info("storage", "opened {}", storage->describe());
            return storage;
        }
        }
        throw StorageError("Unknown storage backend");
    }

} // namespace packdb
