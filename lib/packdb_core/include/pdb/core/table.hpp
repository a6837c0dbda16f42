/*
Module Name:
- table.hpp

Abstract:
- Arena of one record kind addressed by RecordId, plus a unique index over the
  record's composite key (see unique_key in records.hpp).
- Rows iterate in id order, which is creation order, so child lists keep the
  order they were added in.
- Not synchronised. The owning controller serialises every access.

Why:
- Ordered map keeps select() deterministic for search results and dumps.
- The key index uses transparent hashing so lookups by std::string_view do not
  allocate a second key.
*/
#pragma once

// C++ Standard Library
#include <concepts>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

// GSL
#include <gsl/gsl>

// Core
#include <pdb/core/errors.hpp>
#include <pdb/core/records.hpp>
#include <pdb/utils/transparent_string_hash.hpp>

namespace packdb
{

    template<class Record>
    class Table
    {
    public:
        using rows_type = std::map<RecordId, Record>;
        using const_iterator = typename rows_type::const_iterator;

        // Ids are drawn from a counter shared by all tables of one storage.
        explicit Table(RecordId& next_id) noexcept :
            next_id_{ next_id }
        {
        }

        Table(const Table&) = delete;
        Table& operator=(const Table&) = delete;

        // Assigns a fresh id. Throws StorageError if the unique key is taken.
        RecordId insert(Record record)
        {
            const RecordId id = next_id_++;
            record.id = id;
            emplace(std::move(record));
            return id;
        }

        // Load path: keeps the stored id and moves the shared counter past it.
        void restore(Record record)
        {
            Expects(record.id != kNoRecord);
            if (rows_.contains(record.id))
                throw StorageError("Duplicate record id " + std::to_string(record.id));
            if (record.id >= next_id_)
                next_id_ = record.id + 1;
            emplace(std::move(record));
        }

        [[nodiscard]] const Record* find(RecordId id) const noexcept
        {
            auto it = rows_.find(id);
            return it == rows_.end() ? nullptr : &it->second;
        }

        [[nodiscard]] const Record* find_key(std::string_view key) const noexcept
        {
            auto it = index_.find(key);
            return it == index_.end() ? nullptr : find(it->second);
        }

        // Replace the row with the same id. Re-keys the index when the key changed.
        bool update(const Record& record)
        {
            auto it = rows_.find(record.id);
            if (it == rows_.end())
                return false;

            auto old_key = unique_key(it->second);
            auto new_key = unique_key(record);
            if (old_key != new_key)
            {
                if (index_.contains(new_key))
                    throw StorageError("Unique key '" + new_key + "' already taken");
                index_.erase(old_key);
                index_.emplace(std::move(new_key), record.id);
            }
            it->second = record;
            return true;
        }

        bool erase(RecordId id)
        {
            auto it = rows_.find(id);
            if (it == rows_.end())
                return false;
            index_.erase(unique_key(it->second));
            rows_.erase(it);
            return true;
        }

        template<std::predicate<const Record&> Pred>
        [[nodiscard]] std::vector<Record> select(Pred pred) const
        {
            std::vector<Record> out;
            for (const auto& [id, row] : rows_)
            {
                if (pred(row))
                    out.push_back(row);
            }
            return out;
        }

        [[nodiscard]] std::size_t size() const noexcept
        {
            return rows_.size();
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return rows_.empty();
        }

        [[nodiscard]] const_iterator begin() const noexcept
        {
            return rows_.begin();
        }

        [[nodiscard]] const_iterator end() const noexcept
        {
            return rows_.end();
        }

        void clear() noexcept
        {
            rows_.clear();
            index_.clear();
        }

    private:
        void emplace(Record record)
        {
            auto key = unique_key(record);
            if (index_.contains(key))
                throw StorageError("Unique key '" + key + "' already taken");
            const RecordId id = record.id;
            index_.emplace(std::move(key), id);
            rows_.emplace(id, std::move(record));
        }

        RecordId& next_id_;
        rows_type rows_;
        std::unordered_map<std::string, RecordId, TransparentStringHash<char>, TransparentStringEq<char>> index_;
    };

} // namespace packdb
