#pragma once

#include "storage/value.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mockdb {

// ── Table ─────────────────────────────────────────────────────────────────────
//
// Id-keyed collection of records that remembers storage order: overwriting an
// existing id keeps its slot, new ids append, erasing closes the gap.
// Plain value type; synchronization is the owning DataStore's job.

class Table {
public:
    // Returns the record stored under `id`, or nullptr.
    [[nodiscard]] const Record* find(std::string_view id) const;

    // Inserts or overwrites the record stored under `id`.
    void put(const std::string& id, Record record);

    // Removes `id`.  Returns true if it existed.
    bool erase(std::string_view id);

    // Copy of all records in storage order.
    [[nodiscard]] std::vector<Record> rows() const { return rows_; }

    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

private:
    std::vector<Record> rows_;
    std::unordered_map<std::string, std::size_t> index_; // id -> position in rows_
};

// ── DataStore ─────────────────────────────────────────────────────────────────
//
// Owns the named tables of one store.  Raw CRUD primitives only: no filtering,
// ordering or timestamps – that is the query layer's job.
//
// Tables are created on first reference.  Every record stored here carries a
// string `id` equal to its key.
//
// Concurrency model (each primitive is atomic on its own):
//   - get_all() / get() / table_names() / size() acquire a shared (read) lock.
//   - everything else acquires an exclusive (write) lock.
//
// An empty table name is a programming error and throws std::invalid_argument.

class DataStore {
public:
    DataStore() = default;

    // Not copyable – copies of a live store would silently race.
    DataStore(const DataStore&)            = delete;
    DataStore& operator=(const DataStore&) = delete;

    // Returns a copy of table `name`, creating it (empty) if absent.
    [[nodiscard]] Table get_table(std::string_view name);

    // Snapshot of all records of `name` in storage order (empty if absent).
    [[nodiscard]] std::vector<Record> get_all(std::string_view name) const;

    // Returns the record `id` of `name`, or std::nullopt if not present.
    [[nodiscard]] std::optional<Record> get(std::string_view name, std::string_view id) const;

    // Stores `record` under its `id`.  A missing, null or empty id is replaced
    // by a fresh UUID; an id that is not a string throws std::invalid_argument.
    // An existing record with the same id is overwritten (last write wins).
    // Returns the id the record was stored under.
    std::string insert(std::string_view name, Record record);

    // Replaces the record stored under `id`; the stored copy's `id` field is
    // forced back to `id`.  Returns false (and does nothing) if `id` is absent.
    bool update(std::string_view name, std::string_view id, Record record);

    // Removes record `id` from `name`.  Returns true if it existed.
    bool del(std::string_view name, std::string_view id);

    // Drops table `name` (no-op if absent).
    void clear(std::string_view name);

    // Drops every table.
    void clear();

    // Names of all existing tables, sorted.
    [[nodiscard]] std::vector<std::string> table_names() const;

    // Number of records in `name` (0 if absent).
    [[nodiscard]] std::size_t size(std::string_view name) const;

private:
    Table& table_locked(std::string_view name);

    mutable std::shared_mutex mutex_;
    std::map<std::string, Table, std::less<>> tables_;
};

} // namespace mockdb
