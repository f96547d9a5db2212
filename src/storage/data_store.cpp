#include "storage/data_store.hpp"

#include "common/uuid.hpp"

#include <fmt/format.h>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

namespace mockdb {

namespace {

void require_table_name(std::string_view name) {
    if (name.empty()) {
        throw std::invalid_argument("table name must not be empty");
    }
}

} // namespace

// ── Table ─────────────────────────────────────────────────────────────────────

const Record* Table::find(std::string_view id) const {
    auto it = index_.find(std::string(id));
    if (it == index_.end()) {
        return nullptr;
    }
    return &rows_[it->second];
}

void Table::put(const std::string& id, Record record) {
    auto it = index_.find(id);
    if (it != index_.end()) {
        rows_[it->second] = std::move(record);
        return;
    }
    index_.emplace(id, rows_.size());
    rows_.push_back(std::move(record));
}

bool Table::erase(std::string_view id) {
    auto it = index_.find(std::string(id));
    if (it == index_.end()) {
        return false;
    }
    const std::size_t pos = it->second;
    index_.erase(it);
    rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(pos));

    // Everything behind the gap moved one slot forward.
    for (auto& [_, slot] : index_) {
        if (slot > pos) {
            --slot;
        }
    }
    return true;
}

// ── DataStore ─────────────────────────────────────────────────────────────────

Table& DataStore::table_locked(std::string_view name) {
    require_table_name(name);
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        it = tables_.emplace(std::string(name), Table{}).first;
    }
    return it->second;
}

Table DataStore::get_table(std::string_view name) {
    std::unique_lock lock(mutex_);
    return table_locked(name);
}

std::vector<Record> DataStore::get_all(std::string_view name) const {
    require_table_name(name);
    std::shared_lock lock(mutex_);
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        return {};
    }
    return it->second.rows();
}

std::optional<Record> DataStore::get(std::string_view name, std::string_view id) const {
    require_table_name(name);
    std::shared_lock lock(mutex_);
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        return std::nullopt;
    }
    if (const Record* rec = it->second.find(id)) {
        return *rec;
    }
    return std::nullopt;
}

std::string DataStore::insert(std::string_view name, Record record) {
    std::string id;
    if (const Value* v = find_field(record, "id"); v && !v->is_null()) {
        if (!v->is_string()) {
            throw std::invalid_argument(
                fmt::format("record id must be a string, got {}", kind_name(v->kind())));
        }
        id = v->as_string();
    }
    if (id.empty()) {
        id = generate_uuid();
        record.insert_or_assign("id", Value(id));
    }

    std::unique_lock lock(mutex_);
    table_locked(name).put(id, std::move(record));
    return id;
}

bool DataStore::update(std::string_view name, std::string_view id, Record record) {
    std::unique_lock lock(mutex_);
    Table& table = table_locked(name);
    if (table.find(id) == nullptr) {
        return false;
    }
    record.insert_or_assign("id", Value(id));
    table.put(std::string(id), std::move(record));
    return true;
}

bool DataStore::del(std::string_view name, std::string_view id) {
    std::unique_lock lock(mutex_);
    return table_locked(name).erase(id);
}

void DataStore::clear(std::string_view name) {
    require_table_name(name);
    std::unique_lock lock(mutex_);
    if (auto it = tables_.find(name); it != tables_.end()) {
        tables_.erase(it);
    }
}

void DataStore::clear() {
    std::unique_lock lock(mutex_);
    tables_.clear();
}

std::vector<std::string> DataStore::table_names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(tables_.size());
    for (const auto& [name, _] : tables_) {
        result.push_back(name);
    }
    return result;
}

std::size_t DataStore::size(std::string_view name) const {
    require_table_name(name);
    std::shared_lock lock(mutex_);
    auto it = tables_.find(name);
    return it == tables_.end() ? 0 : it->second.size();
}

} // namespace mockdb
