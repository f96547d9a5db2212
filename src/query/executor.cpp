#include "query/executor.hpp"

#include "common/uuid.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <stdexcept>
#include <string>

namespace mockdb::query {

namespace {

// Nulls, missing fields and NaN all sort together, after every other value.
bool sorts_as_null(const Value* v) {
    if (v == nullptr || v->is_null()) {
        return true;
    }
    return v->kind() == Value::Kind::Double && std::isnan(v->as_double());
}

// Strict ordering for the single sort key.  Nulls (and missing fields, NaN)
// sort last in both directions; values of different kinds fall back to kind order.
bool order_before(const Value* a, const Value* b, bool ascending) {
    const bool a_null = sorts_as_null(a);
    const bool b_null = sorts_as_null(b);
    if (a_null || b_null) {
        return !a_null && b_null;
    }

    auto ord = compare(*a, *b);
    if (ord == std::partial_ordering::unordered) {
        ord = static_cast<int>(a->kind()) <=> static_cast<int>(b->kind());
    }
    return ascending ? ord == std::partial_ordering::less
                     : ord == std::partial_ordering::greater;
}

// Rejects payload rows whose id can't be stored, before anything is written.
void validate_payload_ids(const std::vector<Record>& payload) {
    for (const auto& item : payload) {
        const Value* id = find_field(item, "id");
        if (id != nullptr && !id->is_null() && !id->is_string()) {
            throw std::invalid_argument(
                fmt::format("record id must be a string, got {}", kind_name(id->kind())));
        }
    }
}

// Existing string id of a payload row, or empty if it has none.
std::string payload_id(const Record& item) {
    const Value* id = find_field(item, "id");
    if (id == nullptr || !id->is_string()) {
        return {};
    }
    return id->as_string();
}

// Overlay `patch` onto `base` (shallow: whole fields are replaced).
void merge_into(Record& base, const Record& patch) {
    for (const auto& [key, value] : patch) {
        base.insert_or_assign(key, value);
    }
}

} // namespace

std::string_view to_string(Operation op) noexcept {
    switch (op) {
        case Operation::Select: return "select";
        case Operation::Insert: return "insert";
        case Operation::Update: return "update";
        case Operation::Delete: return "delete";
        case Operation::Upsert: return "upsert";
    }
    return "unknown";
}

Executor::Executor(DataStore& data,
                   std::shared_ptr<const Clock> clock,
                   ExecutorOptions options,
                   std::shared_ptr<spdlog::logger> logger)
    : data_(data)
    , clock_(std::move(clock))
    , options_(options)
    , logger_(std::move(logger))
    , rng_(std::random_device{}())
{
    if (!clock_) {
        throw std::invalid_argument("Executor requires a clock");
    }
}

std::chrono::milliseconds Executor::next_latency() {
    if (options_.latency_max_ms == 0) {
        return std::chrono::milliseconds{0};
    }
    std::lock_guard lock(rng_mutex_);
    std::uniform_int_distribution<uint32_t> dist(options_.latency_min_ms, options_.latency_max_ms);
    return std::chrono::milliseconds{dist(rng_)};
}

QueryResult Executor::run(const QueryState& state) {
    std::lock_guard lock(mutex_);

    if (options_.log_operations && logger_) {
        logger_->info("query table={} op={} filters={} limit={}",
                      state.table, to_string(state.operation), state.predicates.size(),
                      state.limit ? std::to_string(*state.limit) : std::string("none"));
    }

    try {
        const std::string now = format_iso8601(clock_->now());
        switch (state.operation) {
            case Operation::Select: return run_select(state);
            case Operation::Insert: return run_insert(state, now);
            case Operation::Update: return run_update(state, now);
            case Operation::Delete: return run_delete(state);
            case Operation::Upsert: return run_upsert(state, now);
        }
        return QueryResult{};
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->warn("query table={} op={} failed: {}",
                          state.table, to_string(state.operation), e.what());
        }
        return QueryResult{{}, QueryError{e.what()}, std::nullopt};
    }
}

std::vector<Record> Executor::matching_rows(const QueryState& state) const {
    // get_all() hands back a copy, so writes during iteration can't disturb it.
    std::vector<Record> rows = data_.get_all(state.table);
    std::erase_if(rows, [&](const Record& r) { return !matches_all(state.predicates, r); });
    return rows;
}

// ── select ───────────────────────────────────────────────────────────────────

QueryResult Executor::run_select(const QueryState& state) {
    std::vector<Record> rows = matching_rows(state);

    if (state.ordering) {
        const Ordering& key = *state.ordering;
        std::stable_sort(rows.begin(), rows.end(), [&](const Record& a, const Record& b) {
            return order_before(find_field(a, key.column), find_field(b, key.column),
                                key.ascending);
        });
    }

    const std::size_t count = rows.size();

    // Pagination strictly after filtering and ordering.
    if (state.offset >= rows.size()) {
        rows.clear();
    } else if (state.offset > 0) {
        rows.erase(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(state.offset));
    }
    if (state.limit && *state.limit < rows.size()) {
        rows.resize(*state.limit);
    }

    return QueryResult{std::move(rows), std::nullopt, count};
}

// ── insert ───────────────────────────────────────────────────────────────────

namespace {

// Stores `item` as a new row: synthesized identity and timestamps, overridden
// by whatever the caller supplied.  Returns the row as stored.
Record insert_new_row(DataStore& data, const std::string& table,
                      const Record& item, const std::string& now) {
    Record row = item;
    row.try_emplace("id", Value(generate_uuid()));
    row.try_emplace("created_at", Value(now));
    row.try_emplace("updated_at", Value(now));

    const std::string id = data.insert(table, row);
    row.insert_or_assign("id", Value(id));
    return row;
}

} // namespace

QueryResult Executor::run_insert(const QueryState& state, const std::string& now) {
    validate_payload_ids(state.payload);

    QueryResult result;
    result.data.reserve(state.payload.size());
    for (const auto& item : state.payload) {
        result.data.push_back(insert_new_row(data_, state.table, item, now));
    }
    return result;
}

// ── update ───────────────────────────────────────────────────────────────────

QueryResult Executor::run_update(const QueryState& state, const std::string& now) {
    const Record patch = state.payload.empty() ? Record{} : state.payload.front();

    QueryResult result;
    for (auto& row : matching_rows(state)) {
        const std::string id = payload_id(row);
        merge_into(row, patch);
        row.insert_or_assign("updated_at", Value(now));
        if (data_.update(state.table, id, row)) {
            row.insert_or_assign("id", Value(id));
            result.data.push_back(std::move(row));
        }
    }
    return result;
}

// ── delete ───────────────────────────────────────────────────────────────────

QueryResult Executor::run_delete(const QueryState& state) {
    QueryResult result;
    for (auto& row : matching_rows(state)) {
        if (data_.del(state.table, payload_id(row))) {
            result.data.push_back(std::move(row));
        }
    }
    return result;
}

// ── upsert ───────────────────────────────────────────────────────────────────

QueryResult Executor::run_upsert(const QueryState& state, const std::string& now) {
    validate_payload_ids(state.payload);

    QueryResult result;
    result.data.reserve(state.payload.size());
    for (const auto& item : state.payload) {
        const std::string id = payload_id(item);
        std::optional<Record> existing;
        if (!id.empty()) {
            existing = data_.get(state.table, id);
        }

        if (!existing) {
            result.data.push_back(insert_new_row(data_, state.table, item, now));
            continue;
        }

        Record merged = std::move(*existing);
        merge_into(merged, item);
        merged.insert_or_assign("updated_at", Value(now));
        if (!data_.update(state.table, id, merged)) {
            // Removed through the raw DataStore since the lookup.
            result.data.push_back(insert_new_row(data_, state.table, item, now));
            continue;
        }
        result.data.push_back(std::move(merged));
    }
    return result;
}

} // namespace mockdb::query
