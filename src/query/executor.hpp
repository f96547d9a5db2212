#pragma once

#include "common/clock.hpp"
#include "query/query_result.hpp"
#include "query/query_state.hpp"
#include "storage/data_store.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include <spdlog/spdlog.h>

namespace mockdb::query {

struct ExecutorOptions {
    bool     log_operations = false;
    uint32_t latency_min_ms = 0;
    uint32_t latency_max_ms = 0;
};

// ── Executor ──────────────────────────────────────────────────────────────────
//
// Interprets one QueryState against a DataStore and produces its envelope.
//
//   select : snapshot → filter → stable sort (nulls last) → count → offset → limit
//   insert : synthesize id/created_at/updated_at, caller fields win
//   update : filter existing rows, shallow-merge the patch, refresh updated_at
//   delete : filter existing rows, remove them, return the removed rows
//   upsert : per row – merge into the existing id, or insert as new
//
// run() is serialized per Executor, so each execution is atomic with respect
// to every other execution on the same store.  Exceptions raised while
// executing are returned as QueryError; run() itself does not throw.

class Executor {
public:
    Executor(DataStore& data,
             std::shared_ptr<const Clock> clock,
             ExecutorOptions options = {},
             std::shared_ptr<spdlog::logger> logger = {});

    Executor(const Executor&)            = delete;
    Executor& operator=(const Executor&) = delete;

    [[nodiscard]] QueryResult run(const QueryState& state);

    // Delay to apply before an async execution, drawn uniformly from the
    // configured latency range.  Zero when simulation is disabled.
    [[nodiscard]] std::chrono::milliseconds next_latency();

    [[nodiscard]] const ExecutorOptions& options() const noexcept { return options_; }

private:
    QueryResult run_select(const QueryState& state);
    QueryResult run_insert(const QueryState& state, const std::string& now);
    QueryResult run_update(const QueryState& state, const std::string& now);
    QueryResult run_delete(const QueryState& state);
    QueryResult run_upsert(const QueryState& state, const std::string& now);

    // Rows of the target table that satisfy every predicate, in storage order.
    std::vector<Record> matching_rows(const QueryState& state) const;

    DataStore& data_;
    std::shared_ptr<const Clock> clock_;
    ExecutorOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex mutex_;        // serializes run()
    std::mutex rng_mutex_;    // guards rng_
    std::mt19937 rng_;
};

} // namespace mockdb::query
