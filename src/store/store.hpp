#pragma once

#include "common/clock.hpp"
#include "common/store_config.hpp"
#include "query/executor.hpp"
#include "query/query_builder.hpp"
#include "storage/data_store.hpp"
#include "storage/value.hpp"

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace mockdb {

// ── Store ─────────────────────────────────────────────────────────────────────
//
// One isolated mock database: its tables, the executor that runs queries
// against them, and the configuration they were seeded from.  Application
// code only uses from(); the DataStore is exposed for seeding and tests.
//
// Create one Store per test (or call reset()) when data must not leak
// between cases.

class Store {
public:
    // Throws std::runtime_error if `config` is invalid.  Without an explicit
    // logger, the shared "mockdb" logger is created at config.log_level.
    explicit Store(StoreConfig config = {},
                   std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>(),
                   std::shared_ptr<spdlog::logger> logger = {});

    Store(const Store&)            = delete;
    Store& operator=(const Store&) = delete;

    // Starts a query on `table` (created lazily).  Throws
    // std::invalid_argument for an empty name.
    template <query::RecordType T = Record>
    [[nodiscard]] query::QueryBuilder<T> from(std::string_view table) {
        return query::QueryBuilder<T>(executor_, std::string(table));
    }

    [[nodiscard]] DataStore& data() noexcept { return data_; }
    [[nodiscard]] const DataStore& data() const noexcept { return data_; }

    [[nodiscard]] const StoreConfig& config() const noexcept { return config_; }
    [[nodiscard]] const Clock& clock() const noexcept { return *clock_; }

    // Drops every table, then re-applies the configured seeding.
    void reset();

private:
    void seed();

    StoreConfig                     config_;
    std::shared_ptr<const Clock>    clock_;
    std::shared_ptr<spdlog::logger> logger_;
    DataStore                       data_;
    query::Executor                 executor_;
};

// ── Process-wide store ────────────────────────────────────────────────────────
//
// Constructed (and seeded per a default StoreConfig) on first use.  Prefer
// passing a Store explicitly; this exists for code that can't.

[[nodiscard]] Store& default_store();

// Clears and reseeds the process-wide store.
void reset_default_store();

} // namespace mockdb
