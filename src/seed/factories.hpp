#pragma once

#include "common/clock.hpp"
#include "common/store_config.hpp"
#include "storage/data_store.hpp"
#include "storage/value.hpp"

#include <cstdint>
#include <random>
#include <span>
#include <string>
#include <string_view>

#include <boost/uuid/random_generator.hpp>

namespace mockdb::seed {

// Numeric seed derived from a seed string: the sum of its character codes.
[[nodiscard]] uint32_t seed_value(std::string_view seed);

// ── RecordFactory ─────────────────────────────────────────────────────────────
//
// Deterministic generator of realistic synthetic rows.  Two factories built
// from the same seed string and clock produce identical sequences.
//
// Not copyable or movable: the UUID generator refers to the owned engine.

class RecordFactory {
public:
    RecordFactory(std::string_view seed, const Clock& clock);

    RecordFactory(const RecordFactory&)            = delete;
    RecordFactory& operator=(const RecordFactory&) = delete;

    // Row for the "leads" table: name, email, phone, company, status, score
    // (0–100), tags, opt_status, is_deleted and timestamps.
    [[nodiscard]] Record lead();

    // Row for the "contacts" table.
    [[nodiscard]] Record contact();

    // Row for the "properties" table.
    [[nodiscard]] Record property();

private:
    [[nodiscard]] std::string uuid();
    [[nodiscard]] int64_t int_between(int64_t lo, int64_t hi);
    [[nodiscard]] double real_between(double lo, double hi, int decimals);
    [[nodiscard]] bool chance(double p);
    [[nodiscard]] std::string_view pick(std::span<const std::string_view> items);
    [[nodiscard]] Value pick_some(std::span<const std::string_view> items, int min, int max);
    [[nodiscard]] std::string days_ago(int max_days);
    [[nodiscard]] std::string phone();
    [[nodiscard]] std::string email(std::string_view first, std::string_view last);

    std::mt19937 rng_;
    boost::uuids::basic_random_generator<std::mt19937> uuid_gen_;
    const Clock& clock_;
};

// Inserts config.seed_leads / seed_contacts / seed_properties generated rows
// into "leads" / "contacts" / "properties".
void seed_store(DataStore& data, const StoreConfig& config, const Clock& clock);

} // namespace mockdb::seed
