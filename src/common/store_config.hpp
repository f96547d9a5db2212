#pragma once

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace mockdb {

// ── StoreConfig ──────────────────────────────────────────────────────────────
// Runtime configuration of one mock store.
// Populated by parse_config() / config_from() from CLI arguments; the
// defaults describe a quiet, unseeded store with no simulated latency.

struct StoreConfig {
    std::string log_level       = "info";    // spdlog level string
    bool        log_operations  = false;     // one log line per executed query
    uint32_t    latency_min_ms  = 0;         // simulated latency lower bound (async path)
    uint32_t    latency_max_ms  = 0;         // simulated latency upper bound (async path)
    std::string seed            = "mockdb";  // seed for the synthetic data factories
    uint32_t    seed_leads      = 0;         // records generated into "leads"
    uint32_t    seed_contacts   = 0;         // records generated into "contacts"
    uint32_t    seed_properties = 0;         // records generated into "properties"
};

// ── add_options ──────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with store options.
// Exposed so tools can combine them with their own options.

void add_options(boost::program_options::options_description& desc);

// ── config_from ──────────────────────────────────────────────────────────────
// Build and validate a StoreConfig from already-notified variables.
// Throws std::runtime_error on invalid values.

[[nodiscard]] StoreConfig config_from(const boost::program_options::variables_map& vm);

// ── parse_config ─────────────────────────────────────────────────────────────
// Parse CLI arguments into a StoreConfig.
//
// On success: returns a fully validated StoreConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help also throws, carrying the help text).
//
// Validates:
//   - latency_min_ms <= latency_max_ms
//   - log_level is a known spdlog level
//   - seed is not empty

[[nodiscard]] StoreConfig parse_config(int argc, char* argv[]);

// Throws std::runtime_error if `cfg` violates the rules listed above.
void validate(const StoreConfig& cfg);

} // namespace mockdb
