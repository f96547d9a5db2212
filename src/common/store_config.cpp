#include "common/store_config.hpp"

#include "common/logger.hpp"

#include <fmt/format.h>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace mockdb {

// ── validate ─────────────────────────────────────────────────────────────────

void validate(const StoreConfig& cfg) {
    if (cfg.latency_min_ms > cfg.latency_max_ms) {
        throw std::runtime_error(
            fmt::format("--latency-min-ms ({}) must not exceed --latency-max-ms ({})",
                        cfg.latency_min_ms, cfg.latency_max_ms));
    }
    if (!is_known_log_level(cfg.log_level)) {
        throw std::runtime_error(
            fmt::format("Unknown --log-level '{}'", cfg.log_level));
    }
    if (cfg.seed.empty()) {
        throw std::runtime_error("--seed must not be empty");
    }
}

// ── add_options ──────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("log-operations",
            po::bool_switch()->default_value(false),
            "Log one line per executed query")
        ("latency-min-ms",
            po::value<uint32_t>()->default_value(0),
            "Lower bound of the simulated network latency (ms)")
        ("latency-max-ms",
            po::value<uint32_t>()->default_value(0),
            "Upper bound of the simulated network latency (ms)")
        ("seed",
            po::value<std::string>()->default_value("mockdb"),
            "Seed string for deterministic synthetic data")
        ("seed-leads",
            po::value<uint32_t>()->default_value(0),
            "Number of generated records in 'leads'")
        ("seed-contacts",
            po::value<uint32_t>()->default_value(0),
            "Number of generated records in 'contacts'")
        ("seed-properties",
            po::value<uint32_t>()->default_value(0),
            "Number of generated records in 'properties'");
}

// ── config_from ──────────────────────────────────────────────────────────────

StoreConfig config_from(const po::variables_map& vm) {
    StoreConfig cfg;
    cfg.log_level       = vm["log-level"].as<std::string>();
    cfg.log_operations  = vm["log-operations"].as<bool>();
    cfg.latency_min_ms  = vm["latency-min-ms"].as<uint32_t>();
    cfg.latency_max_ms  = vm["latency-max-ms"].as<uint32_t>();
    cfg.seed            = vm["seed"].as<std::string>();
    cfg.seed_leads      = vm["seed-leads"].as<uint32_t>();
    cfg.seed_contacts   = vm["seed-contacts"].as<uint32_t>();
    cfg.seed_properties = vm["seed-properties"].as<uint32_t>();

    validate(cfg);
    return cfg;
}

// ── parse_config ─────────────────────────────────────────────────────────────

StoreConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("mockdb store options");
    desc.add_options()("help,h", "Show this help message and exit");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        // Handle --help before notify() so option errors don't mask it.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    return config_from(vm);
}

} // namespace mockdb
