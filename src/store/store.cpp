#include "store/store.hpp"

#include "common/logger.hpp"
#include "seed/factories.hpp"


namespace mockdb {

namespace {

std::shared_ptr<spdlog::logger> logger_or_default(std::shared_ptr<spdlog::logger> logger,
                                                  const StoreConfig& config) {
    if (logger) {
        return logger;
    }
    return make_store_logger("mockdb", parse_log_level(config.log_level));
}

StoreConfig validated(StoreConfig config) {
    validate(config);
    return config;
}

} // namespace

Store::Store(StoreConfig config,
             std::shared_ptr<const Clock> clock,
             std::shared_ptr<spdlog::logger> logger)
    : config_(validated(std::move(config)))
    , clock_(clock ? std::move(clock) : std::make_shared<SystemClock>())
    , logger_(logger_or_default(std::move(logger), config_))
    , executor_(data_, clock_,
                query::ExecutorOptions{
                    .log_operations = config_.log_operations,
                    .latency_min_ms = config_.latency_min_ms,
                    .latency_max_ms = config_.latency_max_ms,
                },
                logger_)
{
    seed();
}

void Store::reset() {
    data_.clear();
    seed();
    logger_->debug("store reset");
}

void Store::seed() {
    if (config_.seed_leads == 0 && config_.seed_contacts == 0 && config_.seed_properties == 0) {
        return;
    }
    seed::seed_store(data_, config_, *clock_);
    logger_->info("seeded store from '{}': leads={} contacts={} properties={}",
                  config_.seed, config_.seed_leads, config_.seed_contacts,
                  config_.seed_properties);
}

Store& default_store() {
    static Store store;
    return store;
}

void reset_default_store() {
    default_store().reset();
}

} // namespace mockdb
