#include "seed/factories.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <vector>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fmt/format.h>

namespace mockdb::seed {

namespace {

constexpr std::array<std::string_view, 12> kFirstNames{
    "Ava", "Liam", "Maya", "Noah", "Zoe", "Ethan",
    "Chloe", "Lucas", "Nora", "Owen", "Ruby", "Caleb",
};

constexpr std::array<std::string_view, 12> kLastNames{
    "Bennett", "Carter", "Diaz", "Foster", "Garcia", "Hughes",
    "Kim", "Lopez", "Morgan", "Patel", "Reed", "Walsh",
};

constexpr std::array<std::string_view, 8> kCompanies{
    "Northwind Realty", "Blue Oak Capital", "Harbor Homes", "Summit Partners",
    "Keystone Holdings", "Maple Street LLC", "Cedar Ridge Group", "Brightline Ventures",
};

constexpr std::array<std::string_view, 5> kLeadStatuses{"new", "active", "won", "closed", "lost"};
constexpr std::array<std::string_view, 5> kLeadTags{"VIP", "Hot Lead", "Referral", "Cold", "Follow-up"};
constexpr std::array<std::string_view, 4> kOptStatuses{"opted_in", "opted_out", "pending", "new"};
constexpr std::array<std::string_view, 3> kSmsOptStatuses{"opted_in", "opted_out", "pending"};
constexpr std::array<std::string_view, 6> kJobTitles{
    "Broker", "Investor", "Property Manager", "Attorney", "Contractor", "Lender",
};

constexpr std::array<std::string_view, 8> kStreets{
    "Maple Ave", "Oak St", "Pine Rd", "Elm Dr", "Cedar Ln", "Birch Way", "Lake Blvd", "Hill Ct",
};
constexpr std::array<std::string_view, 6> kCities{
    "Austin", "Denver", "Raleigh", "Phoenix", "Tampa", "Columbus",
};
constexpr std::array<std::string_view, 6> kStates{"TX", "CO", "NC", "AZ", "FL", "OH"};
constexpr std::array<std::string_view, 4> kPropertyTypes{
    "single_family", "multi_family", "condo", "townhouse",
};
constexpr std::array<std::string_view, 4> kPropertyStatuses{"active", "pending", "closed", "archived"};
constexpr std::array<std::string_view, 4> kPropertyTags{"Flip", "Rental", "Wholesale", "Buy & Hold"};

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

uint32_t seed_value(std::string_view seed) {
    uint32_t sum = 0;
    for (const char c : seed) {
        sum += static_cast<unsigned char>(c);
    }
    return sum;
}

RecordFactory::RecordFactory(std::string_view seed, const Clock& clock)
    : rng_(seed_value(seed))
    , uuid_gen_(rng_)
    , clock_(clock)
{}

// ── Primitives ───────────────────────────────────────────────────────────────

std::string RecordFactory::uuid() {
    return boost::uuids::to_string(uuid_gen_());
}

int64_t RecordFactory::int_between(int64_t lo, int64_t hi) {
    std::uniform_int_distribution<int64_t> dist(lo, hi);
    return dist(rng_);
}

double RecordFactory::real_between(double lo, double hi, int decimals) {
    std::uniform_real_distribution<double> dist(lo, hi);
    const double scale = std::pow(10.0, decimals);
    return std::round(dist(rng_) * scale) / scale;
}

bool RecordFactory::chance(double p) {
    std::bernoulli_distribution dist(p);
    return dist(rng_);
}

std::string_view RecordFactory::pick(std::span<const std::string_view> items) {
    return items[static_cast<std::size_t>(int_between(0, static_cast<int64_t>(items.size()) - 1))];
}

Value RecordFactory::pick_some(std::span<const std::string_view> items, int min, int max) {
    std::vector<std::string_view> pool(items.begin(), items.end());
    std::shuffle(pool.begin(), pool.end(), rng_);
    const auto n = static_cast<std::size_t>(int_between(min, max));

    Value::Array out;
    for (std::size_t i = 0; i < n && i < pool.size(); ++i) {
        out.emplace_back(pool[i]);
    }
    return Value(std::move(out));
}

std::string RecordFactory::days_ago(int max_days) {
    const auto offset = std::chrono::seconds{int_between(0, int64_t{max_days} * 24 * 3600)};
    return format_iso8601(clock_.now() - offset);
}

std::string RecordFactory::phone() {
    return fmt::format("({:03}) {:03}-{:04}",
                       int_between(201, 989), int_between(200, 999), int_between(0, 9999));
}

std::string RecordFactory::email(std::string_view first, std::string_view last) {
    return fmt::format("{}.{}{}@example.com", lowercase(first), lowercase(last), int_between(1, 99));
}

// ── Rows ─────────────────────────────────────────────────────────────────────

Record RecordFactory::lead() {
    const auto first = pick(kFirstNames);
    const auto last  = pick(kLastNames);
    return Record{
        {"id",           uuid()},
        {"name",         fmt::format("{} {}", first, last)},
        {"email",        email(first, last)},
        {"phone",        phone()},
        {"company",      pick(kCompanies)},
        {"status",       pick(kLeadStatuses)},
        {"score",        int_between(0, 100)},
        {"tags",         pick_some(kLeadTags, 0, 3)},
        {"opt_status",   pick(kOptStatuses)},
        {"workspace_id", nullptr},
        {"is_deleted",   false},
        {"created_at",   days_ago(365)},
        {"updated_at",   days_ago(30)},
    };
}

Record RecordFactory::contact() {
    const auto first = pick(kFirstNames);
    const auto last  = pick(kLastNames);
    const std::string mail = email(first, last);
    const std::string tel  = phone();
    return Record{
        {"id",             uuid()},
        {"first_name",     first},
        {"last_name",      last},
        {"email",          mail},
        {"emails",         Value::array({mail})},
        {"phone",          tel},
        {"phones",         Value::array({tel})},
        {"company",        pick(kCompanies)},
        {"job_title",      pick(kJobTitles)},
        {"sms_opt_status", pick(kSmsOptStatuses)},
        {"created_at",     days_ago(365)},
        {"updated_at",     days_ago(30)},
    };
}

Record RecordFactory::property() {
    Record row{
        {"id",             uuid()},
        {"profile_id",     uuid()},
        {"address_line_1", fmt::format("{} {}", int_between(100, 9999), pick(kStreets))},
        {"address_line_2", nullptr},
        {"city",           pick(kCities)},
        {"state",          pick(kStates)},
        {"zip",            fmt::format("{:05}", int_between(10000, 99999))},
        {"bedrooms",       int_between(1, 6)},
        {"bathrooms",      real_between(1.0, 4.0, 1)},
        {"square_feet",    int_between(800, 4500)},
        {"year_built",     int_between(1950, 2024)},
        {"property_type",  pick(kPropertyTypes)},
        {"purchase_price", int_between(100'000, 800'000)},
        {"arv",            int_between(150'000, 1'000'000)},
        {"status",         pick(kPropertyStatuses)},
        {"tags",           pick_some(kPropertyTags, 0, 2)},
        {"created_at",     days_ago(365)},
        {"updated_at",     days_ago(30)},
    };
    if (chance(0.3)) {
        row.insert_or_assign("address_line_2", Value(fmt::format("Apt {}", int_between(1, 999))));
    }
    return row;
}

// ── seed_store ───────────────────────────────────────────────────────────────

void seed_store(DataStore& data, const StoreConfig& config, const Clock& clock) {
    RecordFactory factory(config.seed, clock);
    for (uint32_t i = 0; i < config.seed_leads; ++i) {
        data.insert("leads", factory.lead());
    }
    for (uint32_t i = 0; i < config.seed_contacts; ++i) {
        data.insert("contacts", factory.contact());
    }
    for (uint32_t i = 0; i < config.seed_properties; ++i) {
        data.insert("properties", factory.property());
    }
}

} // namespace mockdb::seed
