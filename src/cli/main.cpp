// mockdb-query: seeds a store from the command line and runs one query
// against it through the awaitable path, printing each row as JSON.
//
//   mockdb-query --seed-leads 50 --table leads --eq status=new \
//                --order score --desc --limit 5

#include "common/logger.hpp"
#include "common/store_config.hpp"
#include "store/store.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/program_options.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace po = boost::program_options;
namespace asio = boost::asio;

namespace {

using Builder = mockdb::query::QueryBuilder<mockdb::Record>;

// Interpret a command-line literal: null, true/false, integer, double,
// otherwise a string.
mockdb::Value parse_literal(std::string_view text) {
    if (text == "null")  return nullptr;
    if (text == "true")  return true;
    if (text == "false") return false;

    int64_t i = 0;
    auto [iptr, iec] = std::from_chars(text.data(), text.data() + text.size(), i);
    if (iec == std::errc{} && iptr == text.data() + text.size()) {
        return i;
    }
    double d = 0.0;
    auto [dptr, dec] = std::from_chars(text.data(), text.data() + text.size(), d);
    if (dec == std::errc{} && dptr == text.data() + text.size()) {
        return d;
    }
    return text;
}

// Split "column=value".  Throws std::runtime_error if there is no '='.
std::pair<std::string, std::string> split_assignment(const std::string& arg,
                                                     std::string_view option) {
    const auto pos = arg.find('=');
    if (pos == std::string::npos || pos == 0) {
        throw std::runtime_error(
            fmt::format("--{} expects column=value, got '{}'", option, arg));
    }
    return {arg.substr(0, pos), arg.substr(pos + 1)};
}

// Parse "from:to" for --range.
std::pair<int64_t, int64_t> parse_range(const std::string& arg) {
    const auto pos = arg.find(':');
    int64_t from = 0;
    int64_t to   = 0;
    bool ok = pos != std::string::npos;
    if (ok) {
        auto [p1, e1] = std::from_chars(arg.data(), arg.data() + pos, from);
        auto [p2, e2] = std::from_chars(arg.data() + pos + 1, arg.data() + arg.size(), to);
        ok = e1 == std::errc{} && p1 == arg.data() + pos &&
             e2 == std::errc{} && p2 == arg.data() + arg.size();
    }
    if (!ok) {
        throw std::runtime_error(fmt::format("--range expects from:to, got '{}'", arg));
    }
    return {from, to};
}

void add_query_options(po::options_description& desc) {
    using strings = std::vector<std::string>;
    desc.add_options()
        ("help,h",  "Show this help message and exit")
        ("table",   po::value<std::string>()->default_value("leads"), "Table to query")
        ("select",  po::value<std::string>()->default_value("*"), "Column list (not enforced)")
        ("eq",      po::value<strings>()->composing(), "column=value (repeatable)")
        ("neq",     po::value<strings>()->composing(), "column=value (repeatable)")
        ("gt",      po::value<strings>()->composing(), "column=value (repeatable)")
        ("gte",     po::value<strings>()->composing(), "column=value (repeatable)")
        ("lt",      po::value<strings>()->composing(), "column=value (repeatable)")
        ("lte",     po::value<strings>()->composing(), "column=value (repeatable)")
        ("like",    po::value<strings>()->composing(), "column=pattern, '%' wildcard (repeatable)")
        ("ilike",   po::value<strings>()->composing(), "same as --like")
        ("is",      po::value<strings>()->composing(), "column=null|true|false (repeatable)")
        ("or",      po::value<std::string>(), "OR filter: col.eq.val,col.neq.val,...")
        ("order",   po::value<std::string>(), "Order by column")
        ("desc",    po::bool_switch()->default_value(false), "Descending order")
        ("limit",   po::value<int64_t>(), "Maximum number of rows")
        ("range",   po::value<std::string>(), "Inclusive row range from:to")
        ("single",  po::bool_switch()->default_value(false), "Return only the first row");
}

Builder build_query(mockdb::Store& store, const po::variables_map& vm) {
    Builder q = store.from(vm["table"].as<std::string>());
    q.select(vm["select"].as<std::string>());

    using Method = Builder& (Builder::*)(std::string, mockdb::Value);
    const std::pair<const char*, Method> comparisons[] = {
        {"eq",  &Builder::eq},  {"neq", &Builder::neq},
        {"gt",  &Builder::gt},  {"gte", &Builder::gte},
        {"lt",  &Builder::lt},  {"lte", &Builder::lte},
        {"is",  &Builder::is},
    };
    for (const auto& [name, method] : comparisons) {
        if (!vm.count(name)) continue;
        for (const auto& arg : vm[name].as<std::vector<std::string>>()) {
            auto [column, value] = split_assignment(arg, name);
            (q.*method)(std::move(column), parse_literal(value));
        }
    }
    for (const char* name : {"like", "ilike"}) {
        if (!vm.count(name)) continue;
        for (const auto& arg : vm[name].as<std::vector<std::string>>()) {
            auto [column, pattern] = split_assignment(arg, name);
            q.like(std::move(column), pattern);
        }
    }
    if (vm.count("or")) {
        q.or_(vm["or"].as<std::string>());
    }
    if (vm.count("order")) {
        q.order(vm["order"].as<std::string>(), {.ascending = !vm["desc"].as<bool>()});
    }
    if (vm.count("limit")) {
        q.limit(vm["limit"].as<int64_t>());
    }
    if (vm.count("range")) {
        const auto [from, to] = parse_range(vm["range"].as<std::string>());
        q.range(from, to);
    }
    return q;
}

asio::awaitable<int> run_query(Builder query, bool single) {
    if (single) {
        auto res = co_await query.async_single();
        if (res.error) {
            spdlog::error("mockdb-query: {}", res.error->message);
            co_return 1;
        }
        fprintf(stdout, "%s\n", res.data ? mockdb::to_json(*res.data).c_str() : "null");
        co_return 0;
    }

    auto res = co_await query.async_execute();
    if (res.error) {
        spdlog::error("mockdb-query: {}", res.error->message);
        co_return 1;
    }
    for (const auto& row : res.data) {
        fprintf(stdout, "%s\n", mockdb::to_json(row).c_str());
    }
    if (res.count) {
        fprintf(stdout, "-- %zu row(s), %zu matched\n", res.data.size(), *res.count);
    } else {
        fprintf(stdout, "-- %zu row(s)\n", res.data.size());
    }
    co_return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    po::options_description desc("mockdb-query options");
    add_query_options(desc);
    mockdb::add_options(desc);

    po::variables_map vm;
    mockdb::StoreConfig cfg;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            fprintf(stdout, "%s\n", oss.str().c_str());
            return 0;
        }
        po::notify(vm);
        cfg = mockdb::config_from(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    const auto level = mockdb::parse_log_level(cfg.log_level);
    mockdb::init_default_logger(level);

    mockdb::Store store{cfg};

    int exit_code = 1;
    try {
        Builder query = build_query(store, vm);
        const bool single = vm["single"].as<bool>();

        asio::io_context ioc;
        asio::co_spawn(ioc, run_query(std::move(query), single),
            [&](std::exception_ptr ep, int rc) {
                if (ep) {
                    std::rethrow_exception(ep);
                }
                exit_code = rc;
            });
        ioc.run();
    } catch (const std::exception& e) {
        fprintf(stderr, "mockdb-query: %s\n", e.what());
        return 1;
    }
    return exit_code;
}
