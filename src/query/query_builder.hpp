#pragma once

#include "query/executor.hpp"
#include "query/or_filter.hpp"
#include "query/predicate.hpp"
#include "query/query_result.hpp"
#include "query/query_state.hpp"
#include "storage/value.hpp"

#include <concepts>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace mockdb::query {

// ── RecordTraits ──────────────────────────────────────────────────────────────
//
// Maps a caller's row type to and from the untyped Record the store keeps.
// Specialize for each row type used with QueryBuilder<T>:
//
//   template <> struct mockdb::query::RecordTraits<Lead> {
//       static Record to_record(const Lead&);
//       static Lead   from_record(const Record&);
//   };
//
// from_record() may throw; the failure is reported in the result envelope.

template <typename T>
struct RecordTraits;

template <>
struct RecordTraits<Record> {
    static Record to_record(const Record& r) { return r; }
    static Record from_record(const Record& r) { return r; }
};

template <typename T>
concept RecordType = requires(const T& row, const Record& rec) {
    { RecordTraits<T>::to_record(row) } -> std::convertible_to<Record>;
    { RecordTraits<T>::from_record(rec) } -> std::convertible_to<T>;
};

struct OrderOptions {
    bool ascending = true;
};

namespace detail {

template <RecordType T>
[[nodiscard]] Result<T> convert_rows(QueryResult raw) {
    if constexpr (std::is_same_v<T, Record>) {
        return raw;
    } else {
        Result<T> out;
        out.error = std::move(raw.error);
        out.count = raw.count;
        try {
            out.data.reserve(raw.data.size());
            for (const auto& rec : raw.data) {
                out.data.push_back(RecordTraits<T>::from_record(rec));
            }
        } catch (const std::exception& e) {
            out.data.clear();
            out.error = QueryError{fmt::format("row conversion failed: {}", e.what())};
        }
        return out;
    }
}

// Both single() and maybe_single() take the first row; extra rows are not an
// error for either.
template <typename T>
[[nodiscard]] SingleResult<T> first_row(Result<T> result) {
    SingleResult<T> out;
    out.error = std::move(result.error);
    if (!result.data.empty()) {
        out.data = std::move(result.data.front());
    }
    return out;
}

// `state` is taken by value so the coroutine frame owns its copy; the builder
// that produced it may be gone by the time the awaitable is resumed.
template <RecordType T>
boost::asio::awaitable<Result<T>> run_async(Executor& executor, QueryState state) {
    const auto delay = executor.next_latency();
    if (delay.count() > 0) {
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, delay);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            spdlog::debug("simulated latency for {} interrupted: {}", state.table, ec.message());
        }
    }
    co_return convert_rows<T>(executor.run(state));
}

template <RecordType T>
boost::asio::awaitable<SingleResult<T>> run_async_single(Executor& executor, QueryState state) {
    co_return first_row(co_await run_async<T>(executor, std::move(state)));
}

} // namespace detail

// ── QueryBuilder ──────────────────────────────────────────────────────────────
//
// Fluent accumulator for one operation on one table.  Every call only records
// state; nothing is read or written until a terminal runs:
//
//   auto res = store.from("leads").select().eq("status", "new")
//                   .order("score", {.ascending = false}).limit(10).execute();
//
//   auto res = co_await store.from<Lead>("leads").insert(lead).async_execute();
//
// Each filter call appends exactly one predicate and all predicates are ANDed.
// order() keeps only the last key.  Pagination is applied after filtering and
// ordering.  Running the same builder twice runs its operation twice (a second
// insert inserts again).
//
// `T` is the row type handed in and out; the store itself is untyped.

template <RecordType T = Record>
class QueryBuilder {
public:
    // Throws std::invalid_argument for an empty table name.
    QueryBuilder(Executor& executor, std::string table)
        : executor_(&executor)
    {
        if (table.empty()) {
            throw std::invalid_argument("table name must not be empty");
        }
        state_.table = std::move(table);
    }

    // ── Operation selectors ──────────────────────────────────────────────────

    // Records the column list (not enforced).  After insert/update/upsert/
    // delete this keeps the mutation, as in `insert(x).select().single()`.
    QueryBuilder& select(std::string columns = "*") {
        state_.columns = std::move(columns);
        return *this;
    }

    QueryBuilder& insert(const T& row) {
        return set_rows(Operation::Insert, {RecordTraits<T>::to_record(row)});
    }

    QueryBuilder& insert(const std::vector<T>& rows) {
        return set_rows(Operation::Insert, to_records(rows));
    }

    // `patch` holds only the fields to change.
    QueryBuilder& update(Record patch) {
        state_.operation = Operation::Update;
        state_.payload.clear();
        state_.payload.push_back(std::move(patch));
        return *this;
    }

    // SQL DELETE of every row matching the filters.
    QueryBuilder& del() {
        state_.operation = Operation::Delete;
        state_.payload.clear();
        return *this;
    }

    QueryBuilder& upsert(const T& row) {
        return set_rows(Operation::Upsert, {RecordTraits<T>::to_record(row)});
    }

    QueryBuilder& upsert(const std::vector<T>& rows) {
        return set_rows(Operation::Upsert, to_records(rows));
    }

    // ── Filters ──────────────────────────────────────────────────────────────

    QueryBuilder& eq(std::string column, Value value)  { return compare(std::move(column), CompareOp::Eq,  std::move(value)); }
    QueryBuilder& neq(std::string column, Value value) { return compare(std::move(column), CompareOp::Neq, std::move(value)); }
    QueryBuilder& gt(std::string column, Value value)  { return compare(std::move(column), CompareOp::Gt,  std::move(value)); }
    QueryBuilder& gte(std::string column, Value value) { return compare(std::move(column), CompareOp::Gte, std::move(value)); }
    QueryBuilder& lt(std::string column, Value value)  { return compare(std::move(column), CompareOp::Lt,  std::move(value)); }
    QueryBuilder& lte(std::string column, Value value) { return compare(std::move(column), CompareOp::Lte, std::move(value)); }

    // Case-insensitive, '%' matches any run of characters.
    QueryBuilder& like(std::string column, std::string_view pattern) {
        state_.predicates.emplace_back(make_pattern_match(std::move(column), pattern));
        return *this;
    }

    // Same as like(); there is no case-sensitive variant.
    QueryBuilder& ilike(std::string column, std::string_view pattern) {
        return like(std::move(column), pattern);
    }

    // `value` must be null or a boolean (std::invalid_argument otherwise).
    QueryBuilder& is(std::string column, Value value) {
        state_.predicates.emplace_back(make_is_match(std::move(column), std::move(value)));
        return *this;
    }

    QueryBuilder& in(std::string column, std::vector<Value> values) {
        state_.predicates.emplace_back(InSet{std::move(column), std::move(values)});
        return *this;
    }

    QueryBuilder& contains(std::string column, Value values) {
        state_.predicates.emplace_back(make_contains(std::move(column), std::move(values)));
        return *this;
    }

    QueryBuilder& contained_by(std::string column, Value values) {
        state_.predicates.emplace_back(make_contained_by(std::move(column), std::move(values)));
        return *this;
    }

    // "col.eq.val,col.neq.val,…" as one ORed predicate; see parse_or_filter().
    QueryBuilder& or_(std::string_view filter) {
        state_.predicates.emplace_back(parse_or_filter(filter));
        return *this;
    }

    // ── Shaping ──────────────────────────────────────────────────────────────

    QueryBuilder& order(std::string column, OrderOptions options = {}) {
        state_.ordering = Ordering{std::move(column), options.ascending};
        return *this;
    }

    QueryBuilder& limit(int64_t count) {
        if (count < 0) {
            throw std::invalid_argument(fmt::format("limit must be >= 0, got {}", count));
        }
        state_.limit = static_cast<std::size_t>(count);
        return *this;
    }

    // Rows `from` through `to`, both inclusive (zero-based, after ordering).
    QueryBuilder& range(int64_t from, int64_t to) {
        if (from < 0) {
            throw std::invalid_argument(fmt::format("range start must be >= 0, got {}", from));
        }
        state_.offset = static_cast<std::size_t>(from);
        if (to < from) {
            state_.limit = 0;
        } else {
            // to - from can't overflow here (from >= 0); the +1 is done unsigned.
            state_.limit = static_cast<std::size_t>(to - from) + 1;
        }
        return *this;
    }

    // ── Terminals ────────────────────────────────────────────────────────────

    [[nodiscard]] Result<T> execute() const {
        return detail::convert_rows<T>(executor_->run(state_));
    }

    [[nodiscard]] SingleResult<T> single() const {
        return detail::first_row(execute());
    }

    [[nodiscard]] SingleResult<T> maybe_single() const {
        return single();
    }

    // Awaitable forms; the simulated latency (if configured) is only applied
    // here.  Each returned awaitable owns a copy of the query.
    [[nodiscard]] boost::asio::awaitable<Result<T>> async_execute() const {
        return detail::run_async<T>(*executor_, state_);
    }

    [[nodiscard]] boost::asio::awaitable<SingleResult<T>> async_single() const {
        return detail::run_async_single<T>(*executor_, state_);
    }

    [[nodiscard]] boost::asio::awaitable<SingleResult<T>> async_maybe_single() const {
        return detail::run_async_single<T>(*executor_, state_);
    }

    [[nodiscard]] const QueryState& state() const noexcept { return state_; }

private:
    QueryBuilder& compare(std::string column, CompareOp op, Value value) {
        state_.predicates.emplace_back(Comparison{std::move(column), op, std::move(value)});
        return *this;
    }

    QueryBuilder& set_rows(Operation op, std::vector<Record> rows) {
        state_.operation = op;
        state_.payload   = std::move(rows);
        return *this;
    }

    static std::vector<Record> to_records(const std::vector<T>& rows) {
        std::vector<Record> out;
        out.reserve(rows.size());
        for (const auto& row : rows) {
            out.push_back(RecordTraits<T>::to_record(row));
        }
        return out;
    }

    Executor*  executor_;
    QueryState state_;
};

} // namespace mockdb::query
