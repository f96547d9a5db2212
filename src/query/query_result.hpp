#pragma once

#include "storage/value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mockdb::query {

// Failure reported inside a result envelope instead of being thrown.
struct QueryError {
    std::string message;
};

// ── Result envelopes ──────────────────────────────────────────────────────────
//
// Every terminal returns one of these.  Callers check `error`; they never need
// to catch exceptions around an execution.  `count` is only set by selects and
// holds the number of matching rows before offset/limit were applied.

template <typename T>
struct Result {
    std::vector<T>             data;
    std::optional<QueryError>  error;
    std::optional<std::size_t> count;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// single() / maybe_single(): the first row, or nullopt when nothing matched.
template <typename T>
struct SingleResult {
    std::optional<T>          data;
    std::optional<QueryError> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

using QueryResult = Result<Record>;

} // namespace mockdb::query
