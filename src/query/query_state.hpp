#pragma once

#include "query/predicate.hpp"
#include "storage/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mockdb::query {

enum class Operation : uint8_t {
    Select = 0,
    Insert = 1,
    Update = 2,
    Delete = 3,
    Upsert = 4,
};

[[nodiscard]] std::string_view to_string(Operation op) noexcept;

// Single ordering key; a later order() call replaces it.
struct Ordering {
    std::string column;
    bool        ascending = true;
};

// ── QueryState ────────────────────────────────────────────────────────────────
//
// Everything a builder has accumulated for one operation.  Untyped, copyable
// and free of side effects: nothing touches the store until an Executor runs
// it.

struct QueryState {
    std::string                table;
    Operation                  operation = Operation::Select;
    std::string                columns   = "*";  // accepted, not enforced
    std::vector<Predicate>     predicates;       // ANDed at execution time
    std::optional<Ordering>    ordering;
    std::optional<std::size_t> limit;
    std::size_t                offset = 0;
    std::vector<Record>        payload;          // insert/upsert rows, or the update patch
};

} // namespace mockdb::query
