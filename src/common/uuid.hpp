#pragma once

#include <string>

namespace mockdb {

// Returns a random (version 4) UUID in canonical 8-4-4-4-12 hex form.
// Thread-safe: each thread owns its generator.
[[nodiscard]] std::string generate_uuid();

} // namespace mockdb
