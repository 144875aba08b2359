#pragma once

#include <cstdint>

#include "shortkey/config.hpp"

namespace shortkey {

// charset_size^length, saturating at INT64_MAX.
int64_t keyspace_size(size_t charset_size, int length);

/**
 * Number of allocations budgeted for a length: the full keyspace minus the
 * reserved margin, or the configured override. Always >= 1.
 */
int64_t keyspace_capacity(const KeyspaceConfig& config, int length);

} // namespace shortkey
