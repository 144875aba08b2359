#pragma once

#include <optional>
#include <string>
#include <vector>

#include "shortkey/config.hpp"
#include "shortkey/reserved_filter.hpp"
#include "shortkey/storage/backend.hpp"

namespace shortkey {

struct LengthUsage {
    int length = 0;
    int64_t consumed = 0;
    int64_t capacity = 0;
    bool exhausted = false;
    double usage_percent = 0.0;
};

struct Statistics {
    std::vector<LengthUsage> lengths;
    std::optional<int> current_length;      // smallest open ledger row, if any
    size_t reserved_count = 0;
    size_t charset_size = 0;
    int64_t records_total = 0;
    int64_t records_active = 0;
    int64_t identifiers_assigned = 0;

    std::string to_json() const;
};

// Read-only snapshot; never creates or retires ledger rows.
Statistics collect_statistics(StorageBackend& backend, ReservedWordFilter& reserved,
                              const KeyspaceConfig& keyspace);

} // namespace shortkey
