#include "shortkey/statistics.hpp"

#include <boost/json.hpp>

namespace shortkey {

Statistics collect_statistics(StorageBackend& backend, ReservedWordFilter& reserved,
                              const KeyspaceConfig& keyspace) {
    Statistics stats;
    stats.charset_size = keyspace.charset.size();
    stats.reserved_count = reserved.size();

    for (const auto& entry : backend.ledger_entries()) {
        LengthUsage usage;
        usage.length = entry.length;
        usage.consumed = entry.consumed;
        usage.capacity = entry.capacity;
        usage.exhausted = entry.exhausted;
        usage.usage_percent = entry.usage_ratio() * 100.0;
        stats.lengths.push_back(usage);

        if (!entry.exhausted && entry.length >= keyspace.min_length && !stats.current_length) {
            stats.current_length = entry.length;
        }
    }

    RecordCounts counts = backend.record_counts();
    stats.records_total = counts.total;
    stats.records_active = counts.active;
    stats.identifiers_assigned = counts.with_identifier;
    return stats;
}

std::string Statistics::to_json() const {
    boost::json::array rows;
    for (const auto& l : lengths) {
        rows.push_back(boost::json::object{
            {"length", l.length},
            {"consumed", l.consumed},
            {"capacity", l.capacity},
            {"exhausted", l.exhausted},
            {"usage_percent", l.usage_percent},
        });
    }

    boost::json::object obj;
    obj["lengths"] = std::move(rows);
    if (current_length) {
        obj["current_length"] = *current_length;
    } else {
        obj["current_length"] = nullptr;
    }
    obj["reserved_count"] = reserved_count;
    obj["charset_size"] = charset_size;
    obj["records_total"] = records_total;
    obj["records_active"] = records_active;
    obj["identifiers_assigned"] = identifiers_assigned;
    return boost::json::serialize(obj);
}

} // namespace shortkey
