#include "shortkey/keyspace.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace shortkey {

int64_t keyspace_size(size_t charset_size, int length) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t n = static_cast<int64_t>(charset_size);
    int64_t total = 1;
    for (int i = 0; i < length; ++i) {
        if (total > max / n) return max;
        total *= n;
    }
    return total;
}

int64_t keyspace_capacity(const KeyspaceConfig& config, int length) {
    auto it = config.capacity_overrides.find(length);
    if (it != config.capacity_overrides.end()) {
        return std::max<int64_t>(1, it->second);
    }

    const long double total = static_cast<long double>(keyspace_size(config.charset.size(), length));
    const long double usable = std::floor(total * (1.0L - static_cast<long double>(config.reserve_ratio)));
    if (usable >= static_cast<long double>(std::numeric_limits<int64_t>::max())) {
        return std::numeric_limits<int64_t>::max();
    }
    return std::max<int64_t>(1, static_cast<int64_t>(usable));
}

} // namespace shortkey
