#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace shortkey {

// PostgreSQL connection and pool settings
struct DatabaseConfig {
    std::string dbname = "shortkey";
    std::string host = "localhost";
    std::string port = "5432";
    std::string user = "postgres";
    std::string password;
    int connect_timeout_s = 5;
    int statement_timeout_ms = 5000;
    size_t pool_size = 8;
    int checkout_timeout_ms = 5000;

    // Build libpq connection string
    std::string to_conninfo() const;

    // Parse from command line args (modifies index)
    // Returns false if unknown arg
    bool parse_arg(int argc, char** argv, int& i);
};

struct KeyspaceConfig {
    std::string charset = "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    int min_length = 4;
    int max_length = 12;
    double reserve_ratio = 0.001;      // share of each length held back from allocation
    double saturation_ratio = 0.85;    // usage ratio at which a length is retired early
    std::map<int, int64_t> capacity_overrides;
};

struct AllocatorConfig {
    int max_attempts_per_length = 100;
    int reserved_draw_budget = 100;
    int max_escalations = 3;
    int salt_bytes = 16;
};

struct RetryConfig {
    int max_attempts = 3;
    double initial_delay_s = 1.0;
    double multiplier = 2.0;
    double max_delay_s = 30.0;
};

struct ReservedConfig {
    int refresh_interval_s = 0;        // 0 = reload only on request
};

struct FingerprintConfig {
    std::string algorithm = "sha512";
    size_t hex_length = 128;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct UploadConfig {
    std::string custom_domain;         // e.g. https://i.example.net
};

struct Config {
    DatabaseConfig database;
    KeyspaceConfig keyspace;
    AllocatorConfig allocator;
    RetryConfig retry;
    ReservedConfig reserved;
    FingerprintConfig fingerprint;
    LoggingConfig logging;
    UploadConfig upload;

    // Throws InvalidArgumentError naming the first inconsistent value.
    void validate() const;
};

/**
 * Load configuration. Values come from defaults, then the YAML file (if the
 * path is non-empty), then SK_* environment variables.
 */
Config load_config(const std::string& config_file = "");

// Parse a YAML document held in memory (no environment overrides).
Config parse_config_yaml(const std::string& yaml_text);

// Apply SK_* environment overrides in place.
void apply_env_overrides(Config& config);

} // namespace shortkey
