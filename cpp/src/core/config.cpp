#include "shortkey/config.hpp"
#include "shortkey/error.hpp"
#include "shortkey/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <unordered_set>

namespace shortkey {

std::string DatabaseConfig::to_conninfo() const {
    std::string conninfo = "dbname=" + dbname;
    if (!host.empty()) conninfo += " host=" + host;
    if (!port.empty()) conninfo += " port=" + port;
    if (!user.empty()) conninfo += " user=" + user;
    if (!password.empty()) conninfo += " password=" + password;
    conninfo += " connect_timeout=" + std::to_string(connect_timeout_s);
    if (statement_timeout_ms > 0) {
        conninfo += " options='-c statement_timeout=" + std::to_string(statement_timeout_ms) + "'";
    }
    return conninfo;
}

bool DatabaseConfig::parse_arg(int argc, char** argv, int& i) {
    std::string arg = argv[i];
    if ((arg == "-d" || arg == "--dbname") && i + 1 < argc) {
        dbname = argv[++i];
        return true;
    }
    if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
        host = argv[++i];
        return true;
    }
    if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
        port = argv[++i];
        return true;
    }
    if ((arg == "-U" || arg == "--user") && i + 1 < argc) {
        user = argv[++i];
        return true;
    }
    if ((arg == "-W" || arg == "--password") && i + 1 < argc) {
        password = argv[++i];
        return true;
    }
    return false;
}

void Config::validate() const {
    const auto& ks = keyspace;
    SHORTKEY_CHECK_ARGUMENT(ks.charset.size() >= 2, "keyspace.charset needs at least two symbols");
    std::unordered_set<char> seen(ks.charset.begin(), ks.charset.end());
    SHORTKEY_CHECK_ARGUMENT(seen.size() == ks.charset.size(), "keyspace.charset has duplicate symbols");
    SHORTKEY_CHECK_ARGUMENT(ks.charset.size() <= 256, "keyspace.charset is too large");
    SHORTKEY_CHECK_ARGUMENT(ks.min_length >= 1, "keyspace.min_length must be >= 1");
    SHORTKEY_CHECK_ARGUMENT(ks.max_length >= ks.min_length, "keyspace.max_length must be >= min_length");
    SHORTKEY_CHECK_ARGUMENT(ks.reserve_ratio >= 0.0 && ks.reserve_ratio < 1.0,
                            "keyspace.reserve_ratio must be in [0, 1)");
    SHORTKEY_CHECK_ARGUMENT(ks.saturation_ratio > 0.0 && ks.saturation_ratio <= 1.0,
                            "keyspace.saturation_ratio must be in (0, 1]");
    for (const auto& [length, capacity] : ks.capacity_overrides) {
        SHORTKEY_CHECK_ARGUMENT(length >= 1 && capacity >= 1,
                                "keyspace.capacity_overrides entries must be positive");
    }

    SHORTKEY_CHECK_ARGUMENT(allocator.max_attempts_per_length >= 1, "allocator.max_attempts_per_length must be >= 1");
    SHORTKEY_CHECK_ARGUMENT(allocator.reserved_draw_budget >= 1, "allocator.reserved_draw_budget must be >= 1");
    SHORTKEY_CHECK_ARGUMENT(allocator.max_escalations >= 0, "allocator.max_escalations must be >= 0");
    SHORTKEY_CHECK_ARGUMENT(allocator.salt_bytes >= 1 && allocator.salt_bytes <= 64,
                            "allocator.salt_bytes must be in [1, 64]");

    SHORTKEY_CHECK_ARGUMENT(retry.max_attempts >= 1, "retry.max_attempts must be >= 1");
    SHORTKEY_CHECK_ARGUMENT(retry.initial_delay_s >= 0.0, "retry.initial_delay must be >= 0");
    SHORTKEY_CHECK_ARGUMENT(retry.multiplier >= 1.0, "retry.multiplier must be >= 1");
    SHORTKEY_CHECK_ARGUMENT(retry.max_delay_s >= retry.initial_delay_s, "retry.max_delay must be >= initial_delay");

    SHORTKEY_CHECK_ARGUMENT(reserved.refresh_interval_s >= 0, "reserved.refresh_interval must be >= 0");
    SHORTKEY_CHECK_ARGUMENT(fingerprint.hex_length >= 32 && fingerprint.hex_length % 2 == 0,
                            "fingerprint.hex_length must be an even number >= 32");

    SHORTKEY_CHECK_ARGUMENT(database.pool_size >= 1, "database.pool_size must be >= 1");
    SHORTKEY_CHECK_ARGUMENT(database.checkout_timeout_ms >= 0, "database.checkout_timeout_ms must be >= 0");
}

namespace {

void load_yaml(const YAML::Node& yaml, Config& config) {
    if (const auto& db = yaml["database"]) {
        auto& c = config.database;
        if (db["dbname"]) c.dbname = db["dbname"].as<std::string>();
        if (db["host"]) c.host = db["host"].as<std::string>();
        if (db["port"]) c.port = db["port"].as<std::string>();
        if (db["user"]) c.user = db["user"].as<std::string>();
        if (db["password"]) c.password = db["password"].as<std::string>();
        if (db["connect_timeout"]) c.connect_timeout_s = db["connect_timeout"].as<int>();
        if (db["statement_timeout_ms"]) c.statement_timeout_ms = db["statement_timeout_ms"].as<int>();
        if (db["pool_size"]) c.pool_size = db["pool_size"].as<size_t>();
        if (db["checkout_timeout_ms"]) c.checkout_timeout_ms = db["checkout_timeout_ms"].as<int>();
    }

    if (const auto& ks = yaml["keyspace"]) {
        auto& c = config.keyspace;
        if (ks["charset"]) c.charset = ks["charset"].as<std::string>();
        if (ks["min_length"]) c.min_length = ks["min_length"].as<int>();
        if (ks["max_length"]) c.max_length = ks["max_length"].as<int>();
        if (ks["reserve_ratio"]) c.reserve_ratio = ks["reserve_ratio"].as<double>();
        if (ks["saturation_ratio"]) c.saturation_ratio = ks["saturation_ratio"].as<double>();
        if (const auto& overrides = ks["capacity_overrides"]) {
            for (const auto& entry : overrides) {
                c.capacity_overrides[entry.first.as<int>()] = entry.second.as<int64_t>();
            }
        }
    }

    if (const auto& al = yaml["allocator"]) {
        auto& c = config.allocator;
        if (al["max_attempts_per_length"]) c.max_attempts_per_length = al["max_attempts_per_length"].as<int>();
        if (al["reserved_draw_budget"]) c.reserved_draw_budget = al["reserved_draw_budget"].as<int>();
        if (al["max_escalations"]) c.max_escalations = al["max_escalations"].as<int>();
        if (al["salt_bytes"]) c.salt_bytes = al["salt_bytes"].as<int>();
    }

    if (const auto& rt = yaml["retry"]) {
        auto& c = config.retry;
        if (rt["max_attempts"]) c.max_attempts = rt["max_attempts"].as<int>();
        if (rt["initial_delay"]) c.initial_delay_s = rt["initial_delay"].as<double>();
        if (rt["multiplier"]) c.multiplier = rt["multiplier"].as<double>();
        if (rt["max_delay"]) c.max_delay_s = rt["max_delay"].as<double>();
    }

    if (const auto& rs = yaml["reserved"]) {
        if (rs["refresh_interval"]) config.reserved.refresh_interval_s = rs["refresh_interval"].as<int>();
    }

    if (const auto& fp = yaml["fingerprint"]) {
        if (fp["algorithm"]) config.fingerprint.algorithm = fp["algorithm"].as<std::string>();
        if (fp["hex_length"]) config.fingerprint.hex_length = fp["hex_length"].as<size_t>();
    }

    if (const auto& lg = yaml["logging"]) {
        if (lg["level"]) config.logging.level = lg["level"].as<std::string>();
        if (lg["file"]) config.logging.file = lg["file"].as<std::string>();
    }

    if (const auto& up = yaml["upload"]) {
        if (up["custom_domain"]) config.upload.custom_domain = up["custom_domain"].as<std::string>();
    }
}

template<typename Setter>
void set_if_env(const char* name, Setter&& setter) {
    const char* value = std::getenv(name);
    if (value && *value) {
        setter(std::string(value));
    }
}

int env_int(const char* name, const std::string& value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw InvalidArgumentError(std::string(name) + " is not an integer: " + value);
    }
}

} // namespace

void apply_env_overrides(Config& config) {
    set_if_env("SK_DB_NAME", [&](const std::string& v) { config.database.dbname = v; });
    set_if_env("SK_DB_HOST", [&](const std::string& v) { config.database.host = v; });
    set_if_env("SK_DB_PORT", [&](const std::string& v) { config.database.port = v; });
    set_if_env("SK_DB_USER", [&](const std::string& v) { config.database.user = v; });
    set_if_env("SK_DB_PASS", [&](const std::string& v) { config.database.password = v; });
    set_if_env("SK_DB_POOL_SIZE", [&](const std::string& v) {
        config.database.pool_size = static_cast<size_t>(env_int("SK_DB_POOL_SIZE", v));
    });
    set_if_env("SK_MIN_LENGTH", [&](const std::string& v) {
        config.keyspace.min_length = env_int("SK_MIN_LENGTH", v);
    });
    set_if_env("SK_MAX_LENGTH", [&](const std::string& v) {
        config.keyspace.max_length = env_int("SK_MAX_LENGTH", v);
    });
    set_if_env("SK_LOG_LEVEL", [&](const std::string& v) { config.logging.level = v; });
    set_if_env("SK_LOG_FILE", [&](const std::string& v) { config.logging.file = v; });
    set_if_env("SK_CUSTOM_DOMAIN", [&](const std::string& v) { config.upload.custom_domain = v; });
}

Config parse_config_yaml(const std::string& yaml_text) {
    Config config;
    try {
        load_yaml(YAML::Load(yaml_text), config);
    } catch (const YAML::Exception& e) {
        throw InvalidArgumentError(std::string("invalid configuration: ") + e.what());
    }
    return config;
}

Config load_config(const std::string& config_file) {
    Config config;

    if (!config_file.empty()) {
        if (!std::filesystem::exists(config_file)) {
            throw InvalidArgumentError("config file not found: " + config_file);
        }
        try {
            load_yaml(YAML::LoadFile(config_file), config);
        } catch (const YAML::Exception& e) {
            throw InvalidArgumentError(std::string("invalid configuration: ") + e.what(), config_file);
        }
        LOG_INFO("Loaded configuration from file: ", config_file);
    }

    apply_env_overrides(config);
    config.validate();
    return config;
}

} // namespace shortkey
