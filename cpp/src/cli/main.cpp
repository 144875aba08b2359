// =============================================================================
// shortkey CLI - Short-identifier allocation service
// =============================================================================
//
// Usage:
//   shortkey [global options] <command> [arguments]
//
// Commands:
//   init          Create or upgrade the database schema
//   allocate      Allocate (or look up) the identifier for a fingerprint
//   lookup        Show the record for a fingerprint
//   resolve       Show the record behind an identifier (counts as an access)
//   update-upload Record storage key and URL after the upload finished
//   delete        Mark a record deleted
//   archive       Mark a record archived
//   reserve       Add a reserved identifier
//   migrate       Assign identifiers to records that lack one
//   stats         Show keyspace and record statistics
//   version       Show version information
//
// Examples:
//   shortkey -c shortkey.yaml init
//   shortkey allocate 3a7bd3e2... photo.jpg 48213 image/jpeg
//   shortkey -v stats
//
// =============================================================================

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "shortkey/allocation_service.hpp"
#include "shortkey/config.hpp"
#include "shortkey/db/pg_backend.hpp"
#include "shortkey/db/schema.hpp"
#include "shortkey/error.hpp"
#include "shortkey/fingerprint.hpp"
#include "shortkey/logging.hpp"
#include "shortkey/migration.hpp"
#include "shortkey/statistics.hpp"

#define SHORTKEY_VERSION_STRING "1.0.0"

namespace shortkey::cli {
    int cmd_init(int argc, char* argv[]);
    int cmd_allocate(int argc, char* argv[]);
    int cmd_lookup(int argc, char* argv[]);
    int cmd_resolve(int argc, char* argv[]);
    int cmd_update_upload(int argc, char* argv[]);
    int cmd_delete(int argc, char* argv[]);
    int cmd_archive(int argc, char* argv[]);
    int cmd_reserve(int argc, char* argv[]);
    int cmd_migrate(int argc, char* argv[]);
    int cmd_stats(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* usage;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"init",          "",                                    "Create or upgrade the database schema", shortkey::cli::cmd_init},
    {"allocate",      "<fingerprint> [filename] [size] [media-type]", "Allocate an identifier for a fingerprint", shortkey::cli::cmd_allocate},
    {"lookup",        "<fingerprint>",                       "Show the record for a fingerprint", shortkey::cli::cmd_lookup},
    {"resolve",       "<identifier>",                        "Show the record behind an identifier", shortkey::cli::cmd_resolve},
    {"update-upload", "<fingerprint> <storage-key> <url>",   "Record upload location", shortkey::cli::cmd_update_upload},
    {"delete",        "<fingerprint> [reason]",              "Mark a record deleted", shortkey::cli::cmd_delete},
    {"archive",       "<fingerprint> [reason]",              "Mark a record archived", shortkey::cli::cmd_archive},
    {"reserve",       "<value> <reason>",                    "Add a reserved identifier", shortkey::cli::cmd_reserve},
    {"migrate",       "[batch-size]",                        "Assign identifiers to records lacking one", shortkey::cli::cmd_migrate},
    {"stats",         "[--json]",                            "Show keyspace and record statistics", shortkey::cli::cmd_stats},
    {"version",       "",                                    "Show version information", shortkey::cli::cmd_version},
    {"help",          "",                                    "Show this help message", shortkey::cli::cmd_help},
    {nullptr, nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    std::vector<std::string> db_args;   // replayed over the loaded config
    bool verbose = false;
};

static GlobalOptions g_options;

namespace {

using namespace shortkey;

Config load_effective_config() {
    Config config = load_config(g_options.config_file);

    std::vector<char*> args;
    args.push_back(const_cast<char*>("shortkey"));
    for (auto& a : g_options.db_args) args.push_back(a.data());
    int argc = static_cast<int>(args.size());
    for (int i = 1; i < argc; ++i) {
        config.database.parse_arg(argc, args.data(), i);
    }

    LogLevel level = g_options.verbose ? LogLevel::DEBUG : parse_log_level(config.logging.level);
    Logger::getInstance().configure(level, config.logging.file);
    return config;
}

// Connection-backed service for one CLI invocation.
struct Session {
    Config config;
    std::unique_ptr<db::PgBackend> backend;
    std::unique_ptr<AllocationService> service;

    Session() : config(load_effective_config()) {
        backend = std::make_unique<db::PgBackend>(config.database);
        service = std::make_unique<AllocationService>(*backend, config);
    }
};

std::string format_time(const Timestamp& ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%SZ");
    return out.str();
}

void print_record(const AllocationRecord& rec) {
    auto row = [](const char* key, const std::string& value) {
        std::cout << "  " << std::left << std::setw(20) << key << value << "\n";
    };
    row("id", std::to_string(rec.id));
    row("fingerprint", rec.fingerprint);
    row("content_uuid", rec.content_uuid);
    row("identifier", rec.identifier ? *rec.identifier : "(none)");
    if (rec.has_identifier()) {
        row("identifier_length", std::to_string(rec.identifier_length));
        row("generation_salt", rec.generation_salt);
    }
    row("status", record_status_name(rec.status));
    if (!rec.original_filename.empty()) row("original_filename", rec.original_filename);
    if (!rec.extension.empty()) row("extension", rec.extension);
    row("size_bytes", std::to_string(rec.size_bytes));
    row("media_type", rec.media_type);
    if (!rec.storage_key.empty()) row("storage_key", rec.storage_key);
    if (!rec.url.empty()) row("url", rec.url);
    row("access_count", std::to_string(rec.access_count));
    if (rec.last_accessed_at) row("last_accessed_at", format_time(*rec.last_accessed_at));
    row("created_at", format_time(rec.created_at));
    if (rec.identifier_assigned_at) row("identifier_assigned_at", format_time(*rec.identifier_assigned_at));
    if (rec.metadata) row("metadata", rec.metadata->to_json());
}

int usage_error(const char* name) {
    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (std::strcmp(cmd->name, name) == 0) {
            std::cerr << "Usage: shortkey " << cmd->name << " " << cmd->usage << "\n";
            break;
        }
    }
    return 1;
}

std::string extension_of(const std::string& filename) {
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return {};
    return filename.substr(dot);
}

int change_status(int argc, char* argv[], RecordStatus status, const char* name) {
    if (argc < 1) return usage_error(name);
    Session session;
    const std::string reason = argc >= 2 ? argv[1] : "";
    if (!session.service->store().set_status(argv[0], status, reason)) {
        std::cerr << "No active record for " << abbreviate(argv[0]) << "\n";
        return 1;
    }
    std::cout << "Record is now " << record_status_name(status) << "\n";
    return 0;
}

} // namespace

// =============================================================================
// Commands
// =============================================================================

namespace shortkey::cli {

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "shortkey - content-addressed short identifier allocation\n";
    std::cout << "Version " << SHORTKEY_VERSION_STRING << "\n\n";
    std::cout << "Usage: shortkey [global options] <command> [arguments]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = std::strlen(cmd->name); i < 15; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     YAML configuration file\n";
    std::cout << "  -d, --dbname <name>     Database name (default: shortkey)\n";
    std::cout << "  -h, --host <host>       Database host (default: localhost)\n";
    std::cout << "  -p, --port <port>       Database port (default: 5432)\n";
    std::cout << "  -U, --user <user>       Database user (default: postgres)\n";
    std::cout << "  -W, --password <pass>   Database password\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "\nEnvironment: SK_DB_NAME, SK_DB_HOST, SK_DB_PORT, SK_DB_USER, SK_DB_PASS,\n";
    std::cout << "             SK_MIN_LENGTH, SK_MAX_LENGTH, SK_LOG_LEVEL, SK_LOG_FILE, SK_CUSTOM_DOMAIN\n";
    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "shortkey " << SHORTKEY_VERSION_STRING << "\n";
    std::cout << "Schema version: " << db::SCHEMA_VERSION << "\n";
    std::cout << "libpq version: " << PQlibVersion() << "\n";
    return 0;
}

int cmd_init([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    Config config = load_effective_config();
    db::PgBackend backend(config.database);
    {
        auto conn = backend.pool().acquire();
        db::initialize_schema(conn, config);
    }
    std::cout << "Schema initialized (version " << db::SCHEMA_VERSION << ")\n";
    return 0;
}

int cmd_allocate(int argc, char* argv[]) {
    if (argc < 1) return usage_error("allocate");

    AllocationRequest request;
    request.fingerprint = argv[0];
    if (argc >= 2) {
        request.original_filename = argv[1];
        request.extension = extension_of(request.original_filename);
    }
    if (argc >= 3) {
        try {
            request.size_bytes = std::stoll(argv[2]);
        } catch (const std::exception&) {
            std::cerr << "Invalid size: " << argv[2] << "\n";
            return 1;
        }
    }
    if (argc >= 4) request.media_type = argv[3];

    Session session;
    request.hash_algorithm = session.config.fingerprint.algorithm;
    Allocation result = session.service->allocate(request);

    std::cout << "outcome:     " << allocation_outcome_name(result.outcome) << "\n";
    std::cout << "identifier:  " << result.identifier() << "\n";
    std::cout << "length:      " << result.length() << "\n";
    std::cout << "salt:        " << result.salt() << "\n";
    std::cout << "storage_key: " << session.service->storage_key_for(result.record) << "\n";
    if (!session.config.upload.custom_domain.empty()) {
        std::cout << "url:         " << session.service->public_url_for(result.record) << "\n";
    }
    return 0;
}

int cmd_lookup(int argc, char* argv[]) {
    if (argc < 1) return usage_error("lookup");
    Session session;
    auto rec = session.service->lookup(argv[0]);
    if (!rec) {
        std::cerr << "Not found: " << abbreviate(argv[0]) << "\n";
        return 1;
    }
    print_record(*rec);
    return 0;
}

int cmd_resolve(int argc, char* argv[]) {
    if (argc < 1) return usage_error("resolve");
    Session session;
    auto rec = session.service->resolve(argv[0]);
    if (!rec) {
        std::cerr << "Not found: " << argv[0] << "\n";
        return 1;
    }
    print_record(*rec);
    return 0;
}

int cmd_update_upload(int argc, char* argv[]) {
    if (argc < 3) return usage_error("update-upload");
    Session session;
    if (!session.service->record_upload(argv[0], argv[1], argv[2])) {
        std::cerr << "No active record for " << abbreviate(argv[0]) << "\n";
        return 1;
    }
    std::cout << "Upload recorded\n";
    return 0;
}

int cmd_delete(int argc, char* argv[]) {
    return change_status(argc, argv, RecordStatus::Deleted, "delete");
}

int cmd_archive(int argc, char* argv[]) {
    return change_status(argc, argv, RecordStatus::Archived, "archive");
}

int cmd_reserve(int argc, char* argv[]) {
    if (argc < 2) return usage_error("reserve");
    Session session;
    if (session.service->reserved().add_reserved(argv[0], argv[1])) {
        std::cout << "Reserved '" << ReservedWordFilter::fold(argv[0]) << "'\n";
    } else {
        std::cout << "'" << ReservedWordFilter::fold(argv[0]) << "' was already reserved\n";
    }
    return 0;
}

int cmd_migrate(int argc, char* argv[]) {
    size_t batch = 500;
    if (argc >= 1) {
        try {
            batch = static_cast<size_t>(std::stoul(argv[0]));
        } catch (const std::exception&) {
            std::cerr << "Invalid batch size: " << argv[0] << "\n";
            return 1;
        }
    }

    Session session;
    Migration migration(*session.backend, session.service->allocator());
    MigrationReport report = migration.assign_missing_identifiers(batch);

    std::cout << "scanned:  " << report.scanned << "\n";
    std::cout << "assigned: " << report.assigned << "\n";
    std::cout << "skipped:  " << report.skipped << "\n";
    std::cout << "failed:   " << report.failed << "\n";
    return report.failed == 0 ? 0 : 1;
}

int cmd_stats(int argc, char* argv[]) {
    const bool as_json = argc >= 1 && std::strcmp(argv[0], "--json") == 0;

    Session session;
    Statistics stats = collect_statistics(*session.backend, session.service->reserved(),
                                          session.config.keyspace);
    if (as_json) {
        std::cout << stats.to_json() << "\n";
        return 0;
    }

    std::cout << "=== Keyspace ===\n";
    std::cout << "Charset size:    " << stats.charset_size << "\n";
    std::cout << "Current length:  " << (stats.current_length ? std::to_string(*stats.current_length) : "-") << "\n";
    std::cout << "Reserved words:  " << stats.reserved_count << "\n\n";
    std::cout << "  length      consumed          capacity    usage  exhausted\n";
    for (const auto& l : stats.lengths) {
        std::cout << "  " << std::setw(6) << l.length
                  << std::setw(14) << l.consumed
                  << std::setw(18) << l.capacity
                  << std::setw(8) << std::fixed << std::setprecision(2) << l.usage_percent << "%"
                  << "  " << (l.exhausted ? "yes" : "no") << "\n";
    }
    std::cout << "\n=== Records ===\n";
    std::cout << "Total:           " << stats.records_total << "\n";
    std::cout << "Active:          " << stats.records_active << "\n";
    std::cout << "With identifier: " << stats.identifiers_assigned << "\n";
    return 0;
}

}  // namespace shortkey::cli

// =============================================================================
// Main Entry Point
// =============================================================================

static void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if ((arg == "-d" || arg == "--dbname" || arg == "-h" || arg == "--host" ||
                    arg == "-p" || arg == "--port" || arg == "-U" || arg == "--user" ||
                    arg == "-W" || arg == "--password") && i + 1 < argc) {
            g_options.db_args.push_back(arg);
            g_options.db_args.push_back(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    // Shift argv to point to command
    argc -= i;
    argv += i;
}

static int exit_code_for(shortkey::ErrorCode code) {
    switch (code) {
        case shortkey::ErrorCode::INVALID_ARGUMENT:
        case shortkey::ErrorCode::CONFIG_INVALID:
            return 2;
        case shortkey::ErrorCode::KEYSPACE_EXHAUSTED:
            return 3;
        case shortkey::ErrorCode::TRANSIENT_STORAGE:
        case shortkey::ErrorCode::CONNECTION_FAILED:
            return 4;
        default:
            return 1;
    }
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        shortkey::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (std::strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const shortkey::ShortkeyException& e) {
                std::cerr << e.what() << "\n";
                return exit_code_for(e.code());
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'shortkey help' for usage.\n";
    return 1;
}
