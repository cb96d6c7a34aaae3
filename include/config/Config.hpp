#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace lc::config {

// One watcher instance serves exactly one source/destination pair
struct ServerConfig {
    std::string hostname = "localhost";
    std::string remote_user;                    // empty: login name of the running uid
    std::filesystem::path source_dir;
    std::string destination_dir;                // remote base path
    std::filesystem::path archive_dir;
    std::string label;
    std::vector<std::string> file_patterns = {"*.pdf"};
    std::vector<std::string> mime_types;        // empty: no MIME check
    bool touch_existing = true;
    bool mkdir_remote = true;
    std::chrono::milliseconds connect_timeout = std::chrono::seconds(5);
    uint16_t ssh_port = 22;
    std::string identity_file;
};

struct HintRuleConfig {
    enum class Kind { Positional, Regex };

    Kind kind = Kind::Positional;

    // positional
    std::string delimiter = "-";
    unsigned int field = 1;
    unsigned int length = 2;                    // 0 keeps the whole field
    bool digits_only = true;

    // regex
    std::string pattern;
    unsigned int group = 1;
};

struct BackoffConfig {
    unsigned int max_attempts = 5;
    std::chrono::milliseconds initial_backoff = std::chrono::seconds(2);
    std::chrono::milliseconds max_backoff = std::chrono::seconds(60);
    double multiplier = 2.0;
    std::chrono::milliseconds max_elapsed = std::chrono::minutes(10);
};

struct RetryConfig {
    BackoffConfig transfer;
    BackoffConfig archive{3, std::chrono::milliseconds(500), std::chrono::seconds(5), 2.0, std::chrono::seconds(30)};
    unsigned int max_collisions = 100;
};

struct DispatcherConfig {
    unsigned int workers = 4;
    size_t queue_capacity = 256;
};

struct TransferConfig {
    std::chrono::milliseconds command_timeout = std::chrono::minutes(5);
};

struct MappingEntry {
    std::string base_path;
    std::string hint;
    std::string label;
    std::string folder;
};

struct MappingConfig {
    enum class Source { Static, Postgres };

    Source source = Source::Static;
    std::vector<MappingEntry> entries;
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "labcourier";
    std::string user = "labcourier";
    std::filesystem::path password_file;
    unsigned int pool_size = 2;
};

struct HistoryConfig {
    enum class Sink { Audit, Postgres, None };

    Sink sink = Sink::Audit;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum courier  = spdlog::level::info;   // startup/shutdown
    spdlog::level::level_enum watcher  = spdlog::level::info;
    spdlog::level::level_enum dispatch = spdlog::level::info;   // one line per delivered or failed file
    spdlog::level::level_enum transfer = spdlog::level::warn;   // retries and ssh failures
    spdlog::level::level_enum archive  = spdlog::level::warn;
    spdlog::level::level_enum mapping  = spdlog::level::warn;
    spdlog::level::level_enum db       = spdlog::level::err;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/labcourier";
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    ServerConfig server;
    HintRuleConfig hint_rule;
    RetryConfig retry;
    DispatcherConfig dispatcher;
    TransferConfig transfer;
    MappingConfig mapping;
    DatabaseConfig database;
    HistoryConfig history;
    LoggingConfig logging;

    // Throws std::invalid_argument naming the first offending key
    void validate() const;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

} // namespace lc::config
