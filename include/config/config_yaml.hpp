#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace lc::config;

namespace detail_lc {

inline std::chrono::milliseconds durationOr(const Node& node, const std::string& fallback) {
    return parseDuration(node ? node.as<std::string>() : fallback);
}

inline spdlog::level::level_enum levelOr(const Node& node, const std::string& fallback) {
    return spdlog::level::from_str(node ? node.as<std::string>() : fallback);
}

inline std::vector<std::string> listOr(const Node& node, const std::vector<std::string>& fallback) {
    return node ? node.as<std::vector<std::string>>() : fallback;
}

}

template<>
struct convert<ServerConfig> {
    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.hostname = node["hostname"].as<std::string>("localhost");
        rhs.remote_user = node["remote_user"].as<std::string>("");
        rhs.source_dir = node["source_dir"].as<std::string>("");
        rhs.destination_dir = node["destination_dir"].as<std::string>("");
        rhs.archive_dir = node["archive_dir"].as<std::string>("");
        rhs.label = node["label"].as<std::string>("");
        rhs.file_patterns = detail_lc::listOr(node["file_patterns"], {"*.pdf"});
        rhs.mime_types = detail_lc::listOr(node["mime_types"], {});
        rhs.touch_existing = node["touch_existing"].as<bool>(true);
        rhs.mkdir_remote = node["mkdir_remote"].as<bool>(true);
        rhs.connect_timeout = detail_lc::durationOr(node["connect_timeout"], "5s");
        rhs.ssh_port = node["ssh_port"].as<uint16_t>(22);
        rhs.identity_file = node["identity_file"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<HintRuleConfig> {
    static bool decode(const Node& node, HintRuleConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto kind = node["kind"].as<std::string>("positional");
        if (kind == "positional") rhs.kind = HintRuleConfig::Kind::Positional;
        else if (kind == "regex") rhs.kind = HintRuleConfig::Kind::Regex;
        else throw std::invalid_argument("hint_rule.kind must be 'positional' or 'regex', got: " + kind);
        rhs.delimiter = node["delimiter"].as<std::string>("-");
        rhs.field = node["field"].as<unsigned int>(1);
        rhs.length = node["length"].as<unsigned int>(2);
        rhs.digits_only = node["digits_only"].as<bool>(true);
        rhs.pattern = node["pattern"].as<std::string>("");
        rhs.group = node["group"].as<unsigned int>(1);
        return true;
    }
};

template<>
struct convert<BackoffConfig> {
    static bool decode(const Node& node, BackoffConfig& rhs) {
        if (!node.IsMap()) return false;
        const BackoffConfig def = rhs;
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(def.max_attempts);
        if (node["initial_backoff"]) rhs.initial_backoff = parseDuration(node["initial_backoff"].as<std::string>());
        if (node["max_backoff"]) rhs.max_backoff = parseDuration(node["max_backoff"].as<std::string>());
        rhs.multiplier = node["multiplier"].as<double>(def.multiplier);
        if (node["max_elapsed"]) rhs.max_elapsed = parseDuration(node["max_elapsed"].as<std::string>());
        return true;
    }
};

template<>
struct convert<RetryConfig> {
    static bool decode(const Node& node, RetryConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto n = node["transfer"]) convert<BackoffConfig>::decode(n, rhs.transfer);
        if (const auto n = node["archive"]) convert<BackoffConfig>::decode(n, rhs.archive);
        rhs.max_collisions = node["max_collisions"].as<unsigned int>(100);
        return true;
    }
};

template<>
struct convert<DispatcherConfig> {
    static bool decode(const Node& node, DispatcherConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.workers = node["workers"].as<unsigned int>(4);
        rhs.queue_capacity = node["queue_capacity"].as<size_t>(256);
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.command_timeout = detail_lc::durationOr(node["command_timeout"], "5m");
        return true;
    }
};

template<>
struct convert<MappingEntry> {
    static bool decode(const Node& node, MappingEntry& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_path = node["base_path"].as<std::string>();
        rhs.hint = node["hint"].as<std::string>();
        rhs.label = node["label"].as<std::string>("");
        rhs.folder = node["folder"].as<std::string>();
        return true;
    }
};

template<>
struct convert<MappingConfig> {
    static bool decode(const Node& node, MappingConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto source = node["source"].as<std::string>("static");
        if (source == "static") rhs.source = MappingConfig::Source::Static;
        else if (source == "postgres") rhs.source = MappingConfig::Source::Postgres;
        else throw std::invalid_argument("mapping.source must be 'static' or 'postgres', got: " + source);
        if (const auto entries = node["entries"]) rhs.entries = entries.as<std::vector<MappingEntry>>();
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("labcourier");
        rhs.user = node["user"].as<std::string>("labcourier");
        rhs.password_file = node["password_file"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(2);
        return true;
    }
};

template<>
struct convert<HistoryConfig> {
    static bool decode(const Node& node, HistoryConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto sink = node["sink"].as<std::string>("audit");
        if (sink == "audit") rhs.sink = HistoryConfig::Sink::Audit;
        else if (sink == "postgres") rhs.sink = HistoryConfig::Sink::Postgres;
        else if (sink == "none") rhs.sink = HistoryConfig::Sink::None;
        else throw std::invalid_argument("history.sink must be 'audit', 'postgres' or 'none', got: " + sink);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.courier  = detail_lc::levelOr(node["courier"], "info");
        rhs.watcher  = detail_lc::levelOr(node["watcher"], "info");
        rhs.dispatch = detail_lc::levelOr(node["dispatch"], "info");
        rhs.transfer = detail_lc::levelOr(node["transfer"], "warning");
        rhs.archive  = detail_lc::levelOr(node["archive"], "warning");
        rhs.mapping  = detail_lc::levelOr(node["mapping"], "warning");
        rhs.db       = detail_lc::levelOr(node["db"], "error");
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/labcourier");
        rhs.console_log_level = detail_lc::levelOr(node["console_log_level"], "info");
        rhs.file_log_level = detail_lc::levelOr(node["file_log_level"], "info");
        if (const auto n = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(n, rhs.subsystem_levels);
        return true;
    }
};

}
