#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/util.hpp"

#include <regex>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace lc::config {

namespace {

Config decodeRoot(const YAML::Node& root) {
    Config cfg;

    if (!root.IsMap()) throw std::invalid_argument("Configuration root must be a mapping");

    if (auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
    if (auto node = root["hint_rule"]) YAML::convert<HintRuleConfig>::decode(node, cfg.hint_rule);
    if (auto node = root["retry"]) YAML::convert<RetryConfig>::decode(node, cfg.retry);
    if (auto node = root["dispatcher"]) YAML::convert<DispatcherConfig>::decode(node, cfg.dispatcher);
    if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);
    if (auto node = root["mapping"]) YAML::convert<MappingConfig>::decode(node, cfg.mapping);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["history"]) YAML::convert<HistoryConfig>::decode(node, cfg.history);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.server.remote_user.empty()) cfg.server.remote_user = currentUserName();

    cfg.validate();
    return cfg;
}

// Resolves "..", "." and symlinks in the existing prefix, drops a trailing separator
std::filesystem::path normalizedDir(const std::filesystem::path& p) {
    std::error_code ec;
    auto n = std::filesystem::weakly_canonical(p, ec);
    if (ec) n = p.lexically_normal();
    if (!n.has_filename() && n.has_relative_path()) n = n.parent_path();
    return n;
}

bool sameDirectory(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    if (std::filesystem::equivalent(a, b, ec) && !ec) return true;
    return normalizedDir(a) == normalizedDir(b);
}

void validateBackoff(const BackoffConfig& b, const std::string& key) {
    if (b.max_attempts == 0) throw std::invalid_argument(key + ".max_attempts must be at least 1");
    if (b.multiplier < 1.0) throw std::invalid_argument(key + ".multiplier must be >= 1.0");
    if (b.max_backoff < b.initial_backoff) throw std::invalid_argument(key + ".max_backoff must be >= initial_backoff");
}

}

void Config::validate() const {
    if (server.hostname.empty()) throw std::invalid_argument("server.hostname is required");
    if (server.source_dir.empty()) throw std::invalid_argument("server.source_dir is required");
    if (server.destination_dir.empty()) throw std::invalid_argument("server.destination_dir is required");
    if (server.archive_dir.empty()) throw std::invalid_argument("server.archive_dir is required");
    if (sameDirectory(server.source_dir, server.archive_dir))
        throw std::invalid_argument("server.archive_dir must differ from server.source_dir");
    if (server.file_patterns.empty()) throw std::invalid_argument("server.file_patterns must not be empty");

    if (hint_rule.kind == HintRuleConfig::Kind::Regex) {
        if (hint_rule.pattern.empty()) throw std::invalid_argument("hint_rule.pattern is required for kind 'regex'");
        try {
            const std::regex re(hint_rule.pattern);
            if (hint_rule.group > re.mark_count())
                throw std::invalid_argument("hint_rule.group exceeds the number of capture groups in hint_rule.pattern");
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("hint_rule.pattern is not a valid regular expression: " + std::string(e.what()));
        }
    } else if (hint_rule.delimiter.empty()) {
        throw std::invalid_argument("hint_rule.delimiter must not be empty");
    }

    validateBackoff(retry.transfer, "retry.transfer");
    validateBackoff(retry.archive, "retry.archive");

    if (dispatcher.workers == 0) throw std::invalid_argument("dispatcher.workers must be at least 1");
    if (dispatcher.queue_capacity == 0) throw std::invalid_argument("dispatcher.queue_capacity must be at least 1");
    if (database.pool_size == 0) throw std::invalid_argument("database.pool_size must be at least 1");
}

Config loadConfig(const std::filesystem::path& path) {
    return decodeRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    return decodeRoot(YAML::Load(yaml));
}

} // namespace lc::config
