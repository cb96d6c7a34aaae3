#include <gtest/gtest.h>

#include "config/Config.hpp"
#include "config/util.hpp"
#include "fakes.hpp"

#include <fmt/format.h>

using namespace lc::config;
using namespace std::chrono_literals;

namespace {

const std::string MINIMAL = R"(
server:
  hostname: results.lab.local
  remote_user: courier
  source_dir: /srv/lab/outbox
  destination_dir: /data/results
  archive_dir: /srv/lab/archive
  label: chem
)";

}

TEST(ConfigTest, MinimalConfigFillsDefaults) {
    const auto cfg = loadConfigFromString(MINIMAL);

    EXPECT_EQ(cfg.server.hostname, "results.lab.local");
    EXPECT_EQ(cfg.server.remote_user, "courier");
    EXPECT_EQ(cfg.server.source_dir, "/srv/lab/outbox");
    EXPECT_EQ(cfg.server.file_patterns, std::vector<std::string>{"*.pdf"});
    EXPECT_TRUE(cfg.server.mime_types.empty());
    EXPECT_TRUE(cfg.server.touch_existing);
    EXPECT_TRUE(cfg.server.mkdir_remote);
    EXPECT_EQ(cfg.server.connect_timeout, 5s);
    EXPECT_EQ(cfg.server.ssh_port, 22);

    EXPECT_EQ(cfg.hint_rule.kind, HintRuleConfig::Kind::Positional);
    EXPECT_EQ(cfg.hint_rule.delimiter, "-");
    EXPECT_EQ(cfg.hint_rule.field, 1u);
    EXPECT_EQ(cfg.hint_rule.length, 2u);

    EXPECT_EQ(cfg.retry.transfer.max_attempts, 5u);
    EXPECT_EQ(cfg.retry.transfer.initial_backoff, 2s);
    EXPECT_EQ(cfg.retry.archive.max_attempts, 3u);
    EXPECT_EQ(cfg.retry.max_collisions, 100u);

    EXPECT_EQ(cfg.dispatcher.workers, 4u);
    EXPECT_EQ(cfg.dispatcher.queue_capacity, 256u);
    EXPECT_EQ(cfg.transfer.command_timeout, 5min);
    EXPECT_EQ(cfg.mapping.source, MappingConfig::Source::Static);
    EXPECT_EQ(cfg.history.sink, HistoryConfig::Sink::Audit);
    EXPECT_EQ(cfg.logging.subsystem_levels.transfer, spdlog::level::warn);
}

TEST(ConfigTest, ParsesEverySection) {
    const auto cfg = loadConfigFromString(MINIMAL + R"(
hint_rule:
  kind: regex
  pattern: '^\d+-(\d{2})'
  group: 1
retry:
  transfer:
    max_attempts: 7
    initial_backoff: 250ms
    max_backoff: 10s
    multiplier: 1.5
    max_elapsed: 2m
  archive:
    max_attempts: 2
  max_collisions: 9
dispatcher:
  workers: 8
  queue_capacity: 32
transfer:
  command_timeout: 90s
mapping:
  source: static
  entries:
    - { base_path: /data/results, hint: "12", label: chem, folder: ward-12 }
    - { base_path: /data/results, hint: "34", folder: icu }
history:
  sink: none
logging:
  log_dir: /tmp/labcourier
  subsystem_levels:
    dispatch: debug
)");

    EXPECT_EQ(cfg.hint_rule.kind, HintRuleConfig::Kind::Regex);
    EXPECT_EQ(cfg.hint_rule.pattern, R"(^\d+-(\d{2}))");

    EXPECT_EQ(cfg.retry.transfer.max_attempts, 7u);
    EXPECT_EQ(cfg.retry.transfer.initial_backoff, 250ms);
    EXPECT_EQ(cfg.retry.transfer.max_backoff, 10s);
    EXPECT_DOUBLE_EQ(cfg.retry.transfer.multiplier, 1.5);
    EXPECT_EQ(cfg.retry.transfer.max_elapsed, 2min);
    EXPECT_EQ(cfg.retry.archive.max_attempts, 2u);
    EXPECT_EQ(cfg.retry.archive.initial_backoff, 500ms);
    EXPECT_EQ(cfg.retry.max_collisions, 9u);

    EXPECT_EQ(cfg.dispatcher.workers, 8u);
    EXPECT_EQ(cfg.transfer.command_timeout, 90s);

    ASSERT_EQ(cfg.mapping.entries.size(), 2u);
    EXPECT_EQ(cfg.mapping.entries[0].folder, "ward-12");
    EXPECT_EQ(cfg.mapping.entries[1].label, "");

    EXPECT_EQ(cfg.history.sink, HistoryConfig::Sink::None);
    EXPECT_EQ(cfg.logging.log_dir, "/tmp/labcourier");
    EXPECT_EQ(cfg.logging.subsystem_levels.dispatch, spdlog::level::debug);
}

TEST(ConfigTest, MissingRequiredKeysAreRejected) {
    EXPECT_THROW(loadConfigFromString("server: { hostname: h, remote_user: u }"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString("- not a mapping"), std::invalid_argument);
}

TEST(ConfigTest, ArchiveMustDifferFromSource) {
    EXPECT_THROW(loadConfigFromString(R"(
server:
  remote_user: courier
  source_dir: /srv/lab/outbox
  destination_dir: /data/results
  archive_dir: /srv/lab/outbox
)"), std::invalid_argument);
}

TEST(ConfigTest, ArchiveAliasOfSourceIsRejected) {
    const auto withArchive = [](const std::string& archive) {
        return loadConfigFromString(fmt::format(R"(
server:
  remote_user: courier
  source_dir: /srv/lab/outbox
  destination_dir: /data/results
  archive_dir: {}
)", archive));
    };

    EXPECT_THROW(withArchive("/srv/lab/outbox/"), std::invalid_argument);
    EXPECT_THROW(withArchive("/srv/lab/./outbox"), std::invalid_argument);
    EXPECT_THROW(withArchive("/srv/lab/archive/../outbox"), std::invalid_argument);
    EXPECT_NO_THROW(withArchive("/srv/lab/outbox/sent"));
}

TEST(ConfigTest, SymlinkedArchiveOfSourceIsRejected) {
    const lc::test::TempDir dir;
    std::filesystem::create_directories(dir / "outbox");
    std::filesystem::create_directory_symlink(dir / "outbox", dir / "archive");

    EXPECT_THROW(loadConfigFromString(fmt::format(R"(
server:
  remote_user: courier
  source_dir: {}
  destination_dir: /data/results
  archive_dir: {}
)", (dir / "outbox").string(), (dir / "archive").string())), std::invalid_argument);
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(loadConfigFromString(MINIMAL + "hint_rule: { kind: fuzzy }"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString(MINIMAL + "hint_rule: { kind: regex }"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString(MINIMAL + "hint_rule: { kind: regex, pattern: '(unclosed' }"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString(MINIMAL + "hint_rule: { kind: regex, pattern: '\\d+', group: 1 }"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString(MINIMAL + "retry: { transfer: { max_attempts: 0 } }"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString(MINIMAL + "retry: { transfer: { multiplier: 0.5 } }"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString(MINIMAL + "dispatcher: { workers: 0 }"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString(MINIMAL + "mapping: { source: ldap }"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString(MINIMAL + "history: { sink: kafka }"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString(MINIMAL + "transfer: { command_timeout: 5 fortnights }"), std::invalid_argument);
}

TEST(ConfigTest, EmptyRemoteUserFallsBackToLoginName) {
    const auto cfg = loadConfigFromString(R"(
server:
  source_dir: /srv/lab/outbox
  destination_dir: /data/results
  archive_dir: /srv/lab/archive
)");
    EXPECT_EQ(cfg.server.remote_user, currentUserName());
}

TEST(ParseDurationTest, AcceptsUnits) {
    EXPECT_EQ(parseDuration("250ms"), 250ms);
    EXPECT_EQ(parseDuration("5s"), 5s);
    EXPECT_EQ(parseDuration("5"), 5s);
    EXPECT_EQ(parseDuration("2m"), 2min);
    EXPECT_EQ(parseDuration("1h"), 1h);

    EXPECT_THROW(parseDuration(""), std::invalid_argument);
    EXPECT_THROW(parseDuration("soon"), std::invalid_argument);
    EXPECT_THROW(parseDuration("3d"), std::invalid_argument);
    EXPECT_THROW(parseDuration("-5s"), std::invalid_argument);
    EXPECT_THROW(parseDuration("+5s"), std::invalid_argument);
    EXPECT_THROW(parseDuration(" 5s"), std::invalid_argument);
}
