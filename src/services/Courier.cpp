#include "services/Courier.hpp"
#include "pipeline/Dispatcher.hpp"
#include "pipeline/Watcher.hpp"
#include "pipeline/PatternFilter.hpp"
#include "pipeline/HintExtractor.hpp"
#include "pipeline/DestinationResolver.hpp"
#include "pipeline/Transferer.hpp"
#include "pipeline/ArchiveMover.hpp"
#include "mapping/StaticMappingSource.hpp"
#include "mapping/PostgresMappingSource.hpp"
#include "remote/SshRemoteCopy.hpp"
#include "history/AuditLogHistory.hpp"
#include "history/PostgresHistory.hpp"
#include "db/Transactions.hpp"
#include "db/seed/init_db_tables.hpp"
#include "db/query/History.hpp"
#include "log/Registry.hpp"

using namespace lc::services;
using namespace lc::pipeline;
using namespace lc::config;
using namespace lc::log;

Courier::Courier(Config cfg) : cfg_(std::move(cfg)) {
    usesDatabase_ = cfg_.mapping.source == MappingConfig::Source::Postgres ||
                    cfg_.history.sink == HistoryConfig::Sink::Postgres;
}

Courier::~Courier() {
    stop();
}

void Courier::initDatabase() const {
    Registry::courier()->info("[Courier] Connecting to database {}@{}:{}/{}",
                              cfg_.database.user, cfg_.database.host, cfg_.database.port, cfg_.database.name);
    db::Transactions::init(cfg_.database);
    db::seed::init_tables_if_not_exists();

    if (cfg_.mapping.source == MappingConfig::Source::Postgres)
        mapping::PostgresMappingSource::seed(cfg_.mapping.entries);

    if (cfg_.history.sink == HistoryConfig::Sink::Postgres)
        Registry::courier()->info("[Courier] {} file(s) delivered so far, {} failure(s) on record",
                                  db::query::History::countByStatus("sent"),
                                  db::query::History::countByStatus("failed"));
}

PipelineComponents Courier::buildComponents() const {
    const auto& server = cfg_.server;
    PipelineComponents c;

    c.filter = std::make_shared<PatternFilter>(server.file_patterns, server.mime_types);
    c.hints = std::make_shared<HintExtractor>(cfg_.hint_rule);

    std::shared_ptr<mapping::MappingSource> source;
    if (cfg_.mapping.source == MappingConfig::Source::Postgres) source = std::make_shared<mapping::PostgresMappingSource>();
    else source = std::make_shared<mapping::StaticMappingSource>(cfg_.mapping.entries);
    c.resolver = std::make_shared<MappedDestinationResolver>(source);

    remote::SshTarget target{server.hostname, server.remote_user, server.ssh_port, server.identity_file, server.connect_timeout};
    c.transferer = std::make_shared<RemoteTransferer>(
        std::make_shared<remote::SshRemoteCopy>(std::move(target), cfg_.transfer.command_timeout));

    c.archiver = std::make_shared<ArchiveMover>(cfg_.retry.max_collisions);

    switch (cfg_.history.sink) {
        case HistoryConfig::Sink::Audit: c.history = std::make_shared<history::AuditLogHistory>(); break;
        case HistoryConfig::Sink::Postgres: c.history = std::make_shared<history::PostgresHistory>(); break;
        case HistoryConfig::Sink::None: break;
    }

    return c;
}

void Courier::start() {
    if (dispatcher_) return;

    if (usesDatabase_) initDatabase();

    Registry::courier()->info("[Courier] Delivering {} -> {}@{}:{} (label '{}', archive {})",
                              cfg_.server.source_dir.string(), cfg_.server.remote_user, cfg_.server.hostname,
                              cfg_.server.destination_dir, cfg_.server.label, cfg_.server.archive_dir.string());

    dispatcher_ = std::make_shared<Dispatcher>(cfg_, buildComponents());
    watcher_ = std::make_shared<Watcher>(cfg_.server.source_dir, cfg_.server.touch_existing,
                                         [d = dispatcher_](model::WatchEvent ev) { return d->submit(std::move(ev)); });

    dispatcher_->start();
    watcher_->start();
}

void Courier::stop() {
    if (!dispatcher_) return;

    Registry::courier()->info("[Courier] Stopping");
    dispatcher_->stop();
    watcher_->stop();

    watcher_.reset();
    dispatcher_.reset();

    if (usesDatabase_) db::Transactions::shutdown();
}

bool Courier::allRunning() const {
    return dispatcher_ && watcher_ && dispatcher_->isRunning() && watcher_->isRunning();
}

bool Courier::recover() {
    if (!dispatcher_ || !dispatcher_->isRunning()) return false;

    if (!watcher_->isRunning()) {
        Registry::courier()->warn("[Courier] Watcher is down, restarting");
        watcher_->start();
    }
    return true;
}
