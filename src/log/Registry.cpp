#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <stdexcept>

namespace lc::log {

void Registry::makeLogger(const std::string& name, spdlog::sinks_init_list sinks,
                          const spdlog::level::level_enum lvl) {
    const auto logger = std::make_shared<spdlog::logger>(name, sinks);
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

void Registry::init(const config::LoggingConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = cfg.log_dir;

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cfg.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (log_dir_ / "labcourier.log").string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cfg.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    // audit: file-only sink (append), one line per delivered or failed file
    audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (log_dir_ / "audit.log").string(), /*truncate=*/false);
    audit_file_sink_->set_pattern("%v");

    // loggers are registered only once every sink is open
    const auto& sub = cfg.subsystem_levels;
    makeLogger("courier",  {console_sink_, main_file_sink_}, sub.courier);
    makeLogger("watcher",  {console_sink_, main_file_sink_}, sub.watcher);
    makeLogger("dispatch", {console_sink_, main_file_sink_}, sub.dispatch);
    makeLogger("transfer", {console_sink_, main_file_sink_}, sub.transfer);
    makeLogger("archive",  {console_sink_, main_file_sink_}, sub.archive);
    makeLogger("mapping",  {console_sink_, main_file_sink_}, sub.mapping);
    makeLogger("db",       {console_sink_, main_file_sink_}, sub.db);
    {
        const auto logger = std::make_shared<spdlog::logger>("audit", audit_file_sink_);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    courier()->info("[LogRegistry] Initialized, writing to {}", log_dir_.string());
}

void Registry::initForTesting() {
    if (initialized_) return;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(spdlog::level::warn);
    console_sink_->set_pattern(LOG_FORMAT);

    for (const auto* name : {"courier", "watcher", "dispatch", "transfer", "archive", "mapping", "db", "audit"})
        makeLogger(name, {console_sink_}, spdlog::level::debug);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    initialized_ = false;
}

}
