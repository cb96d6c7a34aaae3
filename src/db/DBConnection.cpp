#include "db/DBConnection.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <cctype>
#include <fstream>
#include <fmt/format.h>

using namespace lc::log;

namespace lc::db {

static std::string escapeUriComponent(const std::string& in) {
    std::string out;
    for (const unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') out += static_cast<char>(c);
        else out += fmt::format("%{:02X}", c);
    }
    return out;
}

static std::string readPassword(const std::filesystem::path& f) {
    std::ifstream in(f);
    if (!in.is_open()) throw std::runtime_error(fmt::format("Failed to open database password file {}", f.string()));

    std::string pass;
    std::getline(in, pass);
    while (!pass.empty() && (pass.back() == '\r' || pass.back() == ' ')) pass.pop_back();
    if (pass.empty()) throw std::runtime_error(fmt::format("Database password file {} is empty", f.string()));
    return pass;
}

DBConnection::DBConnection(const config::DatabaseConfig& cfg) {
    std::string credentials = escapeUriComponent(cfg.user);
    if (!cfg.password_file.empty()) credentials += ":" + escapeUriComponent(readPassword(cfg.password_file));

    connectionString_ = fmt::format("postgresql://{}@{}:{}/{}", credentials, cfg.host, cfg.port, cfg.name);
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const {
    if (!isOpen()) connect();
    return *conn_;
}

void DBConnection::connect() const {
    if (conn_) Registry::db()->warn("[DBConnection] Connection lost, reconnecting");
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
    initPrepared();
    Registry::db()->debug("[DBConnection] Connected to {}", conn_->dbname());
}

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedRemoteFolders();
    initPreparedHistory();
}

}
