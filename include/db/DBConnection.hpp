#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace lc::config { struct DatabaseConfig; }

namespace lc::db {

// Lazily connected; a dropped connection is re-opened (and its prepared
// statements re-registered) on the next get().
class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    [[nodiscard]] bool isOpen() const { return conn_ && conn_->is_open(); }

  private:
    std::string connectionString_;
    mutable std::unique_ptr<pqxx::connection> conn_;

    void connect() const;
    void initPrepared() const;

    void initPreparedRemoteFolders() const;
    void initPreparedHistory() const;
};

}
