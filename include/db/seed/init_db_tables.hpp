#pragma once

#include "db/Transactions.hpp"

namespace lc::db::seed {

inline void init_remote_folders() {
    Transactions::exec("init_db_tables::init_remote_folders", [&](pqxx::work& txn) {
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS remote_folders
(
    id          SERIAL          PRIMARY KEY,
    base_path   TEXT            NOT NULL,
    hint        VARCHAR(32)     NOT NULL,
    label       VARCHAR(64)     NOT NULL DEFAULT '',
    folder      TEXT            NOT NULL,
    name        TEXT,
    created_at  TIMESTAMP       DEFAULT CURRENT_TIMESTAMP,
    updated_at  TIMESTAMP       DEFAULT CURRENT_TIMESTAMP,
    UNIQUE (base_path, hint, label)
);
        )");
    });
}

inline void init_transfer_history() {
    Transactions::exec("init_db_tables::init_transfer_history", [&](pqxx::work& txn) {
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS transfer_history
(
    id               SERIAL          PRIMARY KEY,
    hostname         TEXT            NOT NULL,
    remote_hostname  TEXT            NOT NULL,
    remote_user      TEXT            NOT NULL,
    path             TEXT            NOT NULL,
    remote_path      TEXT            NOT NULL,
    remote_folder    TEXT,
    hint             VARCHAR(32),
    archive_path     TEXT,
    filename         TEXT            NOT NULL,
    size             BIGINT          NOT NULL DEFAULT 0,
    mtime            TIMESTAMP,
    mime_type        VARCHAR(255),
    status           VARCHAR(16)     NOT NULL CHECK (status IN ('sent', 'failed')),
    reason           VARCHAR(32),
    error            TEXT,
    attempts         INTEGER         NOT NULL DEFAULT 0,
    sent_at          TIMESTAMP       DEFAULT CURRENT_TIMESTAMP
);
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_transfer_history_filename ON transfer_history (filename)");
    });
}

inline void init_tables_if_not_exists() {
    log::Registry::db()->debug("[seed] Ensuring labcourier tables exist");
    init_remote_folders();
    init_transfer_history();
}

}
