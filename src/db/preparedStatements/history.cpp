#include "db/DBConnection.hpp"

void lc::db::DBConnection::initPreparedHistory() const {
    conn_->prepare("insert_transfer_history",
                   R"(INSERT INTO transfer_history
           (hostname, remote_hostname, remote_user, path, remote_path, remote_folder, hint,
            archive_path, filename, size, mtime, mime_type, status, reason, error, attempts, sent_at)
       VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, to_timestamp($11), $12, $13, $14, $15, $16, to_timestamp($17))
       RETURNING id)");

    conn_->prepare("count_transfer_history_by_status",
                   "SELECT COUNT(*) FROM transfer_history WHERE status = $1");
}
