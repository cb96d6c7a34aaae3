#include "db/DBConnection.hpp"

void lc::db::DBConnection::initPreparedRemoteFolders() const {
    conn_->prepare("get_remote_folder",
                   "SELECT folder FROM remote_folders WHERE base_path = $1 AND hint = $2 AND label = $3");

    conn_->prepare("upsert_remote_folder",
                   R"(INSERT INTO remote_folders (base_path, hint, label, folder, name)
       VALUES ($1, $2, $3, $4, $5)
       ON CONFLICT (base_path, hint, label)
       DO UPDATE SET
           folder = EXCLUDED.folder,
           name = COALESCE(EXCLUDED.name, remote_folders.name),
           updated_at = NOW())");
}
