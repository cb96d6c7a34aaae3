#include "db/query/RemoteFolder.hpp"
#include "db/Transactions.hpp"
#include "config/Config.hpp"

namespace lc::db::query {

std::optional<std::string> RemoteFolder::getFolder(const std::string& basePath,
                                                   const std::string& hint,
                                                   const std::string& label) {
    return Transactions::exec("RemoteFolder::getFolder", [&](pqxx::work& txn) -> std::optional<std::string> {
        const auto res = txn.exec(pqxx::prepped{"get_remote_folder"}, pqxx::params{basePath, hint, label});
        if (res.empty() || res[0][0].is_null()) return std::nullopt;
        return res[0][0].as<std::string>();
    });
}

void RemoteFolder::upsert(const config::MappingEntry& entry) {
    Transactions::exec("RemoteFolder::upsert", [&](pqxx::work& txn) {
        pqxx::params p{entry.base_path, entry.hint, entry.label, entry.folder, std::optional<std::string>{}};
        txn.exec(pqxx::prepped{"upsert_remote_folder"}, p);
    });
}

}
