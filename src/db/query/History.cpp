#include "db/query/History.hpp"
#include "db/Transactions.hpp"
#include "types/History.hpp"

namespace lc::db::query {

unsigned int History::insert(const H& entry) {
    return Transactions::exec("History::insert", [&](pqxx::work& txn) {
        pqxx::params p{
            entry.hostname, entry.remote_hostname, entry.user, entry.path, entry.remote_path,
            entry.remote_folder, entry.hint, entry.archive_path, entry.filename,
            static_cast<long long>(entry.size), static_cast<long long>(entry.mtime), entry.mime_type,
            types::to_string(entry.status), entry.reason, entry.error, entry.attempts,
            static_cast<long long>(entry.sent_at)
        };
        const auto res = txn.exec(pqxx::prepped{"insert_transfer_history"}, p);
        if (res.empty()) throw std::runtime_error("Failed to insert transfer history: no result returned");
        return res.one_field().as<unsigned int>();
    });
}

unsigned long long History::countByStatus(const std::string& status) {
    return Transactions::exec("History::countByStatus", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"count_transfer_history_by_status"}, status).one_field().as<unsigned long long>();
    });
}

}
