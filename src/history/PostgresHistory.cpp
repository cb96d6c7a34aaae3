#include "history/PostgresHistory.hpp"
#include "db/query/History.hpp"
#include "types/History.hpp"
#include "log/Registry.hpp"

using namespace lc::history;
using namespace lc::log;

void PostgresHistory::record(const types::History& entry) {
    const auto id = db::query::History::insert(entry);
    Registry::db()->debug("[PostgresHistory] Recorded {} as transfer_history #{}", entry.filename, id);
}
