#include "mapping/PostgresMappingSource.hpp"
#include "db/query/RemoteFolder.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

using namespace lc::mapping;
using namespace lc::log;

std::optional<std::string> PostgresMappingSource::lookup(const std::string& basePath,
                                                         const std::string& hint,
                                                         const std::string& label) const {
    auto folder = db::query::RemoteFolder::getFolder(basePath, hint, label);
    if (!folder) Registry::mapping()->debug("[PostgresMappingSource] No row for ({}, {}, {})", basePath, hint, label);
    return folder;
}

void PostgresMappingSource::seed(const std::vector<config::MappingEntry>& entries) {
    for (const auto& e : entries) db::query::RemoteFolder::upsert(e);
    if (!entries.empty())
        Registry::mapping()->info("[PostgresMappingSource] Seeded {} mapping entr{} from config",
                                  entries.size(), entries.size() == 1 ? "y" : "ies");
}
