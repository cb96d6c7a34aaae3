#include "history/AuditLogHistory.hpp"
#include "types/History.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace lc::history;
using namespace lc::log;

void lc::types::to_json(nlohmann::json& j, const History& h) {
    j = {
        {"hostname", h.hostname},
        {"remote_hostname", h.remote_hostname},
        {"user", h.user},
        {"path", h.path},
        {"remote_path", h.remote_path},
        {"remote_folder", h.remote_folder},
        {"hint", h.hint},
        {"archive_path", h.archive_path},
        {"filename", h.filename},
        {"size", h.size},
        {"mtime", h.mtime},
        {"mime_type", h.mime_type},
        {"status", to_string(h.status)},
        {"attempts", h.attempts},
        {"sent", h.sent_at}
    };

    if (h.reason) j["reason"] = *h.reason;
    if (!h.error.empty()) j["error"] = h.error;
}

void AuditLogHistory::record(const types::History& entry) {
    Registry::audit()->info(nlohmann::json(entry).dump());
}
