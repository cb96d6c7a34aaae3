#pragma once

#include "history/HistoryRecorder.hpp"

#include <nlohmann/json_fwd.hpp>

namespace lc::types {
struct History;
void to_json(nlohmann::json& j, const History& h);
}

namespace lc::history {

// One JSON object per line on the audit logger
class AuditLogHistory final : public HistoryRecorder {
public:
    void record(const types::History& entry) override;
};

}
