#pragma once

#include <string>

namespace lc::types { struct History; }

namespace lc::db::query {

class History {
    using H = lc::types::History;

public:
    [[nodiscard]] static unsigned int insert(const H& entry);
    [[nodiscard]] static unsigned long long countByStatus(const std::string& status);
};

}
