#pragma once

#include <optional>
#include <string>

namespace lc::config { struct MappingEntry; }

namespace lc::db::query {

class RemoteFolder {
public:
    [[nodiscard]] static std::optional<std::string> getFolder(const std::string& basePath,
                                                              const std::string& hint,
                                                              const std::string& label);

    static void upsert(const config::MappingEntry& entry);
};

}
