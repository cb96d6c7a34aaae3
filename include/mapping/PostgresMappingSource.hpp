#pragma once

#include "mapping/MappingSource.hpp"

#include <vector>

namespace lc::config { struct MappingEntry; }

namespace lc::mapping {

// Looks up the remote_folders table. Requires db::Transactions to be initialized.
class PostgresMappingSource final : public MappingSource {
public:
    [[nodiscard]] std::optional<std::string> lookup(const std::string& basePath,
                                                    const std::string& hint,
                                                    const std::string& label) const override;

    // Writes configured entries into remote_folders, replacing folders of existing triples
    static void seed(const std::vector<config::MappingEntry>& entries);
};

}
