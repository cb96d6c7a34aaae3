#pragma once

#include "mapping/MappingSource.hpp"
#include "config/Config.hpp"

#include <map>
#include <tuple>
#include <vector>

namespace lc::mapping {

// Mapping table read from the `mapping.entries` config section
class StaticMappingSource final : public MappingSource {
public:
    // Throws std::invalid_argument on an entry without folder or on a duplicate triple
    explicit StaticMappingSource(const std::vector<config::MappingEntry>& entries);

    [[nodiscard]] std::optional<std::string> lookup(const std::string& basePath,
                                                    const std::string& hint,
                                                    const std::string& label) const override;

    [[nodiscard]] size_t size() const { return table_.size(); }

private:
    using Key = std::tuple<std::string, std::string, std::string>;
    std::map<Key, std::string> table_;
};

}
