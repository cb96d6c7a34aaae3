#include "mapping/StaticMappingSource.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace lc::mapping;

StaticMappingSource::StaticMappingSource(const std::vector<config::MappingEntry>& entries) {
    for (const auto& e : entries) {
        if (e.folder.empty())
            throw std::invalid_argument(fmt::format("mapping entry ({}, {}, {}) has no folder", e.base_path, e.hint, e.label));

        const auto [_, inserted] = table_.emplace(Key{e.base_path, e.hint, e.label}, e.folder);
        if (!inserted)
            throw std::invalid_argument(fmt::format("duplicate mapping entry ({}, {}, {})", e.base_path, e.hint, e.label));
    }
}

std::optional<std::string> StaticMappingSource::lookup(const std::string& basePath,
                                                       const std::string& hint,
                                                       const std::string& label) const {
    const auto it = table_.find(Key{basePath, hint, label});
    if (it == table_.end()) return std::nullopt;
    return it->second;
}
