#pragma once

#include <optional>
#include <string>

namespace lc::mapping {

// Resolves a (base path, hint, label) triple to a remote sub-folder.
// nullopt means no such row; a backend that cannot answer throws.
class MappingSource {
public:
    virtual ~MappingSource() = default;

    [[nodiscard]] virtual std::optional<std::string> lookup(const std::string& basePath,
                                                            const std::string& hint,
                                                            const std::string& label) const = 0;
};

}
