#pragma once

#include <memory>
#include <string>

namespace lc::mapping { class MappingSource; }

namespace lc::pipeline {

class DestinationResolver {
public:
    virtual ~DestinationResolver() = default;

    // Returns the remote sub-folder, throws MappingNotFound or MappingUnavailable
    [[nodiscard]] virtual std::string resolve(const std::string& basePath,
                                              const std::string& hint,
                                              const std::string& label) const = 0;
};

// Exact-triple lookup against a MappingSource. Fails closed: there is no
// default folder and no fuzzy matching.
class MappedDestinationResolver final : public DestinationResolver {
public:
    explicit MappedDestinationResolver(std::shared_ptr<mapping::MappingSource> source);

    [[nodiscard]] std::string resolve(const std::string& basePath,
                                      const std::string& hint,
                                      const std::string& label) const override;

private:
    std::shared_ptr<mapping::MappingSource> source_;
};

}
