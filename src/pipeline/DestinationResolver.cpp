#include "pipeline/DestinationResolver.hpp"
#include "pipeline/errors.hpp"
#include "mapping/MappingSource.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace lc::pipeline;
using namespace lc::log;

MappedDestinationResolver::MappedDestinationResolver(std::shared_ptr<mapping::MappingSource> source)
    : source_(std::move(source)) {
    if (!source_) throw std::invalid_argument("MappedDestinationResolver requires a mapping source");
}

std::string MappedDestinationResolver::resolve(const std::string& basePath,
                                               const std::string& hint,
                                               const std::string& label) const {
    std::optional<std::string> folder;
    try {
        folder = source_->lookup(basePath, hint, label);
    } catch (const PipelineError&) {
        throw;
    } catch (const std::exception& e) {
        Registry::mapping()->warn("[DestinationResolver] Mapping lookup failed for ({}, {}, {}): {}",
                                  basePath, hint, label, e.what());
        throw MappingUnavailable(fmt::format("mapping source unavailable: {}", e.what()));
    }

    if (!folder || folder->empty())
        throw MappingNotFound(fmt::format("no remote folder for base path '{}', hint '{}', label '{}'",
                                          basePath, hint, label));

    return *folder;
}
