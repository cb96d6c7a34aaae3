#include "pipeline/PatternFilter.hpp"
#include "util/Magic.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fnmatch.h>

using namespace lc::pipeline;
using namespace lc::log;

namespace fs = std::filesystem;

PatternFilter::PatternFilter(std::vector<std::string> patterns,
                             std::vector<std::string> mimeTypes,
                             MimeSniffer sniffer)
    : patterns_(std::move(patterns)),
      mimeTypes_(std::move(mimeTypes)),
      sniffer_(std::move(sniffer)) {
    if (!sniffer_) sniffer_ = [](const fs::path& p) { return util::Magic::get_mime_type(p.string()); };
}

bool PatternFilter::matchesName(const std::string& filename) const {
    return std::ranges::any_of(patterns_, [&](const std::string& pattern) {
        return fnmatch(pattern.c_str(), filename.c_str(), FNM_PERIOD) == 0;
    });
}

bool PatternFilter::matches(const fs::path& path) const {
    if (!matchesName(path.filename().string())) return false;

    std::error_code ec;
    const auto st = fs::symlink_status(path, ec);
    if (ec || !fs::is_regular_file(st)) return false;

    const auto size = fs::file_size(path, ec);
    if (ec || size == 0) return false;

    if (mimeTypes_.empty()) return true;

    const auto mime = mimeTypeOf(path);
    return !mime.empty() && std::ranges::find(mimeTypes_, mime) != mimeTypes_.end();
}

std::string PatternFilter::mimeTypeOf(const fs::path& path) const {
    try {
        return sniffer_(path);
    } catch (const std::exception& e) {
        Registry::dispatch()->warn("[PatternFilter] Unable to sniff MIME type of {}: {}", path.string(), e.what());
        return {};
    }
}
