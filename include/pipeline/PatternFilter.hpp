#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace lc::pipeline {

class PatternFilter {
public:
    using MimeSniffer = std::function<std::string(const std::filesystem::path&)>;

    // Empty mimeTypes disables MIME checking. The default sniffer is libmagic.
    PatternFilter(std::vector<std::string> patterns,
                  std::vector<std::string> mimeTypes,
                  MimeSniffer sniffer = {});

    [[nodiscard]] bool matches(const std::filesystem::path& path) const;

    [[nodiscard]] bool matchesName(const std::string& filename) const;

    // Empty when the file was rejected before sniffing or sniffing failed
    [[nodiscard]] std::string mimeTypeOf(const std::filesystem::path& path) const;

private:
    std::vector<std::string> patterns_;
    std::vector<std::string> mimeTypes_;
    MimeSniffer sniffer_;
};

}
