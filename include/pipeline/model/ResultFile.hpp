#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lc::pipeline::model {

struct ResultFile {
    std::filesystem::path localPath;
    std::string filename;
    uintmax_t sizeBytes{0};
    std::filesystem::file_time_type mtime{};
    std::optional<std::string> hint;
    std::string label;
    std::string mimeType;

    ResultFile() = default;

    // Stats localPath; throws std::filesystem::filesystem_error when it is gone
    ResultFile(const std::filesystem::path& path, std::string label);
};

}
