#include "pipeline/model/ResultFile.hpp"

using namespace lc::pipeline::model;

namespace fs = std::filesystem;

ResultFile::ResultFile(const fs::path& path, std::string label)
    : localPath(path),
      filename(path.filename().string()),
      sizeBytes(fs::file_size(path)),
      mtime(fs::last_write_time(path)),
      label(std::move(label)) {}
