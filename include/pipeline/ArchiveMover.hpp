#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

namespace lc::pipeline {

// Moves delivered files into the archive directory without ever replacing an
// existing archive entry.
class ArchiveMover {
public:
    enum class MoveResult { Moved, Exists };

    // Unlinks the source after a cross-device copy; std::filesystem::remove by default
    using SourceRemover = std::function<bool(const std::filesystem::path&, std::error_code&)>;

    explicit ArchiveMover(unsigned int maxCollisions = 100, SourceRemover removeSource = {});

    // Returns the final archived path. Throws ArchiveError (CollisionUnresolved
    // or LocalIOFailure); the source is left in place on failure.
    std::filesystem::path archive(const std::filesystem::path& localPath,
                                  const std::filesystem::path& archiveDir) const;

    // "<stem>_<n><ext>", n == 0 yields filename unchanged
    [[nodiscard]] static std::string candidateName(const std::string& filename, unsigned int n);

    // Copy, rename without replace, then unlink the source. Used when src and
    // dst are on different filesystems. If the source cannot be unlinked the
    // archived copy is removed again and LocalIOFailure is thrown.
    MoveResult moveAcrossDevices(const std::filesystem::path& src, const std::filesystem::path& dst) const;

private:
    unsigned int maxCollisions_;
    SourceRemover removeSource_;

    MoveResult tryMove(const std::filesystem::path& src, const std::filesystem::path& dst) const;
    static MoveResult moveWithoutNoReplace(const std::filesystem::path& src, const std::filesystem::path& dst);
};

}
