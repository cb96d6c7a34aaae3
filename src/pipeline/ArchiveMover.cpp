#include "pipeline/ArchiveMover.hpp"
#include "pipeline/errors.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>

#ifndef RENAME_NOREPLACE
#define RENAME_NOREPLACE (1 << 0)
#endif

using namespace lc::pipeline;
using namespace lc::log;

namespace fs = std::filesystem;

namespace {

ArchiveError terminalLocalIO(const std::string& what) {
    return {FailureReason::LocalIOFailure, what, false};
}

}

ArchiveMover::ArchiveMover(const unsigned int maxCollisions, SourceRemover removeSource)
    : maxCollisions_(maxCollisions), removeSource_(std::move(removeSource)) {
    if (!removeSource_) removeSource_ = [](const fs::path& p, std::error_code& ec) { return fs::remove(p, ec); };
}

std::string ArchiveMover::candidateName(const std::string& filename, const unsigned int n) {
    if (n == 0) return filename;
    const fs::path p(filename);
    return fmt::format("{}_{}{}", p.stem().string(), n, p.extension().string());
}

fs::path ArchiveMover::archive(const fs::path& localPath, const fs::path& archiveDir) const {
    std::error_code ec;
    if (!fs::is_regular_file(fs::symlink_status(localPath, ec)))
        throw terminalLocalIO(fmt::format("{} is no longer a regular file", localPath.string()));

    fs::create_directories(archiveDir, ec);
    if (ec) throw ArchiveError::localIO(fmt::format("cannot create archive directory {}: {}", archiveDir.string(), ec.message()));

    const auto filename = localPath.filename().string();

    for (unsigned int n = 0; n <= maxCollisions_; ++n) {
        const auto candidate = archiveDir / candidateName(filename, n);
        if (tryMove(localPath, candidate) == MoveResult::Moved) {
            if (n > 0) Registry::archive()->info("[ArchiveMover] {} archived as {} (name taken)", filename, candidate.filename().string());
            return candidate;
        }
    }

    throw ArchiveError::collision(fmt::format("{} has {} colliding names in {}", filename, maxCollisions_, archiveDir.string()));
}

ArchiveMover::MoveResult ArchiveMover::tryMove(const fs::path& src, const fs::path& dst) const {
    if (renameat2(AT_FDCWD, src.c_str(), AT_FDCWD, dst.c_str(), RENAME_NOREPLACE) == 0) return MoveResult::Moved;

    const int err = errno;
    switch (err) {
        case EEXIST: return MoveResult::Exists;
        case EXDEV: return moveAcrossDevices(src, dst);
        case EINVAL:
        case ENOSYS: return moveWithoutNoReplace(src, dst);
        default:
            throw ArchiveError::localIO(fmt::format("rename {} -> {} failed: {}", src.string(), dst.string(), std::strerror(err)));
    }
}

// Filesystems without RENAME_NOREPLACE support
ArchiveMover::MoveResult ArchiveMover::moveWithoutNoReplace(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(dst, ec))) return MoveResult::Exists;

    fs::rename(src, dst, ec);
    if (ec) throw ArchiveError::localIO(fmt::format("rename {} -> {} failed: {}", src.string(), dst.string(), ec.message()));
    return MoveResult::Moved;
}

ArchiveMover::MoveResult ArchiveMover::moveAcrossDevices(const fs::path& src, const fs::path& dst) const {
    const auto tmp = dst.parent_path() / ("." + dst.filename().string() + ".part");

    std::error_code ec;
    fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        const auto reason = ec.message();
        fs::remove(tmp, ec);
        throw ArchiveError::localIO(fmt::format("copy {} -> {} failed: {}", src.string(), tmp.string(), reason));
    }

    if (const auto mtime = fs::last_write_time(src, ec); !ec) fs::last_write_time(tmp, mtime, ec);

    if (renameat2(AT_FDCWD, tmp.c_str(), AT_FDCWD, dst.c_str(), RENAME_NOREPLACE) != 0) {
        const int err = errno;
        if (err == EINVAL || err == ENOSYS) {
            if (moveWithoutNoReplace(tmp, dst) == MoveResult::Exists) {
                fs::remove(tmp, ec);
                return MoveResult::Exists;
            }
        } else {
            fs::remove(tmp, ec);
            if (err == EEXIST) return MoveResult::Exists;
            throw ArchiveError::localIO(fmt::format("rename {} -> {} failed: {}", tmp.string(), dst.string(), std::strerror(err)));
        }
    }

    ec.clear();
    const bool removed = removeSource_(src, ec);
    if (ec) {
        // Never leave the file in both places
        const auto reason = ec.message();
        std::error_code rollbackEc;
        fs::remove(dst, rollbackEc);
        if (rollbackEc)
            Registry::archive()->error("[ArchiveMover] Could not remove archived copy {}: {}", dst.string(), rollbackEc.message());
        throw ArchiveError::localIO(fmt::format("{} copied to the archive but could not be removed: {}", src.string(), reason));
    }

    if (!removed) Registry::archive()->warn("[ArchiveMover] {} vanished while being archived by copy", src.string());
    return MoveResult::Moved;
}
