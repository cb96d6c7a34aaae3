#include "pipeline/Watcher.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <vector>

using namespace lc::pipeline;
using namespace lc::pipeline::model;
using namespace lc::log;

namespace fs = std::filesystem;

namespace {

constexpr uint32_t WATCH_MASK = IN_CREATE | IN_CLOSE_WRITE | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE;
constexpr int POLL_TIMEOUT_MS = 200;

// A MOVED_FROM without its MOVED_TO after this long was a move out of the directory
constexpr auto MOVE_PAIR_WINDOW = std::chrono::milliseconds(250);

}

Watcher::Watcher(fs::path sourceDir, const bool touchExisting, Sink sink)
    : AsyncService("Watcher"),
      sourceDir_(std::move(sourceDir)),
      touchExisting_(touchExisting),
      sink_(std::move(sink)) {
    if (!sink_) throw std::invalid_argument("Watcher requires an event sink");
}

Watcher::~Watcher() {
    stop();
    closeWatch();
}

void Watcher::start() {
    if (isRunning()) return;
    if (inotifyFd_ < 0) openWatch();
    AsyncService::start();
}

void Watcher::openWatch() {
    inotifyFd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotifyFd_ < 0)
        throw std::runtime_error(fmt::format("inotify_init1 failed: {}", std::strerror(errno)));

    watchFd_ = inotify_add_watch(inotifyFd_, sourceDir_.c_str(), WATCH_MASK | IN_ONLYDIR);
    if (watchFd_ < 0) {
        const int err = errno;
        closeWatch();
        throw std::runtime_error(fmt::format("cannot watch {}: {}", sourceDir_.string(), std::strerror(err)));
    }

    Registry::watcher()->info("[Watcher] Watching {}", sourceDir_.string());
}

void Watcher::closeWatch() {
    if (inotifyFd_ >= 0) close(inotifyFd_);
    inotifyFd_ = -1;
    watchFd_ = -1;
}

bool Watcher::rewatch() {
    watchFd_ = inotify_add_watch(inotifyFd_, sourceDir_.c_str(), WATCH_MASK | IN_ONLYDIR);
    if (watchFd_ < 0) return false;
    Registry::watcher()->warn("[Watcher] Watch on {} re-established", sourceDir_.string());
    openCreated_.clear();
    pendingMoves_.clear();
    announceExisting();
    return true;
}

void Watcher::runLoop() {
    if (touchExisting_) announceExisting();

    while (!shouldStop()) {
        if (watchFd_ < 0) {
            if (!rewatch()) lazySleep(std::chrono::seconds(1));
            continue;
        }

        pollfd pfd{inotifyFd_, POLLIN, 0};
        const int rc = poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(fmt::format("poll on inotify fd failed: {}", std::strerror(errno)));
        }

        if (rc > 0) drainEvents();
        flushPendingMoves(false);
    }

    flushPendingMoves(true);
}

void Watcher::announceExisting() {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(sourceDir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code stEc;
        if (it->is_regular_file(stEc) && !it->is_symlink(stEc)) files.push_back(it->path());
    }

    if (ec) {
        Registry::watcher()->error("[Watcher] Unable to list {}: {}", sourceDir_.string(), ec.message());
        return;
    }

    std::ranges::sort(files, [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    Registry::watcher()->info("[Watcher] Announcing {} existing file(s) in {}", files.size(), sourceDir_.string());
    for (auto& f : files) {
        if (shouldStop()) return;
        emit(WatchEvent(WatchEvent::Kind::Created, std::move(f)));
    }
}

void Watcher::drainEvents() {
    alignas(inotify_event) char buf[64 * 1024];

    for (;;) {
        const ssize_t n = read(inotifyFd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN) return;
            throw std::runtime_error(fmt::format("read on inotify fd failed: {}", std::strerror(errno)));
        }
        if (n == 0) return;

        for (const char* p = buf; p < buf + n;) {
            const auto* ev = reinterpret_cast<const inotify_event*>(p);
            handle(*ev);
            p += sizeof(inotify_event) + ev->len;
        }
    }
}

void Watcher::handle(const inotify_event& ev) {
    if (ev.mask & IN_Q_OVERFLOW) {
        Registry::watcher()->warn("[Watcher] inotify queue overflowed, rescanning {}", sourceDir_.string());
        openCreated_.clear();
        flushPendingMoves(true);
        announceExisting();
        return;
    }

    if (ev.mask & IN_IGNORED) {
        Registry::watcher()->error("[Watcher] Watch on {} was removed", sourceDir_.string());
        watchFd_ = -1;
        return;
    }

    if (ev.len == 0 || (ev.mask & IN_ISDIR)) return;

    const std::string name(ev.name);
    const auto path = sourceDir_ / name;

    if (ev.mask & IN_CREATE) {
        openCreated_.insert(name);
    } else if (ev.mask & IN_CLOSE_WRITE) {
        const bool created = openCreated_.erase(name) > 0;
        emit(WatchEvent(created ? WatchEvent::Kind::Created : WatchEvent::Kind::Modified, path));
    } else if (ev.mask & IN_MOVED_FROM) {
        const bool stillOpen = openCreated_.erase(name) > 0;
        pendingMoves_[ev.cookie] = {name, stillOpen, std::chrono::steady_clock::now()};
    } else if (ev.mask & IN_MOVED_TO) {
        const auto it = pendingMoves_.find(ev.cookie);
        if (it == pendingMoves_.end()) {
            emit(WatchEvent(WatchEvent::Kind::Created, path));
            return;
        }

        const auto fromName = it->second.name;
        const bool stillOpen = it->second.stillOpen;
        pendingMoves_.erase(it);

        // Still being written under its new name; announce on close
        if (stillOpen) openCreated_.insert(name);
        else emit(WatchEvent::moved(sourceDir_ / fromName, path));
    } else if (ev.mask & IN_DELETE) {
        openCreated_.erase(name);
        emit(WatchEvent(WatchEvent::Kind::Deleted, path));
    }
}

void Watcher::flushPendingMoves(const bool all) {
    const auto now = std::chrono::steady_clock::now();
    for (auto it = pendingMoves_.begin(); it != pendingMoves_.end();) {
        if (all || now - it->second.seen >= MOVE_PAIR_WINDOW) {
            emit(WatchEvent(WatchEvent::Kind::Deleted, sourceDir_ / it->second.name));
            it = pendingMoves_.erase(it);
        } else ++it;
    }
}

void Watcher::emit(WatchEvent event) {
    Registry::watcher()->debug("[Watcher] {} {}", event.kindToString(), event.path.string());
    if (!sink_(std::move(event)))
        Registry::watcher()->debug("[Watcher] Event sink closed, event discarded");
}
