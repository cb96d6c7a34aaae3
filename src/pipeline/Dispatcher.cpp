#include "pipeline/Dispatcher.hpp"
#include "pipeline/PatternFilter.hpp"
#include "pipeline/HintExtractor.hpp"
#include "pipeline/DestinationResolver.hpp"
#include "pipeline/Transferer.hpp"
#include "pipeline/ArchiveMover.hpp"
#include "pipeline/errors.hpp"
#include "pipeline/model/ResultFile.hpp"
#include "pipeline/model/TransferTask.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/Task.hpp"
#include "history/HistoryRecorder.hpp"
#include "types/History.hpp"
#include "log/Registry.hpp"

#include <climits>
#include <unistd.h>

using namespace lc::pipeline;
using namespace lc::pipeline::model;
using namespace lc::concurrency;
using namespace lc::log;

namespace fs = std::filesystem;

namespace {

std::string localHostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) return "localhost";
    return buf;
}

bool isUpsert(const WatchEvent::Kind kind) {
    return kind == WatchEvent::Kind::Created || kind == WatchEvent::Kind::Modified;
}

}

class Dispatcher::PathJob final : public Task {
public:
    PathJob(Dispatcher& dispatcher, std::string key) : dispatcher_(dispatcher), key_(std::move(key)) {}

    void operator()() override { dispatcher_.runPath(key_); }

private:
    Dispatcher& dispatcher_;
    std::string key_;
};

template <typename Fn>
auto Dispatcher::withRetry(const RetryPolicy& policy, const std::string& stage, const std::string& key, Fn&& fn) {
    const auto started = std::chrono::steady_clock::now();

    for (unsigned int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const PipelineError& e) {
            updateStatus(key, [&](FileStatus& s) { s.lastError = e.what(); });

            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            if (!e.retryable() || !policy.allowsAnother(attempt, elapsed)) throw;

            const auto delay = policy.delayAfter(attempt);
            Registry::transfer()->warn("[Dispatcher] {} attempt {} for {} failed ({}), retrying in {} ms",
                                       stage, attempt, key, e.what(), delay.count());
            lazySleep(delay);

            if (shouldStop()) {
                Registry::dispatch()->warn("[Dispatcher] {} retry for {} interrupted by shutdown", stage, key);
                throw;
            }
        }
    }
}

Dispatcher::Dispatcher(const config::Config& cfg, PipelineComponents components)
    : AsyncService("Dispatcher"),
      cfg_(cfg),
      components_(std::move(components)),
      transferRetry_(cfg.retry.transfer),
      archiveRetry_(cfg.retry.archive),
      intake_(cfg.dispatcher.queue_capacity),
      pool_(std::make_unique<ThreadPool>(cfg.dispatcher.workers, "dispatch")),
      localHostname_(localHostname()) {
    if (!components_.filter || !components_.hints || !components_.resolver ||
        !components_.transferer || !components_.archiver)
        throw std::invalid_argument("Dispatcher requires filter, hint extractor, resolver, transferer and archiver");
}

Dispatcher::~Dispatcher() {
    stop();
}

void Dispatcher::stop() {
    {
        std::scoped_lock lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
    }

    Registry::dispatch()->debug("[Dispatcher] Stopping, {} event(s) left in intake", intake_.size());
    AsyncService::stop();
    intake_.close();
    pool_->stop();

    std::scoped_lock lock(mutex_);
    cv_.notify_all();
}

void Dispatcher::onStopRequested() {
    intake_.close();
    std::scoped_lock lock(mutex_);
    cv_.notify_all();
}

bool Dispatcher::submit(WatchEvent event) {
    {
        std::scoped_lock lock(mutex_);
        if (stopped_) return false;
        ++submitted_;
    }

    if (intake_.push(std::move(event))) return true;

    markHandled();
    return false;
}

bool Dispatcher::waitIdle(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return handled_ >= submitted_; });
}

std::optional<FileStatus> Dispatcher::status(const fs::path& path) const {
    const auto key = pathKey(path);
    std::scoped_lock lock(mutex_);
    const auto it = statuses_.find(key);
    if (it == statuses_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::pair<fs::path, FileStatus>> Dispatcher::snapshot() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::pair<fs::path, FileStatus>> out;
    out.reserve(statuses_.size());
    for (const auto& [key, s] : statuses_) out.emplace_back(key, s);
    return out;
}

std::string Dispatcher::pathKey(const fs::path& path) {
    std::error_code ec;
    const auto canonical = fs::weakly_canonical(path, ec);
    if (ec) return path.lexically_normal().string();
    return canonical.string();
}

void Dispatcher::runLoop() {
    while (!shouldStop()) {
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return shouldStop() || activeJobs_ < cfg_.dispatcher.workers; });
        }
        if (shouldStop()) break;

        auto event = intake_.popFor(std::chrono::milliseconds(200));
        if (!event) {
            if (intake_.closed()) break;
            continue;
        }

        route(std::move(*event));
    }
}

void Dispatcher::route(WatchEvent event) {
    if (event.kind == WatchEvent::Kind::Moved) {
        // One intake event becomes two path events: the old name leaves, the new one arrives
        {
            std::scoped_lock lock(mutex_);
            ++submitted_;
        }
        auto from = event.fromPath;
        enqueue(pathKey(from), from, WatchEvent(WatchEvent::Kind::Deleted, from));
        enqueue(pathKey(event.path), event.path, WatchEvent(WatchEvent::Kind::Created, event.path));
        return;
    }

    const auto key = pathKey(event.path);
    auto path = event.path;
    enqueue(key, path, std::move(event));
}

void Dispatcher::enqueue(const std::string& key, const fs::path& path, WatchEvent event) {
    std::scoped_lock lock(mutex_);
    auto& slot = slots_[key];
    if (slot.path.empty()) slot.path = path;

    if (isUpsert(event.kind) && !slot.pending.empty() && isUpsert(slot.pending.back().kind)) {
        ++handled_;
        cv_.notify_all();
        return;
    }

    if (isUpsert(event.kind) && !slot.scheduled) statuses_[key] = FileStatus{};

    slot.pending.push_back(std::move(event));

    if (!slot.scheduled) {
        slot.scheduled = true;
        ready_.push_back(key);
    }

    scheduleReady();
}

// Caller holds mutex_
void Dispatcher::scheduleReady() {
    while (!ready_.empty() && activeJobs_ < cfg_.dispatcher.workers) {
        auto key = std::move(ready_.front());
        ready_.pop_front();

        ++activeJobs_;
        if (pool_->submit(std::make_shared<PathJob>(*this, key))) continue;

        --activeJobs_;
        if (const auto it = slots_.find(key); it != slots_.end()) {
            handled_ += it->second.pending.size();
            slots_.erase(it);
        }
    }
    cv_.notify_all();
}

void Dispatcher::runPath(const std::string& key) {
    for (;;) {
        WatchEvent event;
        {
            std::scoped_lock lock(mutex_);
            const auto it = slots_.find(key);
            if (it == slots_.end()) {
                --activeJobs_;
                scheduleReady();
                return;
            }

            auto& slot = it->second;
            if (slot.pending.empty() || shouldStop()) {
                if (!slot.pending.empty())
                    Registry::dispatch()->debug("[Dispatcher] Dropping {} queued event(s) for {} on shutdown",
                                                slot.pending.size(), key);
                handled_ += slot.pending.size();
                slots_.erase(it);
                --activeJobs_;
                scheduleReady();
                return;
            }

            event = std::move(slot.pending.front());
            slot.pending.pop_front();
        }

        try {
            process(key, event);
        } catch (const std::exception& e) {
            Registry::dispatch()->error("[Dispatcher] Unhandled error processing {}: {}", key, e.what());
        }

        markHandled();
    }
}

void Dispatcher::markHandled(const unsigned long long n) {
    std::scoped_lock lock(mutex_);
    handled_ += n;
    cv_.notify_all();
}

void Dispatcher::process(const std::string& key, const WatchEvent& event) {
    switch (event.kind) {
        case WatchEvent::Kind::Deleted:
            Registry::dispatch()->debug("[Dispatcher] {} left the source directory, untracking", key);
            untrack(key);
            return;
        case WatchEvent::Kind::Created:
        case WatchEvent::Kind::Modified:
        case WatchEvent::Kind::Moved:
            deliver(key, event.path);
            return;
    }
}

void Dispatcher::deliver(const std::string& key, const fs::path& path) {
    updateStatus(key, [](FileStatus& s) { s = FileStatus{}; });
    setState(key, FileState::Filtering);

    if (!components_.filter->matches(path)) {
        updateStatus(key, [](FileStatus& s) {
            s.state = FileState::Done;
            s.filtered = true;
        });
        Registry::dispatch()->debug("[Dispatcher] Ignoring {}", path.string());
        return;
    }

    ResultFile file;
    try {
        file = ResultFile(path, cfg_.server.label);
    } catch (const fs::filesystem_error& e) {
        updateStatus(key, [&](FileStatus& s) {
            s.state = FileState::Failed;
            s.reason = FailureReason::LocalIOFailure;
            s.lastError = e.what();
        });
        Registry::dispatch()->warn("[Dispatcher] {} vanished before delivery: {}", path.string(), e.what());
        return;
    }

    file.hint = components_.hints->extract(file.filename);
    file.mimeType = components_.filter->mimeTypeOf(path);

    auto history = makeHistory(file);
    unsigned int attempts = 0;

    const auto fail = [&](const FailureReason reason, const std::string& what) {
        updateStatus(key, [&](FileStatus& s) {
            s.state = FileState::Failed;
            s.reason = reason;
            s.lastError = what;
        });
        Registry::dispatch()->error("[Dispatcher] {} failed ({}): {}", file.filename, to_string(reason), what);

        history.status = types::History::Status::Failed;
        history.reason = to_string(reason);
        history.error = what;
        history.attempts = attempts;
        recordHistory(history);
    };

    if (!file.hint) {
        fail(FailureReason::MappingNotFound, "no hint could be extracted from the filename");
        return;
    }

    try {
        setState(key, FileState::Resolving);
        const auto folder = withRetry(transferRetry_, "resolve", key, [&] {
            return components_.resolver->resolve(cfg_.server.destination_dir, *file.hint, file.label);
        });
        history.remote_folder = folder;

        setState(key, FileState::Transferring);
        TransferTask task{file, cfg_.server.destination_dir, folder};
        const auto remotePath = withRetry(transferRetry_, "transfer", key, [&] {
            attempts = ++task.attemptCount;
            updateStatus(key, [&](FileStatus& s) { s.attempts = attempts; });
            try {
                return components_.transferer->transfer(task, cfg_.server.mkdir_remote);
            } catch (const PipelineError& e) {
                task.lastError = e.what();
                throw;
            }
        });

        updateStatus(key, [&](FileStatus& s) {
            s.remotePath = remotePath;
            s.state = FileState::Archiving;
        });

        const auto archived = withRetry(archiveRetry_, "archive", key, [&] {
            return components_.archiver->archive(path, cfg_.server.archive_dir);
        });

        updateStatus(key, [&](FileStatus& s) {
            s.archivedPath = archived;
            s.lastError.reset();
            s.state = FileState::Done;
        });

        Registry::dispatch()->info("[Dispatcher] Delivered {} to {}:{} (archived as {})",
                                   file.filename, cfg_.server.hostname, remotePath, archived.filename().string());

        history.status = types::History::Status::Sent;
        history.archive_path = archived.parent_path().string();
        history.filename = archived.filename().string();
        history.attempts = attempts;
        recordHistory(history);
    } catch (const PipelineError& e) {
        fail(e.reason(), e.what());
    } catch (const fs::filesystem_error& e) {
        fail(FailureReason::LocalIOFailure, e.what());
    }
}

void Dispatcher::setState(const std::string& key, const FileState state) {
    updateStatus(key, [state](FileStatus& s) { s.state = state; });
}

void Dispatcher::updateStatus(const std::string& key, const std::function<void(FileStatus&)>& fn) {
    std::scoped_lock lock(mutex_);
    auto& s = statuses_[key];
    fn(s);
    s.updatedAt = std::chrono::system_clock::now();
}

void Dispatcher::untrack(const std::string& key) {
    std::scoped_lock lock(mutex_);
    statuses_.erase(key);
}

lc::types::History Dispatcher::makeHistory(const ResultFile& file) const {
    types::History h;
    h.hostname = localHostname_;
    h.remote_hostname = cfg_.server.hostname;
    h.user = cfg_.server.remote_user;
    h.path = file.localPath.string();
    h.remote_path = cfg_.server.destination_dir;
    h.hint = file.hint.value_or("");
    h.filename = file.filename;
    h.size = file.sizeBytes;
    h.mtime = std::chrono::system_clock::to_time_t(std::chrono::file_clock::to_sys(file.mtime));
    h.mime_type = file.mimeType;
    return h;
}

void Dispatcher::recordHistory(const types::History& entry) const {
    if (!components_.history) return;
    try {
        components_.history->record(entry);
    } catch (const std::exception& e) {
        Registry::dispatch()->error("[Dispatcher] Failed to record history for {}: {}", entry.filename, e.what());
    }
}
