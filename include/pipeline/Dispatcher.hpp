#pragma once

#include "concurrency/AsyncService.hpp"
#include "concurrency/BoundedQueue.hpp"
#include "config/Config.hpp"
#include "pipeline/RetryPolicy.hpp"
#include "pipeline/model/FileStatus.hpp"
#include "pipeline/model/WatchEvent.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lc::concurrency { class ThreadPool; }
namespace lc::history { class HistoryRecorder; }
namespace lc::types { struct History; }

namespace lc::pipeline {

class PatternFilter;
class HintExtractor;
class DestinationResolver;
class Transferer;
class ArchiveMover;

namespace model { struct ResultFile; }

struct PipelineComponents {
    std::shared_ptr<PatternFilter> filter;
    std::shared_ptr<HintExtractor> hints;
    std::shared_ptr<DestinationResolver> resolver;
    std::shared_ptr<Transferer> transferer;
    std::shared_ptr<ArchiveMover> archiver;
    std::shared_ptr<history::HistoryRecorder> history;     // optional
};

// Drives every watched file through filter -> hint -> resolve -> transfer ->
// archive. The service thread drains the bounded intake queue into per-path
// FIFOs; path jobs run on a worker pool, never two for the same path.
class Dispatcher final : public concurrency::AsyncService {
public:
    Dispatcher(const config::Config& cfg, PipelineComponents components);

    ~Dispatcher() override;

    // Stops intake, interrupts backoff sleeps, waits for in-flight work.
    // Not restartable.
    void stop() override;

    // Blocks while the intake queue is full. False once stopped.
    bool submit(model::WatchEvent event);

    // True once every submitted event has been fully handled
    bool waitIdle(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<model::FileStatus> status(const std::filesystem::path& path) const;

    [[nodiscard]] std::vector<std::pair<std::filesystem::path, model::FileStatus>> snapshot() const;

    [[nodiscard]] static std::string pathKey(const std::filesystem::path& path);

protected:
    void runLoop() override;

    void onStopRequested() override;

private:
    class PathJob;
    friend class PathJob;

    struct PathSlot {
        std::filesystem::path path;
        std::deque<model::WatchEvent> pending;
        bool scheduled{false};      // waiting in ready_ or owned by a running job
    };

    config::Config cfg_;
    PipelineComponents components_;
    RetryPolicy transferRetry_, archiveRetry_;

    concurrency::BoundedQueue<model::WatchEvent> intake_;
    std::unique_ptr<concurrency::ThreadPool> pool_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, PathSlot> slots_;
    std::unordered_map<std::string, model::FileStatus> statuses_;
    std::deque<std::string> ready_;
    unsigned int activeJobs_{0};
    unsigned long long submitted_{0}, handled_{0};
    bool stopped_{false};

    std::string localHostname_;

    void route(model::WatchEvent event);
    void enqueue(const std::string& key, const std::filesystem::path& path, model::WatchEvent event);
    void scheduleReady();
    void runPath(const std::string& key);
    void markHandled(unsigned long long n = 1);

    void process(const std::string& key, const model::WatchEvent& event);
    void deliver(const std::string& key, const std::filesystem::path& path);

    void setState(const std::string& key, model::FileState state);
    void updateStatus(const std::string& key, const std::function<void(model::FileStatus&)>& fn);
    void untrack(const std::string& key);

    template <typename Fn>
    auto withRetry(const RetryPolicy& policy, const std::string& stage, const std::string& key, Fn&& fn);

    void recordHistory(const types::History& entry) const;
    [[nodiscard]] types::History makeHistory(const model::ResultFile& file) const;
};

}
