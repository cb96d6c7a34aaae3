#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace lc::concurrency {

class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(); }

    // Sleeps up to d, returns early once stop() is requested
    void lazySleep(std::chrono::milliseconds d);

    virtual void runLoop() = 0;

    // Runs on the caller's thread after interruptFlag_ is raised, before join
    virtual void onStopRequested() {}

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}
