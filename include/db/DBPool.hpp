#pragma once

#include "DBConnection.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>

namespace lc::db {

// Fixed set of lazily connected connections. Nothing is dialed until a
// connection is first used.
class DBPool {
  public:
    DBPool(const config::DatabaseConfig& cfg, const size_t size) : size_(size) {
        if (size_ == 0) throw std::invalid_argument("DBPool requires at least one connection");
        for (size_t i = 0; i < size_; ++i) pool_.push(std::make_unique<DBConnection>(cfg));
    }

    // Throws std::runtime_error when every connection stays checked out past timeout
    std::unique_ptr<DBConnection> acquire(const std::chrono::milliseconds timeout) {
        std::unique_lock lock(mtx_);
        if (!cv_.wait_for(lock, timeout, [&]() { return !pool_.empty(); }))
            throw std::runtime_error("Timed out waiting for a database connection");
        auto conn = std::move(pool_.front());
        pool_.pop();
        return conn;
    }

    void release(std::unique_ptr<DBConnection> conn) {
        if (!conn) return;
        std::lock_guard lock(mtx_);
        pool_.push(std::move(conn));
        cv_.notify_one();
    }

    [[nodiscard]] size_t size() const { return size_; }

    [[nodiscard]] size_t available() const {
        std::lock_guard lock(mtx_);
        return pool_.size();
    }

  private:
    const size_t size_;
    std::queue<std::unique_ptr<DBConnection>> pool_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

}
