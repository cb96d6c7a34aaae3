#pragma once

#include "DBPool.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <chrono>
#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <utility>

namespace lc::db {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    static constexpr std::chrono::seconds ACQUIRE_TIMEOUT{30};

    static void init(const config::DatabaseConfig& cfg) { dbPool_ = std::make_shared<DBPool>(cfg, cfg.pool_size); }

    static void shutdown() { dbPool_.reset(); }

    [[nodiscard]] static bool initialized() { return dbPool_ != nullptr; }

    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto conn = dbPool_->acquire(ACQUIRE_TIMEOUT);

        try {
            pqxx::work txn(conn->get());

            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
            } else {
                auto result = func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back: {}", ctx, e.what());
            dbPool_->release(std::move(conn));
            throw;
        }
    }
};

}
