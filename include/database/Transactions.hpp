#pragma once

#include "DBPool.hpp"
#include "logging/LogRegistry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <type_traits>
#include <utility>

namespace es::database {

class Transactions {
  public:
    explicit Transactions(std::shared_ptr<DBPool> pool) : dbPool_(std::move(pool)) {
        if (!dbPool_) throw std::invalid_argument("Transactions requires a connection pool");
    }

    template <typename Func>
    auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        logging::LogRegistry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto conn = dbPool_->acquire();

        try {
            conn->reopenIfClosed();
            pqxx::work txn(conn->get());

            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
            } else {
                auto result = func(txn);
                txn.commit();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (const std::exception& e) {
            logging::LogRegistry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back: {}", ctx, e.what());
            dbPool_->release(std::move(conn));
            throw;
        }

        if constexpr (!std::is_void_v<decltype(func(std::declval<pqxx::work&>()))>) {
            throw std::logic_error("Unreachable path in Transactions::exec");
        }
    }

  private:
    std::shared_ptr<DBPool> dbPool_;
};

} // namespace es::database
