#pragma once

#include "DBConnection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>

namespace es::database {

class DBPool {
  public:
    explicit DBPool(const std::string& connectionString, const size_t size = 2) {
        if (size == 0) throw std::invalid_argument("DBPool size must be > 0");
        for (size_t i = 0; i < size; ++i) {
            pool_.push(std::make_unique<DBConnection>(connectionString));
        }
    }

    std::unique_ptr<DBConnection> acquire() {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [&]() { return !pool_.empty(); });
        auto conn = std::move(pool_.front());
        pool_.pop();
        return conn;
    }

    void release(std::unique_ptr<DBConnection> conn) {
        std::lock_guard lock(mtx_);
        pool_.push(std::move(conn));
        cv_.notify_one();
    }

  private:
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace es::database
