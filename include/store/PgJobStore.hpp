#pragma once

#include "store/JobStore.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace es::config { struct PostgresConfig; }

namespace es::database {
class DBConnection;
class DBPool;
class Transactions;
}

namespace es::store {

// sync_jobs table in PostgreSQL. The worker lease is a session-level advisory
// lock held on a connection kept outside the pool.
class PgJobStore final : public JobStore {
public:
    explicit PgJobStore(const config::PostgresConfig& cfg);
    explicit PgJobStore(const std::string& connectionString, size_t poolSize = 2);
    ~PgJobStore() override;

    void save(const sync::model::SyncJob& job) override;

    [[nodiscard]] std::optional<sync::model::SyncJob> get(const std::string& jobId) override;
    [[nodiscard]] std::optional<sync::model::SyncJob> nextEligibleJob(sync::model::TimePoint now) override;
    [[nodiscard]] std::vector<sync::model::SyncJob> listByStatus(sync::model::Status status) override;
    [[nodiscard]] sync::model::QueueSummary summary() override;

    unsigned int recoverInterrupted() override;

    [[nodiscard]] bool acquireWorkerLease() override;

    // "ESJO"
    static constexpr int64_t WORKER_LEASE_KEY = 0x45534A4F;

private:
    std::string connectionString_;
    std::shared_ptr<database::DBPool> pool_;
    std::unique_ptr<database::Transactions> txns_;

    std::mutex leaseMutex_;
    std::unique_ptr<database::DBConnection> leaseConn_;

    template <typename Func>
    auto run(const std::string& ctx, Func&& func);
};

}
