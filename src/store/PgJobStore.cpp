#include "store/PgJobStore.hpp"
#include "store/StorageFault.hpp"
#include "database/Transactions.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/pqxx>

using namespace es::store;
using namespace es::database;
using namespace es::sync::model;
using namespace es::logging;
using namespace es::util;

namespace {

std::optional<std::string> optionalText(const pqxx::field& f) {
    if (f.is_null()) return std::nullopt;
    return f.as<std::string>();
}

// Goes through from_json so a row gets the same validation as a file record.
SyncJob jobFromRow(const pqxx::row& row) {
    nlohmann::json j = {
        {"job_id", row["job_id"].as<std::string>()},
        {"resource_id", row["resource_id"].as<std::string>()},
        {"source_path", row["source_path"].as<std::string>()},
        {"file_size", row["file_size"].as<uint64_t>()},
        {"chunk_size", row["chunk_size"].as<uint64_t>()},
        {"chunk_count", row["chunk_count"].as<uint64_t>()},
        {"chunks_done", nlohmann::json::parse(row["chunks_done"].as<std::string>())},
        {"status", row["status"].as<std::string>()},
        {"priority", row["priority"].as<int>()},
        {"created_at", row["created_at"].as<int64_t>()},
        {"updated_at", row["updated_at"].as<int64_t>()},
        {"retry_count", row["retry_count"].as<unsigned int>()},
        {"metadata", nlohmann::json::parse(row["metadata"].as<std::string>())},
        {"cancelled", row["cancelled"].as<bool>()}
    };

    if (const auto err = optionalText(row["error_message"])) j["error_message"] = *err;
    if (const auto tid = optionalText(row["remote_transfer_id"])) j["remote_transfer_id"] = *tid;
    if (!row["next_attempt_at"].is_null()) j["next_attempt_at"] = row["next_attempt_at"].as<int64_t>();

    return j.get<SyncJob>();
}

pqxx::params paramsFor(const SyncJob& job) {
    const std::optional<int64_t> next = job.next_attempt_at
        ? std::optional<int64_t>(toEpochMillis(*job.next_attempt_at)) : std::nullopt;

    return pqxx::params{
        job.job_id,
        job.resource_id,
        job.source_path.string(),
        static_cast<int64_t>(job.file_size),
        static_cast<int64_t>(job.chunk_size),
        static_cast<int64_t>(job.chunk_count),
        nlohmann::json(job.doneChunks()).dump(),
        std::string(SyncJob::toString(job.status)),
        job.priority,
        toEpochMillis(job.created_at),
        toEpochMillis(job.updated_at),
        static_cast<int>(job.retry_count),
        job.last_error,
        job.remote_transfer_id,
        nlohmann::json(job.metadata).dump(),
        next,
        job.cancelled
    };
}

}

PgJobStore::PgJobStore(const config::PostgresConfig& cfg)
    : PgJobStore(connectionStringFor(cfg), cfg.pool_size) {}

PgJobStore::PgJobStore(const std::string& connectionString, const size_t poolSize)
    : connectionString_(connectionString) {
    try {
        pool_ = std::make_shared<DBPool>(connectionString_, poolSize);
    } catch (const pqxx::failure& e) {
        LogRegistry::db()->error("[PgJobStore] Failed to connect: {}", e.what());
        throw StorageFault(std::string("Failed to connect to job database: ") + e.what());
    }
    txns_ = std::make_unique<Transactions>(pool_);
    LogRegistry::store()->info("[PgJobStore] Connected with {} pooled connections", poolSize);
}

PgJobStore::~PgJobStore() = default;

template <typename Func>
auto PgJobStore::run(const std::string& ctx, Func&& func) {
    try {
        return txns_->exec(ctx, std::forward<Func>(func));
    } catch (const pqxx::failure& e) {
        throw StorageFault(ctx + ": " + e.what());
    } catch (const pqxx::usage_error& e) {
        throw StorageFault(ctx + ": " + e.what());
    } catch (const pqxx::conversion_error& e) {
        throw StorageFault(ctx + ": corrupt job row: " + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw StorageFault(ctx + ": corrupt job row: " + e.what());
    } catch (const std::invalid_argument& e) {
        throw StorageFault(ctx + ": corrupt job row: " + e.what());
    }
}

void PgJobStore::save(const SyncJob& job) {
    const auto p = paramsFor(job);
    run("PgJobStore::save", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"sync_job.upsert"}, p);
    });
}

std::optional<SyncJob> PgJobStore::get(const std::string& jobId) {
    return run("PgJobStore::get", [&](pqxx::work& txn) -> std::optional<SyncJob> {
        const auto res = txn.exec(pqxx::prepped{"sync_job.get"}, pqxx::params{jobId});
        if (res.empty()) return std::nullopt;
        return jobFromRow(res.one_row());
    });
}

std::optional<SyncJob> PgJobStore::nextEligibleJob(const TimePoint now) {
    return run("PgJobStore::nextEligibleJob", [&](pqxx::work& txn) -> std::optional<SyncJob> {
        const auto res = txn.exec(pqxx::prepped{"sync_job.next_eligible"}, pqxx::params{toEpochMillis(now)});

        // A row that no longer decodes must not hold up the rows behind it
        for (const auto& row : res) {
            try {
                return jobFromRow(row);
            } catch (const std::exception& e) {
                LogRegistry::store()->error("[PgJobStore] Skipping corrupt job row {}: {}",
                                            row["job_id"].as<std::string>(), e.what());
            }
        }
        return std::nullopt;
    });
}

std::vector<SyncJob> PgJobStore::listByStatus(const Status status) {
    return run("PgJobStore::listByStatus", [&](pqxx::work& txn) {
        std::vector<SyncJob> out;
        const auto res = txn.exec(pqxx::prepped{"sync_job.list_by_status"},
                                  pqxx::params{std::string(SyncJob::toString(status))});
        for (const auto& row : res) {
            try {
                out.push_back(jobFromRow(row));
            } catch (const std::exception& e) {
                LogRegistry::store()->error("[PgJobStore] Skipping corrupt job row {}: {}",
                                            row["job_id"].as<std::string>(), e.what());
            }
        }
        return out;
    });
}

QueueSummary PgJobStore::summary() {
    return run("PgJobStore::summary", [&](pqxx::work& txn) {
        QueueSummary s;
        for (const auto& row : txn.exec(pqxx::prepped{"sync_job.summary"})) {
            Status st{};
            if (!SyncJob::tryParseStatus(row["status"].as<std::string>(), st)) {
                LogRegistry::store()->warn("[PgJobStore] Ignoring unknown status '{}' in summary", row["status"].as<std::string>());
                continue;
            }
            s.by_status[st] = StatusTotals{row["jobs"].as<uint64_t>(), row["bytes"].as<uint64_t>()};
        }
        return s;
    });
}

unsigned int PgJobStore::recoverInterrupted() {
    const auto n = run("PgJobStore::recoverInterrupted", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"sync_job.recover_interrupted"},
                                  pqxx::params{toEpochMillis(Clock::now())});
        for (const auto& row : res)
            LogRegistry::store()->info("[PgJobStore] Recovered interrupted job {}", row["job_id"].as<std::string>());
        return static_cast<unsigned int>(res.size());
    });
    return n;
}

bool PgJobStore::acquireWorkerLease() {
    std::scoped_lock lock(leaseMutex_);
    if (leaseConn_) return true;

    try {
        auto conn = std::make_unique<DBConnection>(connectionString_);
        pqxx::nontransaction txn(conn->get());
        const auto acquired = txn.exec(pqxx::prepped{"sync_job.try_worker_lease"},
                                       pqxx::params{WORKER_LEASE_KEY}).one_row()["acquired"].as<bool>();
        if (!acquired) return false;
        leaseConn_ = std::move(conn);
    } catch (const pqxx::failure& e) {
        throw StorageFault(std::string("Failed to acquire worker lease: ") + e.what());
    }

    LogRegistry::store()->debug("[PgJobStore] Acquired worker lease");
    return true;
}
