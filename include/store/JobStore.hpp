#pragma once

#include "sync/model/Job.hpp"
#include "sync/model/Summary.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace es::config { struct JobStoreConfig; }

namespace es::store {

class JobStore {
public:
    virtual ~JobStore() = default;

    // Persists the full record. Either every field survives or none does.
    virtual void save(const sync::model::SyncJob& job) = 0;

    [[nodiscard]] virtual std::optional<sync::model::SyncJob> get(const std::string& jobId) = 0;

    // Lowest priority value first, then oldest created_at, then job_id.
    [[nodiscard]] virtual std::optional<sync::model::SyncJob> nextEligibleJob(sync::model::TimePoint now) = 0;

    [[nodiscard]] virtual std::vector<sync::model::SyncJob> listByStatus(sync::model::Status status) = 0;

    [[nodiscard]] virtual sync::model::QueueSummary summary() = 0;

    // TRANSFERRING -> PAUSED for every job a dead worker left behind.
    // Returns the number of jobs rewritten.
    virtual unsigned int recoverInterrupted() = 0;

    // Exclusive across processes. Held until the store is destroyed.
    [[nodiscard]] virtual bool acquireWorkerLease() = 0;
};

std::unique_ptr<JobStore> makeJobStore(const config::JobStoreConfig& cfg);

}
