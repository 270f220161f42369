#pragma once

#include "services/AsyncService.hpp"
#include "config/Config.hpp"
#include "sync/RetryPolicy.hpp"
#include "sync/TransferClient.hpp"
#include "sync/model/Job.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace es::store { class JobStore; }

namespace es::sync {

class BandwidthEstimator;

// Owns every time-based trigger: probes, backoff expiry and job selection.
// It is the only writer of existing job records.
class SyncScheduler final : public services::AsyncService {
public:
    enum class PassResult {
        Offline,          // no probe succeeded, nothing dequeued
        Idle,             // online but no eligible job
        Processed,        // one job was driven until it completed, paused or failed
        StoreUnavailable  // the store raised a StorageFault while selecting
    };

    SyncScheduler(std::shared_ptr<store::JobStore> store,
                  std::shared_ptr<BandwidthEstimator> estimator,
                  std::shared_ptr<TransferClient> transfer,
                  config::SchedulerConfig cfg);

    ~SyncScheduler() override;

    // Takes the worker lease and recovers interrupted jobs before the loop starts.
    void start() override;

    // Lease + recovery without starting the thread. Throws if another worker holds the lease.
    // Recovery runs on every call, so a restarted loop picks up jobs the last one left behind.
    void prepare();

    // One iteration of the loop body, on the calling thread.
    PassResult runPass();

    // Honoured at the next chunk boundary of an in-flight job, or on the next pass otherwise.
    void requestCancel(const std::string& jobId);
    void requestRequeue(const std::string& jobId);

    // Applies queued cancel/requeue requests on the calling thread without
    // selecting a job. Only valid while the loop is not running.
    void applyPendingRequests();

    [[nodiscard]] const RetryPolicy& retryPolicy() const { return retry_; }

protected:
    void runLoop() override;

private:
    struct ControlRequest {
        enum class Kind { Cancel, Requeue };
        Kind kind;
        std::string job_id;
    };

    std::shared_ptr<store::JobStore> store_;
    std::shared_ptr<BandwidthEstimator> estimator_;
    std::shared_ptr<TransferClient> transfer_;
    config::SchedulerConfig cfg_;
    RetryPolicy retry_;

    std::mutex requestsMutex_;
    std::deque<ControlRequest> requests_;

    bool leaseHeld_{false};

    void applyControlRequests();
    bool takeCancelRequest(const std::string& jobId);

    void processJob(model::SyncJob job);

    // Saves next and, on success, makes it the current state of job.
    // StorageFaults are retried after storage_retry_delay; returns false if
    // shutdown was requested first.
    bool persist(model::SyncJob& job, const model::SyncJob& next);

    void handleFailure(model::SyncJob& job, const TransferResult& result);
    void pauseForShutdown(model::SyncJob& job);
    void pauseCancelled(model::SyncJob& job);
};

}
