#include "sync/Scheduler.hpp"
#include "sync/BandwidthEstimator.hpp"
#include "store/JobStore.hpp"
#include "store/StorageFault.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace es::sync;
using namespace es::sync::model;
using namespace es::store;
using namespace es::util;
using namespace es::logging;

SyncScheduler::SyncScheduler(std::shared_ptr<JobStore> store,
                             std::shared_ptr<BandwidthEstimator> estimator,
                             std::shared_ptr<TransferClient> transfer,
                             config::SchedulerConfig cfg)
    : AsyncService("SyncScheduler"),
      store_(std::move(store)),
      estimator_(std::move(estimator)),
      transfer_(std::move(transfer)),
      cfg_(std::move(cfg)),
      retry_(cfg_.backoff) {
    if (!store_ || !estimator_ || !transfer_) throw std::invalid_argument("SyncScheduler requires a store, an estimator and a transfer client");
    if (cfg_.integrity_retry_weight == 0) throw std::invalid_argument("scheduler.integrity_retry_weight must be > 0");
}

SyncScheduler::~SyncScheduler() { stop(); }

void SyncScheduler::prepare() {
    if (!leaseHeld_) {
        if (!store_->acquireWorkerLease())
            throw std::runtime_error("Another worker already holds the job store lease");
        leaseHeld_ = true;
    }

    // A previous loop in this process may have stopped with a save still pending
    if (const auto recovered = store_->recoverInterrupted(); recovered > 0)
        LogRegistry::sync()->info("[SyncScheduler] Recovered {} interrupted job(s)", recovered);
}

void SyncScheduler::start() {
    if (isRunning()) return;
    prepare();
    AsyncService::start();
}

void SyncScheduler::requestCancel(const std::string& jobId) {
    {
        std::scoped_lock lock(requestsMutex_);
        requests_.push_back({ControlRequest::Kind::Cancel, jobId});
    }
    wake();
}

void SyncScheduler::requestRequeue(const std::string& jobId) {
    {
        std::scoped_lock lock(requestsMutex_);
        requests_.push_back({ControlRequest::Kind::Requeue, jobId});
    }
    wake();
}

bool SyncScheduler::takeCancelRequest(const std::string& jobId) {
    std::scoped_lock lock(requestsMutex_);

    // The latest request for the in-flight job wins; earlier ones are spent with it
    std::optional<ControlRequest::Kind> last;
    std::erase_if(requests_, [&](const ControlRequest& r) {
        if (r.job_id != jobId) return false;
        last = r.kind;
        return true;
    });

    return last == ControlRequest::Kind::Cancel;
}

void SyncScheduler::applyPendingRequests() {
    if (isRunning()) throw std::logic_error("applyPendingRequests() is for a scheduler whose loop is not running");
    applyControlRequests();
}

void SyncScheduler::applyControlRequests() {
    std::deque<ControlRequest> pending;
    {
        std::scoped_lock lock(requestsMutex_);
        pending.swap(requests_);
    }

    while (!pending.empty()) {
        const auto& req = pending.front();

        try {
            auto job = store_->get(req.job_id);
            if (!job) {
                LogRegistry::sync()->warn("[SyncScheduler] Ignoring control request for unknown job {}", req.job_id);
            } else if (job->isTerminal()) {
                LogRegistry::sync()->warn("[SyncScheduler] Ignoring control request for {} job {}",
                                          SyncJob::toString(job->status), req.job_id);
            } else if (req.kind == ControlRequest::Kind::Cancel) {
                pauseCancelled(*job);
            } else if (job->status == Status::PAUSED) {
                auto next = *job;
                next.status = Status::QUEUED;
                next.cancelled = false;
                next.next_attempt_at.reset();
                next.last_error.reset();
                next.touch();
                store_->save(next);
                LogRegistry::sync()->info("[SyncScheduler] Job {} re-queued", req.job_id);
            }
        } catch (const StorageFault&) {
            // Keep this request and everything behind it for the next pass
            std::scoped_lock lock(requestsMutex_);
            requests_.insert(requests_.begin(), pending.begin(), pending.end());
            throw;
        }

        pending.pop_front();
    }
}

SyncScheduler::PassResult SyncScheduler::runPass() {
    try {
        applyControlRequests();
    } catch (const StorageFault& e) {
        LogRegistry::sync()->error("[SyncScheduler] Job store unavailable while applying requests: {}", e.what());
        return PassResult::StoreUnavailable;
    }

    const auto now = Clock::now();
    if (estimator_->isMeasurementDue(now)) estimator_->measure();

    if (!estimator_->isOnline()) {
        LogRegistry::sync()->trace("[SyncScheduler] Offline, not dequeuing");
        return PassResult::Offline;
    }

    std::optional<SyncJob> job;
    try {
        job = store_->nextEligibleJob(now);
    } catch (const StorageFault& e) {
        LogRegistry::sync()->error("[SyncScheduler] Job store unavailable while selecting: {}", e.what());
        return PassResult::StoreUnavailable;
    }

    if (!job) return PassResult::Idle;

    processJob(std::move(*job));
    return PassResult::Processed;
}

void SyncScheduler::runLoop() {
    LogRegistry::sync()->info("[SyncScheduler] Loop running");

    while (!stopRequested()) {
        PassResult result;
        try {
            result = runPass();
        } catch (const std::exception& e) {
            LogRegistry::sync()->error("[SyncScheduler] Pass aborted: {}", e.what());
            result = PassResult::StoreUnavailable;
        }

        switch (result) {
            case PassResult::Processed: break;
            case PassResult::Offline: sleepFor(cfg_.offline_poll); break;
            case PassResult::Idle: sleepFor(cfg_.idle_poll); break;
            case PassResult::StoreUnavailable: sleepFor(cfg_.storage_retry_delay); break;
        }
    }

    LogRegistry::sync()->info("[SyncScheduler] Loop exiting");
}

bool SyncScheduler::persist(SyncJob& job, const SyncJob& next) {
    while (true) {
        try {
            store_->save(next);
            job = next;
            return true;
        } catch (const StorageFault& e) {
            LogRegistry::sync()->error("[SyncScheduler] Failed to persist job {}, retrying in {}s: {}",
                                       next.job_id, cfg_.storage_retry_delay.count(), e.what());
        }

        if (!sleepFor(cfg_.storage_retry_delay)) return false;
    }
}

void SyncScheduler::processJob(SyncJob job) {
    LogRegistry::sync()->info("[SyncScheduler] Driving job {} (priority {}, {}/{} chunks done, retry {})",
                              job.job_id, job.priority, job.chunksDoneCount(), job.chunk_count, job.retry_count);

    try {
        {
            auto next = job;
            next.status = Status::TRANSFERRING;
            next.next_attempt_at.reset();
            next.touch();
            if (!persist(job, next)) return;
        }

        if (!job.remote_transfer_id) {
            auto next = job;
            if (const auto r = transfer_->initiate(next); !r.ok()) return handleFailure(job, r);
            next.touch();
            if (!persist(job, next)) return;
        }

        // Cancellation and shutdown are observed here and nowhere else
        const auto atBoundary = [&] {
            if (stopRequested()) {
                pauseForShutdown(job);
                return true;
            }
            if (takeCancelRequest(job.job_id)) {
                pauseCancelled(job);
                return true;
            }
            return false;
        };

        for (const auto index : job.missingChunks()) {
            if (atBoundary()) return;

            if (const auto r = transfer_->uploadChunk(job, index); !r.ok()) return handleFailure(job, r);

            auto next = job;
            next.markChunkDone(index);
            next.touch();
            if (!persist(job, next)) return;
        }

        if (atBoundary()) return;

        if (const auto r = transfer_->complete(job); !r.ok()) return handleFailure(job, r);

        auto next = job;
        next.status = Status::COMPLETED;
        next.last_error.reset();
        next.next_attempt_at.reset();
        next.touch();
        if (!persist(job, next)) return;

        LogRegistry::sync()->info("[SyncScheduler] Job {} completed ({} bytes in {} chunks)",
                                  job.job_id, job.file_size, job.chunk_count);
    } catch (const std::exception& e) {
        LogRegistry::sync()->error("[SyncScheduler] Unexpected error on job {}: {}", job.job_id, e.what());
        handleFailure(job, TransferResult::failure(TransferResult::Kind::Source, std::string("unexpected error: ") + e.what()));
    }
}

void SyncScheduler::handleFailure(SyncJob& job, const TransferResult& result) {
    auto next = job;
    unsigned int weight = 1;

    switch (result.kind) {
        case TransferResult::Kind::Network:
            estimator_->markOffline();
            break;
        case TransferResult::Kind::Integrity:
            weight = cfg_.integrity_retry_weight;
            break;
        case TransferResult::Kind::Rejected:
            // Chunks uploaded under the dead handle are lost with it
            next.resetTransfer();
            break;
        default:
            break;
    }

    next.retry_count += weight;
    next.last_error = fmt::format("{}: {}", TransferResult::toString(result.kind), result.message);
    next.touch();

    if (next.retry_count > cfg_.max_retries) {
        next.status = Status::FAILED;
        next.next_attempt_at.reset();
        if (persist(job, next))
            LogRegistry::sync()->error("[SyncScheduler] Job {} failed after {} retries: {}",
                                       job.job_id, job.retry_count, *job.last_error);
        return;
    }

    next.status = Status::PAUSED;
    next.next_attempt_at = retry_.nextAttempt(next.retry_count, Clock::now());
    if (persist(job, next))
        LogRegistry::sync()->warn("[SyncScheduler] Job {} paused (retry {} of {}, next attempt {}): {}",
                                  job.job_id, job.retry_count, cfg_.max_retries,
                                  timestampToString(*job.next_attempt_at), *job.last_error);
}

void SyncScheduler::pauseForShutdown(SyncJob& job) {
    auto next = job;
    next.status = Status::PAUSED;
    next.next_attempt_at.reset();
    next.touch();
    if (persist(job, next))
        LogRegistry::sync()->info("[SyncScheduler] Job {} paused for shutdown at {}/{} chunks",
                                  job.job_id, job.chunksDoneCount(), job.chunk_count);
}

void SyncScheduler::pauseCancelled(SyncJob& job) {
    auto next = job;
    next.status = Status::PAUSED;
    next.cancelled = true;
    next.last_error = "cancelled";
    next.next_attempt_at.reset();
    next.touch();
    if (persist(job, next))
        LogRegistry::sync()->info("[SyncScheduler] Job {} cancelled at {}/{} chunks",
                                  job.job_id, job.chunksDoneCount(), job.chunk_count);
}
