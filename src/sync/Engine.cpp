#include "sync/Engine.hpp"
#include "sync/BandwidthEstimator.hpp"
#include "sync/Scheduler.hpp"
#include "store/JobStore.hpp"
#include "crypto/IdGenerator.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>

using namespace es::sync;
using namespace es::sync::model;
using namespace es::crypto;
using namespace es::logging;
namespace fs = std::filesystem;

void es::sync::to_json(nlohmann::json& j, const EngineStatus& s) {
    j = {
        {"online", s.online},
        {"bandwidth_mbps", s.bandwidth_mbps},
        {"queue", s.queue}
    };
}

SyncEngine::SyncEngine(std::shared_ptr<store::JobStore> store,
                       std::shared_ptr<BandwidthEstimator> estimator,
                       ChunkPlanner planner,
                       std::shared_ptr<SyncScheduler> scheduler)
    : store_(std::move(store)),
      estimator_(std::move(estimator)),
      planner_(std::move(planner)),
      scheduler_(std::move(scheduler)) {
    if (!store_ || !estimator_) throw std::invalid_argument("SyncEngine requires a store and an estimator");
}

std::string SyncEngine::enqueue(const fs::path& sourcePath, Metadata metadata, const int priority,
                                std::optional<std::string> resourceId) {
    std::error_code ec;
    const auto path = fs::absolute(sourcePath, ec);
    if (ec) throw std::invalid_argument("Cannot resolve source path " + sourcePath.string() + ": " + ec.message());

    const auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) throw std::invalid_argument("Source file not found: " + path.string());
    if (!fs::is_regular_file(st)) throw std::invalid_argument("Source is not a regular file: " + path.string());

    const auto size = fs::file_size(path, ec);
    if (ec) throw std::invalid_argument("Cannot stat source " + path.string() + ": " + ec.message());
    if (size == 0) throw std::invalid_argument("Source file is empty: " + path.string());

    const auto mbps = estimator_->currentEstimateMbps();
    const auto plan = planner_.plan(size, mbps);

    SyncJob job;
    job.job_id = IdGenerator({.prefix = "JOB"}).generate();

    if (resourceId && !resourceId->empty()) job.resource_id = *resourceId;
    else if (const auto it = metadata.find("resource_id"); it != metadata.end() && !it->second.empty()) job.resource_id = it->second;
    else if (const auto it = metadata.find("slide_id"); it != metadata.end() && !it->second.empty()) job.resource_id = it->second;
    else job.resource_id = IdGenerator({.prefix = "RES"}).generate();

    job.source_path = path;
    job.file_size = size;
    job.chunk_size = plan.chunk_size;
    job.chunk_count = plan.chunk_count;
    job.chunks_done = boost::dynamic_bitset<>(plan.chunk_count);
    job.status = Status::QUEUED;
    job.priority = priority;
    job.metadata = std::move(metadata);
    job.created_at = std::chrono::system_clock::now();
    job.updated_at = job.created_at;

    store_->save(job);

    LogRegistry::sync()->info("[SyncEngine] Queued {} as job {} (resource {}, {} bytes, {} x {} byte chunks at {:.2f} Mbps, priority {})",
                              path.string(), job.job_id, job.resource_id, size, job.chunk_count, job.chunk_size, mbps, priority);

    if (scheduler_) scheduler_->wake();
    return job.job_id;
}

EngineStatus SyncEngine::status() const {
    return {estimator_->isOnline(), estimator_->currentEstimateMbps(), store_->summary()};
}

std::optional<SyncJob> SyncEngine::getJob(const std::string& jobId) const {
    return store_->get(jobId);
}

SyncScheduler& SyncEngine::requireScheduler() const {
    if (!scheduler_) throw std::logic_error("This engine has no scheduler");
    return *scheduler_;
}

void SyncEngine::cancel(const std::string& jobId) {
    requireScheduler().requestCancel(jobId);
}

void SyncEngine::requeue(const std::string& jobId) {
    requireScheduler().requestRequeue(jobId);
}

void SyncEngine::start() {
    requireScheduler().start();
}

void SyncEngine::stop() {
    if (scheduler_) scheduler_->stop();
}
