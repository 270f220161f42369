#pragma once

#include "sync/ChunkPlanner.hpp"
#include "sync/model/Job.hpp"
#include "sync/model/Summary.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace es::store { class JobStore; }

namespace es::sync {

class BandwidthEstimator;
class SyncScheduler;

struct EngineStatus {
    bool online{false};
    double bandwidth_mbps{};
    model::QueueSummary queue{};
};

void to_json(nlohmann::json& j, const EngineStatus& s);

// Caller-facing surface. Everything it needs is injected; scheduler may be
// null for one-shot processes that only enqueue or inspect.
class SyncEngine {
public:
    SyncEngine(std::shared_ptr<store::JobStore> store,
               std::shared_ptr<BandwidthEstimator> estimator,
               ChunkPlanner planner,
               std::shared_ptr<SyncScheduler> scheduler = nullptr);

    // Plans chunks from the current estimate and persists a QUEUED job.
    // resourceId defaults to metadata "resource_id", then "slide_id", then a fresh id.
    std::string enqueue(const std::filesystem::path& sourcePath,
                        model::Metadata metadata,
                        int priority = model::SyncJob::DEFAULT_PRIORITY,
                        std::optional<std::string> resourceId = std::nullopt);

    [[nodiscard]] EngineStatus status() const;

    [[nodiscard]] std::optional<model::SyncJob> getJob(const std::string& jobId) const;

    void cancel(const std::string& jobId);
    void requeue(const std::string& jobId);

    void start();
    void stop();

private:
    std::shared_ptr<store::JobStore> store_;
    std::shared_ptr<BandwidthEstimator> estimator_;
    ChunkPlanner planner_;
    std::shared_ptr<SyncScheduler> scheduler_;

    SyncScheduler& requireScheduler() const;
};

}
