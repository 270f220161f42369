#pragma once

#include "store/JobStore.hpp"

#include <filesystem>
#include <mutex>
#include <map>
#include <string>
#include <unordered_map>

namespace es::store {

// One "<job_id>.json" per job under a directory. Records written by other
// processes are only ever new inserts; they are picked up on the next read.
class FileJobStore final : public JobStore {
public:
    explicit FileJobStore(std::filesystem::path dir);
    ~FileJobStore() override;

    FileJobStore(const FileJobStore&) = delete;
    FileJobStore& operator=(const FileJobStore&) = delete;

    void save(const sync::model::SyncJob& job) override;

    [[nodiscard]] std::optional<sync::model::SyncJob> get(const std::string& jobId) override;
    [[nodiscard]] std::optional<sync::model::SyncJob> nextEligibleJob(sync::model::TimePoint now) override;
    [[nodiscard]] std::vector<sync::model::SyncJob> listByStatus(sync::model::Status status) override;
    [[nodiscard]] sync::model::QueueSummary summary() override;

    unsigned int recoverInterrupted() override;

    [[nodiscard]] bool acquireWorkerLease() override;

    [[nodiscard]] const std::filesystem::path& directory() const { return dir_; }

    static constexpr auto RECORD_EXTENSION = ".json";
    static constexpr auto LEASE_FILE = ".worker.lock";

private:
    std::filesystem::path dir_;
    std::mutex mutex_;
    std::unordered_map<std::string, sync::model::SyncJob> jobs_;
    // Corrupt records by file name, with the mtime they were rejected at.
    // A record is re-read once its file changes.
    std::map<std::string, std::filesystem::file_time_type> rejected_;
    int leaseFd_{-1};

    std::filesystem::path recordPath(const std::string& jobId) const;

    // Requires mutex_. Loads records not yet cached.
    void rescan();
};

}
