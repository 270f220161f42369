#include "store/FileJobStore.hpp"
#include "store/StorageFault.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace es::store;
using namespace es::sync::model;
using namespace es::logging;
namespace fs = std::filesystem;

FileJobStore::FileJobStore(fs::path dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw StorageFault("Failed to create job store directory " + dir_.string() + ": " + ec.message());

    std::scoped_lock lock(mutex_);
    rescan();
    LogRegistry::store()->debug("[FileJobStore] Loaded {} job records from {}", jobs_.size(), dir_.string());
}

FileJobStore::~FileJobStore() {
    if (leaseFd_ >= 0) {
        ::flock(leaseFd_, LOCK_UN);
        ::close(leaseFd_);
    }
}

fs::path FileJobStore::recordPath(const std::string& jobId) const {
    return dir_ / (jobId + RECORD_EXTENSION);
}

void FileJobStore::rescan() {
    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) throw StorageFault("Failed to list job store directory " + dir_.string() + ": " + ec.message());

    for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
        const auto& path = it->path();
        const auto name = path.filename().string();
        if (name.starts_with(".") || path.extension() != RECORD_EXTENSION) continue;

        const auto jobId = path.stem().string();
        if (jobs_.contains(jobId)) continue;

        std::error_code mtimeEc;
        const auto mtime = fs::last_write_time(path, mtimeEc);
        if (const auto r = rejected_.find(name); r != rejected_.end()) {
            if (!mtimeEc && r->second == mtime) continue;
            rejected_.erase(r);
        }

        try {
            auto job = nlohmann::json::parse(util::readFile(path)).get<SyncJob>();
            if (job.job_id != jobId) throw std::invalid_argument("record names job " + job.job_id);
            jobs_.emplace(jobId, std::move(job));
            LogRegistry::store()->debug("[FileJobStore] Loaded job record {}", path.string());
        } catch (const std::system_error& e) {
            // Vanished or unreadable; try again on the next scan
            LogRegistry::store()->warn("[FileJobStore] Failed to read {}: {}", path.string(), e.what());
        } catch (const std::exception& e) {
            LogRegistry::store()->error("[FileJobStore] Skipping corrupt job record {}: {}", path.string(), e.what());
            rejected_.insert_or_assign(name, mtime);
        }
    }

    if (ec) throw StorageFault("Failed to list job store directory " + dir_.string() + ": " + ec.message());
}

void FileJobStore::save(const SyncJob& job) {
    if (job.job_id.empty() || job.job_id.find('/') != std::string::npos || job.job_id.starts_with("."))
        throw std::invalid_argument("Invalid job id for file store: '" + job.job_id + "'");

    const nlohmann::json j = job;

    std::scoped_lock lock(mutex_);
    try {
        util::writeFileAtomic(recordPath(job.job_id), j.dump(2));
    } catch (const std::system_error& e) {
        LogRegistry::store()->error("[FileJobStore] Failed to persist job {}: {}", job.job_id, e.what());
        throw StorageFault("Failed to persist job " + job.job_id + ": " + e.what());
    }
    jobs_.insert_or_assign(job.job_id, job);
}

std::optional<SyncJob> FileJobStore::get(const std::string& jobId) {
    std::scoped_lock lock(mutex_);
    if (!jobs_.contains(jobId)) rescan();
    const auto it = jobs_.find(jobId);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

std::optional<SyncJob> FileJobStore::nextEligibleJob(const TimePoint now) {
    std::scoped_lock lock(mutex_);
    rescan();

    const SyncJob* best = nullptr;
    for (const auto& [_, job] : jobs_) {
        if (!job.isEligible(now)) continue;
        if (!best || schedulesBefore(job, *best)) best = &job;
    }

    if (!best) return std::nullopt;
    return *best;
}

std::vector<SyncJob> FileJobStore::listByStatus(const Status status) {
    std::scoped_lock lock(mutex_);
    rescan();

    std::vector<SyncJob> out;
    for (const auto& [_, job] : jobs_)
        if (job.status == status) out.push_back(job);

    std::ranges::sort(out, schedulesBefore);
    return out;
}

QueueSummary FileJobStore::summary() {
    std::scoped_lock lock(mutex_);
    rescan();

    QueueSummary s;
    for (const auto& [_, job] : jobs_) s.add(job);
    return s;
}

unsigned int FileJobStore::recoverInterrupted() {
    std::vector<SyncJob> interrupted;
    {
        std::scoped_lock lock(mutex_);
        rescan();
        for (const auto& [_, job] : jobs_)
            if (job.status == Status::TRANSFERRING) interrupted.push_back(job);
    }

    for (auto& job : interrupted) {
        job.status = Status::PAUSED;
        job.next_attempt_at.reset();
        job.touch();
        save(job);
        LogRegistry::store()->info("[FileJobStore] Recovered interrupted job {} ({} of {} chunks done)",
                                   job.job_id, job.chunksDoneCount(), job.chunk_count);
    }

    return static_cast<unsigned int>(interrupted.size());
}

bool FileJobStore::acquireWorkerLease() {
    std::scoped_lock lock(mutex_);
    if (leaseFd_ >= 0) return true;

    const auto lockPath = dir_ / LEASE_FILE;
    const int fd = ::open(lockPath.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) throw StorageFault("Failed to open " + lockPath.string() + ": " + std::strerror(errno));

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) return false;
        throw StorageFault("Failed to lock " + lockPath.string() + ": " + std::strerror(err));
    }

    leaseFd_ = fd;
    LogRegistry::store()->debug("[FileJobStore] Acquired worker lease on {}", dir_.string());
    return true;
}
