#include "sync/model/Job.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace es::sync::model;
using namespace es::util;

std::vector<uint64_t> SyncJob::doneChunks() const {
    std::vector<uint64_t> out;
    out.reserve(chunks_done.count());
    for (auto i = chunks_done.find_first(); i != boost::dynamic_bitset<>::npos; i = chunks_done.find_next(i))
        out.push_back(i);
    return out;
}

std::vector<uint64_t> SyncJob::missingChunks() const {
    std::vector<uint64_t> out;
    for (uint64_t i = 0; i < chunk_count; ++i)
        if (!isChunkDone(i)) out.push_back(i);
    return out;
}

bool SyncJob::isChunkDone(const uint64_t index) const {
    return index < chunks_done.size() && chunks_done.test(index);
}

void SyncJob::markChunkDone(const uint64_t index) {
    if (index >= chunk_count)
        throw std::out_of_range("chunk index " + std::to_string(index) + " >= chunk_count " + std::to_string(chunk_count));
    if (chunks_done.size() != chunk_count) chunks_done.resize(chunk_count);
    chunks_done.set(index);
}

void SyncJob::resetTransfer() {
    remote_transfer_id.reset();
    chunks_done.reset();
}

uint64_t SyncJob::chunkOffset(const uint64_t index) const {
    return index * chunk_size;
}

uint64_t SyncJob::chunkLength(const uint64_t index) const {
    const auto offset = chunkOffset(index);
    if (offset >= file_size) return 0;
    return std::min(chunk_size, file_size - offset);
}

bool SyncJob::isEligible(const TimePoint now) const {
    switch (status) {
        case Status::QUEUED: return true;
        case Status::PAUSED: return !cancelled && (!next_attempt_at || *next_attempt_at <= now);
        default: return false;
    }
}

void SyncJob::touch() {
    updated_at = std::chrono::system_clock::now();
}

std::string_view SyncJob::toString(const Status s) {
    switch (s) {
        case Status::QUEUED: return "queued";
        case Status::TRANSFERRING: return "transferring";
        case Status::PAUSED: return "paused";
        case Status::COMPLETED: return "completed";
        case Status::FAILED: return "failed";
        default: return "unknown";
    }
}

bool SyncJob::tryParseStatus(const std::string_view str, Status& out) {
    if (str == "queued") out = Status::QUEUED;
    else if (str == "transferring") out = Status::TRANSFERRING;
    else if (str == "paused") out = Status::PAUSED;
    else if (str == "completed") out = Status::COMPLETED;
    else if (str == "failed") out = Status::FAILED;
    else return false;
    return true;
}

bool es::sync::model::schedulesBefore(const SyncJob& a, const SyncJob& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.job_id < b.job_id;
}

void es::sync::model::to_json(nlohmann::json& j, const SyncJob& job) {
    j = {
        {"job_id", job.job_id},
        {"resource_id", job.resource_id},
        {"source_path", job.source_path.string()},
        {"file_size", job.file_size},
        {"chunk_size", job.chunk_size},
        {"chunk_count", job.chunk_count},
        {"chunks_done", job.doneChunks()},
        {"status", SyncJob::toString(job.status)},
        {"priority", job.priority},
        {"created_at", toEpochMillis(job.created_at)},
        {"updated_at", toEpochMillis(job.updated_at)},
        {"retry_count", job.retry_count},
        {"error_message", job.last_error ? nlohmann::json(*job.last_error) : nlohmann::json(nullptr)},
        {"remote_transfer_id", job.remote_transfer_id ? nlohmann::json(*job.remote_transfer_id) : nlohmann::json(nullptr)},
        {"metadata", job.metadata},
        {"next_attempt_at", job.next_attempt_at ? nlohmann::json(toEpochMillis(*job.next_attempt_at)) : nlohmann::json(nullptr)},
        {"cancelled", job.cancelled}
    };
}

void es::sync::model::from_json(const nlohmann::json& j, SyncJob& job) {
    j.at("job_id").get_to(job.job_id);
    j.at("resource_id").get_to(job.resource_id);
    job.source_path = j.at("source_path").get<std::string>();
    j.at("file_size").get_to(job.file_size);
    j.at("chunk_size").get_to(job.chunk_size);
    j.at("chunk_count").get_to(job.chunk_count);

    if (job.job_id.empty()) throw std::invalid_argument("job record has an empty job_id");
    if (job.chunk_size == 0 || job.chunk_count == 0)
        throw std::invalid_argument("job " + job.job_id + " has no chunk plan");
    if ((job.chunk_count - 1) * job.chunk_size >= job.file_size || job.file_size > job.chunk_count * job.chunk_size)
        throw std::invalid_argument("job " + job.job_id + " has an inconsistent chunk plan");

    job.chunks_done = boost::dynamic_bitset<>(job.chunk_count);
    for (const auto& idx : j.at("chunks_done")) {
        const auto i = idx.get<uint64_t>();
        if (i >= job.chunk_count)
            throw std::invalid_argument("job " + job.job_id + " records chunk " + std::to_string(i) + " outside its plan");
        job.chunks_done.set(i);
    }

    if (!SyncJob::tryParseStatus(j.at("status").get<std::string>(), job.status))
        throw std::invalid_argument("job " + job.job_id + " has unknown status " + j.at("status").dump());

    j.at("priority").get_to(job.priority);
    job.created_at = fromEpochMillis(j.at("created_at").get<int64_t>());
    job.updated_at = fromEpochMillis(j.at("updated_at").get<int64_t>());
    job.retry_count = j.value("retry_count", 0u);

    const auto err = j.find("error_message");
    if (err != j.end() && !err->is_null()) job.last_error = err->get<std::string>();
    else job.last_error.reset();

    const auto tid = j.find("remote_transfer_id");
    if (tid != j.end() && !tid->is_null()) job.remote_transfer_id = tid->get<std::string>();
    else job.remote_transfer_id.reset();

    job.metadata = j.value("metadata", Metadata{});

    const auto next = j.find("next_attempt_at");
    if (next != j.end() && !next->is_null()) job.next_attempt_at = fromEpochMillis(next->get<int64_t>());
    else job.next_attempt_at.reset();

    job.cancelled = j.value("cancelled", false);
}
