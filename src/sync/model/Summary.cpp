#include "sync/model/Summary.hpp"

#include <nlohmann/json.hpp>

using namespace es::sync::model;

void QueueSummary::add(const SyncJob& job) {
    auto& t = by_status[job.status];
    ++t.jobs;
    t.bytes += job.file_size;
}

StatusTotals QueueSummary::totals(const Status s) const {
    const auto it = by_status.find(s);
    return it == by_status.end() ? StatusTotals{} : it->second;
}

uint64_t QueueSummary::totalJobs() const {
    uint64_t n = 0;
    for (const auto& [_, t] : by_status) n += t.jobs;
    return n;
}

void es::sync::model::to_json(nlohmann::json& j, const StatusTotals& t) {
    j = {
        {"jobs", t.jobs},
        {"bytes", t.bytes}
    };
}

void es::sync::model::to_json(nlohmann::json& j, const QueueSummary& s) {
    j = nlohmann::json::object();
    for (const auto st : {Status::QUEUED, Status::TRANSFERRING, Status::PAUSED, Status::COMPLETED, Status::FAILED})
        j[std::string(SyncJob::toString(st))] = s.totals(st);
}
