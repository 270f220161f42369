#pragma once

#include "sync/model/Job.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json_fwd.hpp>

namespace es::sync::model {

struct StatusTotals {
    uint64_t jobs{};
    uint64_t bytes{};
};

struct QueueSummary {
    std::map<Status, StatusTotals> by_status{};

    void add(const SyncJob& job);

    [[nodiscard]] StatusTotals totals(Status s) const;
    [[nodiscard]] uint64_t totalJobs() const;
};

void to_json(nlohmann::json& j, const StatusTotals& t);
void to_json(nlohmann::json& j, const QueueSummary& s);

}
