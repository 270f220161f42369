#pragma once

#include "config/Config.hpp"
#include "sync/model/Job.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace es::remote { class Endpoint; }

namespace es::sync {

// Single writer (the scheduler loop), any number of readers.
class BandwidthEstimator {
public:
    BandwidthEstimator(std::shared_ptr<remote::Endpoint> endpoint, config::BandwidthConfig cfg);

    [[nodiscard]] double currentEstimateMbps() const { return estimateMbps_.load(); }
    [[nodiscard]] bool isOnline() const { return online_.load(); }

    // Round-trip probe. Returns the online flag afterwards; a call that
    // overlaps a running probe returns the current flag without probing.
    bool measure();

    void markOffline();

    [[nodiscard]] bool isMeasurementDue(model::TimePoint now) const;

    [[nodiscard]] std::optional<model::TimePoint> lastProbeAt() const;

private:
    std::shared_ptr<remote::Endpoint> endpoint_;
    config::BandwidthConfig cfg_;

    std::atomic<double> estimateMbps_;
    std::atomic<bool> online_{false};
    std::atomic<int64_t> lastProbeMs_{-1};
    std::mutex probeMutex_;

    void loadState();
    void saveState(double mbps) const;
};

}
