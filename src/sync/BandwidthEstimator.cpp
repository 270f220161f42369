#include "sync/BandwidthEstimator.hpp"
#include "remote/Endpoint.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>

using namespace es::sync;
using namespace es::util;
using namespace es::logging;

BandwidthEstimator::BandwidthEstimator(std::shared_ptr<remote::Endpoint> endpoint, config::BandwidthConfig cfg)
    : endpoint_(std::move(endpoint)), cfg_(std::move(cfg)), estimateMbps_(cfg_.default_mbps) {
    if (!endpoint_) throw std::invalid_argument("BandwidthEstimator requires an endpoint");
    if (cfg_.probe_payload_bytes == 0) throw std::invalid_argument("bandwidth.probe_payload_bytes must be > 0");
    loadState();
}

void BandwidthEstimator::loadState() {
    if (cfg_.state_file.empty() || !std::filesystem::exists(cfg_.state_file)) return;

    try {
        const auto j = nlohmann::json::parse(readFile(cfg_.state_file));
        const auto mbps = j.at("bandwidth_mbps").get<double>();
        if (!std::isfinite(mbps) || mbps <= 0) throw std::invalid_argument("non-positive estimate");
        estimateMbps_.store(mbps);
        LogRegistry::net()->debug("[BandwidthEstimator] Restored estimate {:.2f} Mbps measured at {}", mbps,
                                  timestampToString(fromEpochMillis(j.value("measured_at", int64_t{0}))));
    } catch (const std::exception& e) {
        LogRegistry::net()->warn("[BandwidthEstimator] Ignoring unusable state file {}: {}", cfg_.state_file.string(), e.what());
    }
}

void BandwidthEstimator::saveState(const double mbps) const {
    if (cfg_.state_file.empty()) return;

    const nlohmann::json j = {
        {"bandwidth_mbps", mbps},
        {"measured_at", toEpochMillis(Clock::now())}
    };

    try {
        if (const auto dir = cfg_.state_file.parent_path(); !dir.empty()) std::filesystem::create_directories(dir);
        writeFileAtomic(cfg_.state_file, j.dump());
    } catch (const std::exception& e) {
        LogRegistry::net()->warn("[BandwidthEstimator] Failed to persist estimate to {}: {}", cfg_.state_file.string(), e.what());
    }
}

bool BandwidthEstimator::measure() {
    std::unique_lock lock(probeMutex_, std::try_to_lock);
    if (!lock.owns_lock()) return online_.load();

    const auto result = endpoint_->probe(cfg_.probe_payload_bytes, cfg_.probe_timeout);
    lastProbeMs_.store(toEpochMillis(Clock::now()));

    if (!result.ok) {
        if (online_.exchange(false))
            LogRegistry::net()->warn("[BandwidthEstimator] Link went offline: {}", result.message);
        else
            LogRegistry::net()->debug("[BandwidthEstimator] Still offline: {}", result.message);
        return false;
    }

    const double seconds = std::max(result.elapsed.count(), 1e-3);
    const double mbps = static_cast<double>(result.bytes) * 8.0 / (seconds * 1e6);
    estimateMbps_.store(mbps);
    saveState(mbps);

    if (!online_.exchange(true))
        LogRegistry::net()->info("[BandwidthEstimator] Link online at {:.2f} Mbps", mbps);
    else
        LogRegistry::net()->debug("[BandwidthEstimator] Measured {:.2f} Mbps", mbps);
    return true;
}

void BandwidthEstimator::markOffline() {
    if (online_.exchange(false))
        LogRegistry::net()->warn("[BandwidthEstimator] Marked offline after a transfer fault");
}

bool BandwidthEstimator::isMeasurementDue(const model::TimePoint now) const {
    const auto last = lastProbeMs_.load();
    if (last < 0) return true;

    const auto interval = online_.load() ? cfg_.measure_interval : cfg_.offline_probe_interval;
    return now - fromEpochMillis(last) >= interval;
}

std::optional<es::sync::model::TimePoint> BandwidthEstimator::lastProbeAt() const {
    const auto last = lastProbeMs_.load();
    if (last < 0) return std::nullopt;
    return fromEpochMillis(last);
}
