#pragma once

#include "config/Config.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace es::config;

inline std::chrono::seconds secondsOr(const Node& node, const std::string& key, const std::chrono::seconds def) {
    return std::chrono::seconds(node[key].as<int64_t>(def.count()));
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.edgesync = spdlog::level::from_str(node["edgesync"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("info"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("warn"));
        rhs.net = spdlog::level::from_str(node["net"].as<std::string>("info"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("err"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<RemoteConfig> {
    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_url = node["base_url"].as<std::string>(rhs.base_url);
        rhs.auth_token_file = node["auth_token_file"].as<std::string>("");
        rhs.checksum_algorithm = node["checksum_algorithm"].as<std::string>(rhs.checksum_algorithm);
        rhs.connect_timeout = secondsOr(node, "connect_timeout_seconds", rhs.connect_timeout);
        rhs.initiate_timeout = secondsOr(node, "initiate_timeout_seconds", rhs.initiate_timeout);
        rhs.chunk_timeout = secondsOr(node, "chunk_timeout_seconds", rhs.chunk_timeout);
        rhs.complete_timeout = secondsOr(node, "complete_timeout_seconds", rhs.complete_timeout);
        rhs.probe_path = node["probe_path"].as<std::string>(rhs.probe_path);
        if (rhs.checksum_algorithm != "md5" && rhs.checksum_algorithm != "sha256")
            throw std::runtime_error("remote.checksum_algorithm must be 'md5' or 'sha256'");
        return true;
    }
};

template<>
struct convert<PostgresConfig> {
    static bool decode(const Node& node, PostgresConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>(rhs.host);
        rhs.port = node["port"].as<uint16_t>(rhs.port);
        rhs.name = node["name"].as<std::string>(rhs.name);
        rhs.user = node["user"].as<std::string>(rhs.user);
        rhs.password_file = node["password_file"].as<std::string>(rhs.password_file.string());
        rhs.pool_size = node["pool_size"].as<unsigned int>(rhs.pool_size);
        return true;
    }
};

template<>
struct convert<JobStoreConfig> {
    static bool decode(const Node& node, JobStoreConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto backend = node["backend"].as<std::string>("file");
        if (backend == "file") rhs.backend = JobStoreConfig::Backend::File;
        else if (backend == "postgres") rhs.backend = JobStoreConfig::Backend::Postgres;
        else throw std::runtime_error("Unknown job_store.backend: " + backend);
        rhs.path = node["path"].as<std::string>(rhs.path.string());
        if (node["postgres"]) rhs.postgres = node["postgres"].as<PostgresConfig>();
        return true;
    }
};

template<>
struct convert<BandwidthConfig> {
    static bool decode(const Node& node, BandwidthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_mbps = node["default_mbps"].as<double>(rhs.default_mbps);
        rhs.probe_payload_bytes = node["probe_payload_bytes"].as<uint32_t>(rhs.probe_payload_bytes);
        rhs.probe_timeout = secondsOr(node, "probe_timeout_seconds", rhs.probe_timeout);
        rhs.measure_interval = secondsOr(node, "measure_interval_seconds", rhs.measure_interval);
        rhs.offline_probe_interval = secondsOr(node, "offline_probe_interval_seconds", rhs.offline_probe_interval);
        rhs.state_file = node["state_file"].as<std::string>(rhs.state_file.string());
        return true;
    }
};

template<>
struct convert<ChunkingConfig> {
    static bool decode(const Node& node, ChunkingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.slow_link_mbps = node["slow_link_mbps"].as<double>(rhs.slow_link_mbps);
        rhs.fast_link_mbps = node["fast_link_mbps"].as<double>(rhs.fast_link_mbps);
        rhs.small_chunk_bytes = node["small_chunk_mb"].as<uint64_t>(rhs.small_chunk_bytes / MiB) * MiB;
        rhs.medium_chunk_bytes = node["medium_chunk_mb"].as<uint64_t>(rhs.medium_chunk_bytes / MiB) * MiB;
        rhs.large_chunk_bytes = node["large_chunk_mb"].as<uint64_t>(rhs.large_chunk_bytes / MiB) * MiB;
        if (rhs.small_chunk_bytes == 0 || rhs.medium_chunk_bytes == 0 || rhs.large_chunk_bytes == 0)
            throw std::runtime_error("chunking sizes must be at least 1 MB");
        return true;
    }
};

template<>
struct convert<BackoffConfig> {
    static bool decode(const Node& node, BackoffConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto seq = node["schedule_seconds"]; seq && seq.IsSequence()) {
            rhs.schedule.clear();
            for (const auto& s : seq) rhs.schedule.emplace_back(s.as<int64_t>());
        }
        if (rhs.schedule.empty()) throw std::runtime_error("scheduler.backoff.schedule_seconds must not be empty");
        rhs.cap = secondsOr(node, "cap_seconds", rhs.cap);
        rhs.jitter_ratio = node["jitter_ratio"].as<double>(rhs.jitter_ratio);
        return true;
    }
};

template<>
struct convert<SchedulerConfig> {
    static bool decode(const Node& node, SchedulerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.idle_poll = secondsOr(node, "idle_poll_seconds", rhs.idle_poll);
        rhs.offline_poll = secondsOr(node, "offline_poll_seconds", rhs.offline_poll);
        rhs.storage_retry_delay = secondsOr(node, "storage_retry_delay_seconds", rhs.storage_retry_delay);
        rhs.max_retries = node["max_retries"].as<unsigned int>(rhs.max_retries);
        rhs.integrity_retry_weight = node["integrity_retry_weight"].as<unsigned int>(rhs.integrity_retry_weight);
        rhs.checksum_retries = node["checksum_retries"].as<unsigned int>(rhs.checksum_retries);
        if (node["backoff"]) rhs.backoff = node["backoff"].as<BackoffConfig>();
        return true;
    }
};

}
