#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace es::config {

constexpr static uint64_t MiB = 1024 * 1024;

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum edgesync = spdlog::level::info;   // Startup/shutdown, composition root
    spdlog::level::level_enum sync     = spdlog::level::info;   // Scheduler state transitions
    spdlog::level::level_enum transfer = spdlog::level::info;   // Chunk uploads, initiate/complete
    spdlog::level::level_enum store    = spdlog::level::warn;   // Job store I/O failures, corrupt records
    spdlog::level::level_enum net      = spdlog::level::info;   // Probes, online/offline flips
    spdlog::level::level_enum db       = spdlog::level::err;    // Only if the database is unreachable
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/edgesync";
    LogLevelsConfig levels;
};

struct RemoteConfig {
    std::string base_url = "http://localhost:8000";
    std::filesystem::path auth_token_file{};
    std::string checksum_algorithm = "md5";
    std::chrono::seconds connect_timeout{15};
    std::chrono::seconds initiate_timeout{30};
    std::chrono::seconds chunk_timeout{120};
    std::chrono::seconds complete_timeout{60};
    std::string probe_path = "/sync/probe";
};

struct PostgresConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "edgesync";
    std::string user = "edgesync";
    std::filesystem::path password_file = "/etc/edgesync/db_password";
    unsigned int pool_size = 2;
};

struct JobStoreConfig {
    enum class Backend { File, Postgres };

    Backend backend = Backend::File;
    std::filesystem::path path = "/var/lib/edgesync/jobs";
    PostgresConfig postgres;
};

struct BandwidthConfig {
    double default_mbps = 5.0;
    uint32_t probe_payload_bytes = 64 * 1024;
    std::chrono::seconds probe_timeout{10};
    std::chrono::seconds measure_interval{300};
    std::chrono::seconds offline_probe_interval{30};
    std::filesystem::path state_file = "/var/lib/edgesync/bandwidth.json";
};

struct ChunkingConfig {
    double slow_link_mbps = 2.0;
    double fast_link_mbps = 10.0;
    uint64_t small_chunk_bytes = 5 * MiB;
    uint64_t medium_chunk_bytes = 25 * MiB;
    uint64_t large_chunk_bytes = 100 * MiB;
};

struct BackoffConfig {
    std::vector<std::chrono::seconds> schedule = {
        std::chrono::seconds(5), std::chrono::seconds(10), std::chrono::seconds(30),
        std::chrono::seconds(60), std::chrono::seconds(300), std::chrono::seconds(600)
    };
    std::chrono::seconds cap{600};
    double jitter_ratio = 0.2;
};

struct SchedulerConfig {
    std::chrono::seconds idle_poll{10};
    std::chrono::seconds offline_poll{10};
    std::chrono::seconds storage_retry_delay{30};
    unsigned int max_retries = 20;
    unsigned int integrity_retry_weight = 2;
    unsigned int checksum_retries = 1;
    BackoffConfig backoff;
};

struct Config {
    LoggingConfig logging;
    RemoteConfig remote;
    JobStoreConfig job_store;
    BandwidthConfig bandwidth;
    ChunkingConfig chunking;
    SchedulerConfig scheduler;
};

Config loadConfig(const std::filesystem::path& path);

std::string to_string(JobStoreConfig::Backend backend);

} // namespace es::config
