#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace es::config {

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Config file not found: " + path.string());

    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["remote"]) YAML::convert<RemoteConfig>::decode(node, cfg.remote);
    if (auto node = root["job_store"]) YAML::convert<JobStoreConfig>::decode(node, cfg.job_store);
    if (auto node = root["bandwidth"]) YAML::convert<BandwidthConfig>::decode(node, cfg.bandwidth);
    if (auto node = root["chunking"]) YAML::convert<ChunkingConfig>::decode(node, cfg.chunking);
    if (auto node = root["scheduler"]) YAML::convert<SchedulerConfig>::decode(node, cfg.scheduler);

    return cfg;
}

std::string to_string(const JobStoreConfig::Backend backend) {
    switch (backend) {
        case JobStoreConfig::Backend::File: return "file";
        case JobStoreConfig::Backend::Postgres: return "postgres";
        default: return "unknown";
    }
}

} // namespace es::config
