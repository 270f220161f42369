#include "store/JobStore.hpp"
#include "store/FileJobStore.hpp"
#include "store/PgJobStore.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

using namespace es::store;
using namespace es::config;
using namespace es::logging;

std::unique_ptr<JobStore> es::store::makeJobStore(const JobStoreConfig& cfg) {
    LogRegistry::store()->info("[JobStore] Opening {} job store", to_string(cfg.backend));

    switch (cfg.backend) {
        case JobStoreConfig::Backend::File: return std::make_unique<FileJobStore>(cfg.path);
        case JobStoreConfig::Backend::Postgres: return std::make_unique<PgJobStore>(cfg.postgres);
    }

    throw std::invalid_argument("Unknown job store backend");
}
