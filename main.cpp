// Sync
#include "sync/Engine.hpp"
#include "sync/Scheduler.hpp"
#include "sync/BandwidthEstimator.hpp"
#include "sync/TransferClient.hpp"
#include "sync/ChunkPlanner.hpp"

// Store + remote
#include "store/JobStore.hpp"
#include "remote/HttpEndpoint.hpp"

// Misc
#include "config/Config.hpp"
#include "crypto/Hash.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace es;
using namespace es::config;
using namespace es::sync;
using namespace es::logging;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

constexpr auto DEFAULT_CONFIG_PATH = "/etc/edgesync/config.yaml";

void usage(std::ostream& os) {
    os << "usage: edgesyncd [--config PATH] <command>\n"
          "  run                                   run the sync worker until SIGINT/SIGTERM\n"
          "  enqueue <file> [--priority N] [--resource-id ID] [--meta key=value]...\n"
          "  status                                probe the link and print queue totals\n"
          "  job <job_id>                          print one job record\n"
          "  cancel <job_id>                       pause a job until it is re-queued (worker must be stopped)\n"
          "  requeue <job_id>                      make a paused job eligible again (worker must be stopped)\n";
}

struct Components {
    std::shared_ptr<remote::HttpEndpoint> endpoint;
    std::shared_ptr<store::JobStore> store;
    std::shared_ptr<BandwidthEstimator> estimator;
};

Components compose(const Config& cfg) {
    Components c;
    c.endpoint = std::make_shared<remote::HttpEndpoint>(cfg.remote);
    c.store = store::makeJobStore(cfg.job_store);
    c.estimator = std::make_shared<BandwidthEstimator>(c.endpoint, cfg.bandwidth);
    return c;
}

int runDaemon(const Config& cfg) {
    LogRegistry::edgesync()->info("[*] Starting edgesync worker against {}", cfg.remote.base_url);

    auto c = compose(cfg);
    const auto transfer = std::make_shared<TransferClient>(
        c.endpoint, crypto::Hash::parseAlgorithm(cfg.remote.checksum_algorithm), cfg.scheduler.checksum_retries);
    const auto scheduler = std::make_shared<SyncScheduler>(c.store, c.estimator, transfer, cfg.scheduler);

    SyncEngine engine(c.store, c.estimator, ChunkPlanner(cfg.chunking), scheduler);
    engine.start();

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    LogRegistry::edgesync()->info("[✓] edgesync worker running");

    while (!shouldExit && scheduler->isRunning()) std::this_thread::sleep_for(std::chrono::seconds(1));

    LogRegistry::edgesync()->info("[*] Shutting down edgesync worker...");
    engine.stop();
    LogRegistry::edgesync()->info("[✓] edgesync worker shut down cleanly.");
    return shouldExit ? EXIT_SUCCESS : EXIT_FAILURE;
}

int runEnqueue(const Config& cfg, const std::vector<std::string>& args) {
    if (args.empty()) {
        usage(std::cerr);
        return 2;
    }

    const std::filesystem::path file = args[0];
    int priority = model::SyncJob::DEFAULT_PRIORITY;
    std::optional<std::string> resourceId;
    model::Metadata metadata;

    for (size_t i = 1; i < args.size(); ++i) {
        const auto& a = args[i];
        if (i + 1 >= args.size()) {
            std::cerr << "missing value for " << a << "\n";
            return 2;
        }
        const auto& v = args[++i];

        if (a == "--priority") priority = std::stoi(v);
        else if (a == "--resource-id") resourceId = v;
        else if (a == "--meta") {
            const auto eq = v.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "--meta expects key=value, got '" << v << "'\n";
                return 2;
            }
            metadata[v.substr(0, eq)] = v.substr(eq + 1);
        } else {
            std::cerr << "unknown option " << a << "\n";
            return 2;
        }
    }

    const auto c = compose(cfg);
    SyncEngine engine(c.store, c.estimator, ChunkPlanner(cfg.chunking));
    const auto jobId = engine.enqueue(file, std::move(metadata), priority, resourceId);

    fmt::print("{}\n", jobId);
    return EXIT_SUCCESS;
}

int runStatus(const Config& cfg) {
    const auto c = compose(cfg);
    c.estimator->measure();

    const SyncEngine engine(c.store, c.estimator, ChunkPlanner(cfg.chunking));
    const nlohmann::json j = engine.status();
    fmt::print("{}\n", j.dump(2));
    return EXIT_SUCCESS;
}

int runJob(const Config& cfg, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        usage(std::cerr);
        return 2;
    }

    const auto c = compose(cfg);
    const SyncEngine engine(c.store, c.estimator, ChunkPlanner(cfg.chunking));

    const auto job = engine.getJob(args[0]);
    if (!job) {
        std::cerr << "no such job: " << args[0] << "\n";
        return EXIT_FAILURE;
    }

    const nlohmann::json j = *job;
    fmt::print("{}\n", j.dump(2));
    return EXIT_SUCCESS;
}
// Control requests are applied by whoever holds the worker lease. Without a
// running worker this process takes the lease and applies the request itself.
int runControl(const Config& cfg, const std::string& command, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        usage(std::cerr);
        return 2;
    }

    auto c = compose(cfg);
    const auto transfer = std::make_shared<TransferClient>(
        c.endpoint, crypto::Hash::parseAlgorithm(cfg.remote.checksum_algorithm), cfg.scheduler.checksum_retries);
    const auto scheduler = std::make_shared<SyncScheduler>(c.store, c.estimator, transfer, cfg.scheduler);

    if (!c.store->acquireWorkerLease()) {
        std::cerr << "a worker is running against this job store; stop edgesyncd before running '" << command << "'\n";
        return EXIT_FAILURE;
    }
    scheduler->prepare();

    if (!c.store->get(args[0])) {
        std::cerr << "no such job: " << args[0] << "\n";
        return EXIT_FAILURE;
    }

    SyncEngine engine(c.store, c.estimator, ChunkPlanner(cfg.chunking), scheduler);
    if (command == "cancel") engine.cancel(args[0]);
    else engine.requeue(args[0]);
    scheduler->applyPendingRequests();

    const nlohmann::json j = *c.store->get(args[0]);
    fmt::print("{}\n", j.dump(2));
    return EXIT_SUCCESS;
}
}

int main(const int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::filesystem::path configPath = DEFAULT_CONFIG_PATH;

    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        usage(args.empty() ? std::cerr : std::cout);
        return args.empty() ? 2 : EXIT_SUCCESS;
    }

    const auto command = args[0];
    args.erase(args.begin());

    try {
        const auto cfg = loadConfig(configPath);
        LogRegistry::init(cfg.logging);

        if (command == "run") return runDaemon(cfg);
        if (command == "enqueue") return runEnqueue(cfg, args);
        if (command == "status") return runStatus(cfg);
        if (command == "job") return runJob(cfg, args);
        if (command == "cancel" || command == "requeue") return runControl(cfg, command, args);

        usage(std::cerr);
        return 2;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::edgesync()->error("[-] {} failed: {}", command, e.what());
        else std::cerr << "edgesyncd: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
