#include "services/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace es::services;
using namespace es::logging;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    // Derived parts are already gone here; subclasses must stop() in their own dtor.
    if (worker_.joinable()) {
        interruptFlag_.store(true);
        sleepCv_.notify_all();
        if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
        else worker_.detach();
    }
}

void AsyncService::start() {
    if (isRunning()) return;

    // A loop that exited on its own leaves a joinable thread behind
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::edgesync()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    LogRegistry::edgesync()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    LogRegistry::edgesync()->info("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true);
    }
    sleepCv_.notify_all();

    // Only join if we're not calling stop() from the same thread
    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false);
    interruptFlag_.store(false);

    LogRegistry::edgesync()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    LogRegistry::edgesync()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

void AsyncService::wake() {
    {
        std::scoped_lock lock(sleepMutex_);
        wakePending_ = true;
    }
    sleepCv_.notify_all();
}

bool AsyncService::sleepFor(const std::chrono::milliseconds duration) {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, duration, [this] { return interruptFlag_.load() || wakePending_; });
    wakePending_ = false;
    return !interruptFlag_.load();
}
