#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace es::services {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    virtual void stop();

    virtual void restart();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    // Cuts the current sleep short without stopping the service.
    void wake();

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    [[nodiscard]] bool stopRequested() const { return interruptFlag_.load(); }

    // Returns false when woken by stop(), true otherwise.
    bool sleepFor(std::chrono::milliseconds duration);

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
    bool wakePending_{false};
};

}
