#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace es::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> edgesync() { return get("edgesync"); }
    static std::shared_ptr<spdlog::logger> sync()     { return get("sync"); }
    static std::shared_ptr<spdlog::logger> transfer() { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> store()    { return get("store"); }
    static std::shared_ptr<spdlog::logger> net()      { return get("net"); }
    static std::shared_ptr<spdlog::logger> db()       { return get("db"); }

    [[nodiscard]] static bool isInitialized();

private:
    static inline bool initialized_ = false;
};

} // namespace es::logging
