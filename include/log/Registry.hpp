#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>

namespace mpc::log {

// Logging context for a single run. Loggers are owned here rather than in the
// spdlog global registry so independent runs do not collide.
class Registry {
public:
    struct Options {
        bool console = true;
        std::optional<std::filesystem::path> logFile;
    };

    explicit Registry(const config::LoggingConfig& cnf, const Options& options);

    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Generic access by name
    [[nodiscard]] std::shared_ptr<spdlog::logger> get(const std::string& name) const;

    // Subsystem shorthands
    [[nodiscard]] std::shared_ptr<spdlog::logger> mpcopy()   const { return get("mpcopy"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> fs()       const { return get("fs"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> queue()    const { return get("queue"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> dispatch() const { return get("dispatch"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> copy()     const { return get("copy"); }

    [[nodiscard]] const std::optional<std::filesystem::path>& logFile() const { return logFile_; }

    void flush() const;

    // Console-less, file-less context for unit tests and embedding.
    static std::shared_ptr<Registry> silent();

    static std::filesystem::path runLogPath(const std::filesystem::path& logDir, const std::string& runId);

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    std::optional<std::filesystem::path> logFile_;
    std::vector<spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
};

}
