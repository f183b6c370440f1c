#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>

namespace mpc::log {

Registry::Registry(const config::LoggingConfig& cnf, const Options& options) : logFile_(options.logFile) {
    if (options.console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(cnf.levels.console_log_level);
        console->set_color_mode(spdlog::color_mode::automatic);
        console->set_pattern(LOG_FORMAT);
        sinks_.push_back(std::move(console));
    }

    if (logFile_) {
        namespace fs = std::filesystem;
        if (logFile_->has_parent_path() && !fs::exists(logFile_->parent_path()))
            fs::create_directories(logFile_->parent_path());

        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile_->string(), /*truncate=*/false);
        file->set_level(cnf.levels.file_log_level);
        file->set_pattern(LOG_FORMAT);
        sinks_.push_back(std::move(file));
    }

    if (sinks_.empty()) sinks_.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());

    const auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        auto logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        loggers_.emplace(name, std::move(logger));
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("mpcopy",   sub_levels.mpcopy);
    makeLogger("fs",       sub_levels.fs);
    makeLogger("queue",    sub_levels.queue);
    makeLogger("dispatch", sub_levels.dispatch);
    makeLogger("copy",     sub_levels.copy);
}

Registry::~Registry() { flush(); }

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) const {
    const auto it = loggers_.find(name);
    if (it == loggers_.end()) throw std::runtime_error("[Registry] Logger not found: " + name);
    return it->second;
}

void Registry::flush() const {
    for (const auto& [_, logger] : loggers_) logger->flush();
}

std::shared_ptr<Registry> Registry::silent() {
    config::LoggingConfig cnf;
    cnf.levels.console_log_level = spdlog::level::off;
    return std::make_shared<Registry>(cnf, Options{.console = false, .logFile = std::nullopt});
}

std::filesystem::path Registry::runLogPath(const std::filesystem::path& logDir, const std::string& runId) {
    return logDir / ("mpcopy-" + util::getCurrentTimestamp() + "-" + runId.substr(0, 8) + ".log");
}

}
